#include "WebSocketConnection.hpp"

namespace lp {
namespace {
atomic<int64_t> nextConnectionId(1);
}

WebSocketConnection::WebSocketConnection(
    shared_ptr<SocketHandler> _socketHandler, int _socketFd,
    const string& _sessionId)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      sessionId(_sessionId),
      id(nextConnectionId++),
      closed(_socketFd < 0),
      released(_socketFd < 0),
      shuttingDown(false) {}

WebSocketConnection::~WebSocketConnection() { releaseSocket(); }

bool WebSocketConnection::send(const string& text) {
  return sendFrame(WS_OPCODE_TEXT, text);
}

bool WebSocketConnection::sendJson(const json& value) {
  return send(value.dump(-1, ' ', false, json::error_handler_t::replace));
}

bool WebSocketConnection::sendFrame(uint8_t opcode, const string& payload) {
  string frame;
  try {
    frame = WebSocketCodec::encodeFrame(opcode, payload);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Dropping connection " << id
                 << " after encode failure: " << e.what();
    markClosed();
    return false;
  }

  lock_guard<std::mutex> sendGuard(sendMutex);
  if (!isOpen()) {
    return false;
  }
  if (socketHandler->writeAllOrReturn(socketFd, frame.data(), frame.length()) <
      0) {
    VLOG(1) << "Write to connection " << id << " (session " << sessionId
            << ") failed";
    markClosed();
    return false;
  }
  VLOG(3) << "Sent " << frame.length() << " bytes to connection " << id;
  return true;
}

void WebSocketConnection::run() {
  el::Helpers::setThreadName(string("ws-") + to_string(id));
  VLOG(1) << "Connection " << id << " for session " << sessionId
          << " is open on fd " << socketFd;
  try {
    while (!shuttingDown && isOpen()) {
      if (!waitOnSocketData(socketFd)) {
        continue;
      }
      WebSocketFrame frame =
          WebSocketCodec::readFrame(socketHandler.get(), socketFd, true);
      switch (frame.opcode) {
        case WS_OPCODE_PING:
          sendFrame(WS_OPCODE_PONG, frame.payload);
          break;
        case WS_OPCODE_CLOSE:
          VLOG(1) << "Connection " << id << " received close";
          // Echo the close before hanging up
          sendFrame(WS_OPCODE_CLOSE, frame.payload.substr(0, 2));
          markClosed();
          break;
        case WS_OPCODE_PONG:
        case WS_OPCODE_TEXT:
        case WS_OPCODE_BINARY:
        default:
          VLOG(3) << "Ignoring frame with opcode " << int(frame.opcode);
          break;
      }
    }
  } catch (const std::runtime_error& e) {
    VLOG(1) << "Connection " << id << " receive loop ended: " << e.what();
  }
  markClosed();
  releaseSocket();
}

void WebSocketConnection::shutdown() {
  shuttingDown = true;
  markClosed();
}

bool WebSocketConnection::isOpen() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return !closed;
}

void WebSocketConnection::markClosed() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (closed) {
    return;
  }
  closed = true;
  if (!released) {
    // Unblocks select()/read() in the receive loop
    ::shutdown(socketFd, SHUT_RDWR);
  }
}

void WebSocketConnection::releaseSocket() {
  lock_guard<std::mutex> sendGuard(sendMutex);
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (released) {
    return;
  }
  closed = true;
  released = true;
  socketHandler->close(socketFd);
  VLOG(1) << "Connection " << id << " closed";
}
}  // namespace lp
