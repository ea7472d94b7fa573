#include "PatchClient.hpp"

#include "HttpMessage.hpp"
#include "JsonLib.hpp"
#include "WebSocketCodec.hpp"
#include "httplib.h"

namespace lp {
PatchClient::PatchClient(shared_ptr<SocketHandler> _socketHandler,
                         const SocketEndpoint& _serverEndpoint,
                         shared_ptr<Document> _document,
                         const string& _sessionId)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      document(_document),
      sessionId(_sessionId),
      socketFd(-1),
      pongCount(0) {
  reconciler = make_shared<ClientReconciler>(
      document, [this](const string& targetId) { reportInvalid(targetId); });
  httpClient.reset(
      new httplib::Client(serverEndpoint.name(), serverEndpoint.port()));
  httpClient->set_connection_timeout(3, 0);
  httpClient->set_read_timeout(5, 0);
  httpClient->set_write_timeout(5, 0);
}

PatchClient::~PatchClient() { closeSocket(); }

bool PatchClient::openSocket() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (socketFd >= 0) {
    return true;
  }
  int fd = socketHandler->connect(serverEndpoint);
  if (fd < 0) {
    VLOG(1) << "Could not reach " << serverEndpoint;
    return false;
  }

  string key;
  Base64::Encode(genRandomAlphaNum(16), &key);
  stringstream ss;
  ss << "GET " << WEBSOCKET_PATH << " HTTP/1.1\r\n"
     << "Host: " << serverEndpoint.name() << ":" << serverEndpoint.port()
     << "\r\n"
     << "Upgrade: websocket\r\n"
     << "Connection: Upgrade\r\n"
     << "Sec-WebSocket-Key: " << key << "\r\n"
     << "Sec-WebSocket-Version: 13\r\n";
  if (!sessionId.empty()) {
    ss << "Cookie: " << cookieHeader() << "\r\n";
  }
  ss << "\r\n";
  string request = ss.str();

  try {
    socketHandler->writeAllOrThrow(fd, request.data(), request.length(),
                                   true);
    string leftover;
    string head = HttpMessage::readHead(socketHandler.get(), fd, &leftover);
    HttpResponse response = HttpMessage::parseResponseHead(head);
    if (response.status != 101) {
      LOG(WARNING) << "Server refused the upgrade with " << response.status;
      socketHandler->close(fd);
      return false;
    }
    if (response.header("sec-websocket-accept") !=
        WebSocketCodec::acceptToken(key)) {
      LOG(WARNING) << "Server sent a bad accept token";
      socketHandler->close(fd);
      return false;
    }
    adoptSessionCookie(response.header("set-cookie"));
    buffer = leftover;
  } catch (const HttpParseException& pe) {
    LOG(WARNING) << "Bad handshake response: " << pe.what();
    socketHandler->close(fd);
    return false;
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Handshake failed: " << re.what();
    socketHandler->close(fd);
    return false;
  }

  socketFd = fd;
  LOG(INFO) << "Socket open for session " << sessionId;
  processBuffer();
  return true;
}

void PatchClient::closeSocket() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (socketFd < 0) {
    return;
  }
  string frame = WebSocketCodec::encodeMaskedFrame(WS_OPCODE_CLOSE, "");
  socketHandler->writeAllOrReturn(socketFd, frame.data(), frame.length());
  socketHandler->close(socketFd);
  socketFd = -1;
  buffer.clear();
}

bool PatchClient::isConnected() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  return socketFd >= 0;
}

bool PatchClient::poll() {
  httplib::Headers headers;
  string cookie = cookieHeader();
  if (!cookie.empty()) {
    headers.emplace("Cookie", cookie);
  }
  headers.emplace("Accept", "application/json");
  auto res = httpClient->Get(POLL_PATH.c_str(), headers);
  if (!res || res->status != 200) {
    VLOG(1) << "Poll failed";
    return false;
  }
  adoptSessionCookie(res->get_header_value("Set-Cookie"));
  reconciler->handlePollResponse(res->body);
  return true;
}

void PatchClient::reportInvalid(const string& targetId) {
  httplib::Headers headers;
  string cookie = cookieHeader();
  if (!cookie.empty()) {
    headers.emplace("Cookie", cookie);
  }
  json body = {{"id", targetId}};
  auto res = httpClient->Post(INVALID_TARGET_PATH.c_str(), headers,
                              body.dump(), "application/json");
  if (!res) {
    VLOG(1) << "Could not report missing target #" << targetId;
  }
}

int PatchClient::pump(std::chrono::milliseconds timeout) {
  int fd;
  {
    lock_guard<std::recursive_mutex> guard(clientMutex);
    fd = socketFd;
  }
  if (fd < 0) {
    std::this_thread::sleep_for(timeout);
    return 0;
  }

  fd_set rfds;
  FD_ZERO(&rfds);
  FD_SET(fd, &rfds);
  timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;
  int rc = select(fd + 1, &rfds, NULL, NULL, &tv);
  if (rc <= 0) {
    return 0;
  }

  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (socketFd != fd) {
    return 0;
  }
  char chunk[16 * 1024];
  ssize_t bytesRead = socketHandler->read(fd, chunk, sizeof(chunk));
  if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    return 0;
  }
  if (bytesRead <= 0) {
    LOG(INFO) << "Server closed the socket";
    handleDisconnect();
    return 0;
  }
  buffer.append(chunk, bytesRead);
  return processBuffer();
}

int PatchClient::processBuffer() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  int handled = 0;
  while (socketFd >= 0) {
    size_t consumed = 0;
    optional<WebSocketFrame> frame;
    try {
      frame = WebSocketCodec::decodeFrame(buffer, &consumed);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Dropping socket: " << re.what();
      handleDisconnect();
      break;
    }
    if (!frame) {
      break;
    }
    buffer.erase(0, consumed);
    switch (frame->opcode) {
      case WS_OPCODE_TEXT:
        reconciler->handleMessage(frame->payload);
        handled++;
        break;
      case WS_OPCODE_PING: {
        string pong =
            WebSocketCodec::encodeMaskedFrame(WS_OPCODE_PONG, frame->payload);
        socketHandler->writeAllOrReturn(socketFd, pong.data(), pong.length());
        break;
      }
      case WS_OPCODE_PONG:
        pongCount++;
        break;
      case WS_OPCODE_CLOSE:
        LOG(INFO) << "Server closed the socket";
        handleDisconnect();
        break;
      default:
        VLOG(2) << "Ignoring frame with opcode " << int(frame->opcode);
        break;
    }
  }
  return handled;
}

bool PatchClient::sendPing(const string& payload) {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (socketFd < 0) {
    return false;
  }
  string frame = WebSocketCodec::encodeMaskedFrame(WS_OPCODE_PING, payload);
  return socketHandler->writeAllOrReturn(socketFd, frame.data(),
                                         frame.length()) >= 0;
}

void PatchClient::handleDisconnect() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
  buffer.clear();
  perform(reconciler->onDisconnect(std::chrono::steady_clock::now()));
}

void PatchClient::run(const atomic<bool>& halt) {
  perform(reconciler->start(std::chrono::steady_clock::now()));
  while (!halt) {
    pump(std::chrono::milliseconds(100));
    perform(reconciler->tick(std::chrono::steady_clock::now()));
  }
  closeSocket();
}

void PatchClient::perform(const vector<ReconcilerAction>& actions) {
  for (auto action : actions) {
    switch (action) {
      case ReconcilerAction::OPEN_SOCKET:
        if (openSocket()) {
          perform(reconciler->onOpen(std::chrono::steady_clock::now()));
        } else {
          perform(reconciler->onDisconnect(std::chrono::steady_clock::now()));
        }
        break;
      case ReconcilerAction::POLL:
        poll();
        break;
    }
  }
}

string PatchClient::getSessionId() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  return sessionId;
}

void PatchClient::adoptSessionCookie(const string& setCookie) {
  if (setCookie.empty()) {
    return;
  }
  auto cookies = HttpMessage::parseCookies(split(setCookie, ';')[0]);
  auto it = cookies.find(SESSION_COOKIE_NAME);
  if (it == cookies.end() || it->second.empty()) {
    return;
  }
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (sessionId != it->second) {
    sessionId = it->second;
    VLOG(1) << "Adopted session " << sessionId;
  }
}

string PatchClient::cookieHeader() {
  lock_guard<std::recursive_mutex> guard(clientMutex);
  if (sessionId.empty()) {
    return "";
  }
  return SESSION_COOKIE_NAME + "=" + sessionId;
}
}  // namespace lp
