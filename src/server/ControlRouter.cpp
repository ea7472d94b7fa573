#include "ControlRouter.hpp"

namespace lp {
ControlRouter::ControlRouter(shared_ptr<PipeSocketHandler> _socketHandler,
                             const SocketEndpoint& _routerEndpoint,
                             shared_ptr<PatchDispatcher> _dispatcher)
    : routerEndpoint(_routerEndpoint),
      socketHandler(_socketHandler),
      dispatcher(_dispatcher) {
  serverFd = *(socketHandler->listen(routerEndpoint).begin());
  LOG(INFO) << "Control channel listening on " << routerEndpoint;
}

ControlRouter::~ControlRouter() {
  socketHandler->stopListening(routerEndpoint);
}

bool ControlRouter::acceptNewConnection() {
  int peerFd = acceptPeer();
  if (peerFd < 0) {
    return false;
  }
  return servePeer(peerFd);
}

int ControlRouter::acceptPeer() {
  lock_guard<recursive_mutex> guard(routerMutex);
  const int peerFd = socketHandler->accept(serverFd);
  if (peerFd < 0) {
    // Nothing to accept this time
    return -1;
  }
  VLOG(1) << "Control peer connected on fd " << peerFd;
  return peerFd;
}

bool ControlRouter::servePeer(int peerFd) {
  try {
    auto request = socketHandler->readProto<ControlRequest>(peerFd, true);
    auto response = handleRequest(request);
    socketHandler->writeProto(peerFd, response, true);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Control router can't talk to peer: " << re.what();
    socketHandler->close(peerFd);
    return false;
  }
  socketHandler->close(peerFd);
  return true;
}

ControlResponse ControlRouter::handleRequest(const ControlRequest& request) {
  ControlResponse response;
  if (!request.has_type()) {
    response.set_ok(false);
    response.set_error("Missing request type");
    return response;
  }
  switch (request.type()) {
    case CONTROL_RELOAD: {
      int reloaded = dispatcher->broadcastReload();
      LOG(INFO) << "Reload requested over the control channel";
      response.set_ok(true);
      response.set_reloaded_connections(reloaded);
      break;
    }
    case CONTROL_STATS: {
      auto registry = dispatcher->getRegistry();
      auto queue = dispatcher->getQueue();
      response.set_ok(true);
      response.set_sessions(registry->sessionCount());
      response.set_connections(registry->connectionCount());
      response.set_pending_patches(queue->pendingCount());
      response.set_cleanup_callbacks(queue->cleanupCount());
      break;
    }
    default:
      response.set_ok(false);
      response.set_error("Unknown request type " +
                         to_string(int(request.type())));
      break;
  }
  return response;
}

ControlResponse ControlRouter::sendRequest(
    shared_ptr<PipeSocketHandler> socketHandler,
    const SocketEndpoint& routerEndpoint, const ControlRequest& request) {
  int fd = socketHandler->connect(routerEndpoint);
  if (fd < 0) {
    throw std::runtime_error(string("Cannot reach control socket ") +
                             routerEndpoint.name() + ": " +
                             strerror(GetErrno()));
  }
  ControlResponse response;
  try {
    socketHandler->writeProto(fd, request, true);
    response = socketHandler->readProto<ControlResponse>(fd, true);
  } catch (const std::runtime_error&) {
    socketHandler->close(fd);
    throw;
  }
  socketHandler->close(fd);
  return response;
}
}  // namespace lp
