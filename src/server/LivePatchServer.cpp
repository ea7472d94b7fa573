#include "LivePatchServer.hpp"

#include "ClientScript.hpp"
#include "TcpSocketHandler.hpp"

namespace lp {
namespace {
const size_t MAX_SESSION_ID_LENGTH = 128;
}

void RequestContext::patch(const string& targetId, SwapMode swap,
                           const string& html,
                           std::function<void()> cleanup) {
  dispatcher->queuePatch(sessionId, Patch(targetId, swap, html),
                         std::move(cleanup));
}

shared_ptr<Interval> RequestContext::every(std::chrono::milliseconds period,
                                           std::function<void()> fn) {
  return scheduler->every(period, std::move(fn));
}

LivePatchServer::LivePatchServer(shared_ptr<SocketHandler> _socketHandler,
                                 const SocketEndpoint& _serverEndpoint,
                                 shared_ptr<PatchDispatcher> _dispatcher)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      dispatcher(_dispatcher),
      scheduler(make_shared<IntervalScheduler>()),
      clientHandlerThreadPool(new ThreadPool(8)),
      halted(false) {
  socketHandler->listen(serverEndpoint);
}

LivePatchServer::~LivePatchServer() { shutdown(); }

void LivePatchServer::enableControlChannel(
    shared_ptr<PipeSocketHandler> pipeSocketHandler,
    const SocketEndpoint& controlEndpoint) {
  controlRouter = make_shared<ControlRouter>(pipeSocketHandler,
                                             controlEndpoint, dispatcher);
}

void LivePatchServer::registerPage(const string& path, RouteHandler handler) {
  lock_guard<std::recursive_mutex> guard(routeMutex);
  pages[path] = handler;
}

void LivePatchServer::registerAction(const string& path,
                                     RouteHandler handler) {
  lock_guard<std::recursive_mutex> guard(routeMutex);
  actions[path] = handler;
}

void LivePatchServer::run() {
  LOG(INFO) << "Serving on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }
  int controlFd = controlRouter ? controlRouter->getServerFd() : -1;
  if (controlFd >= 0) {
    FD_SET(controlFd, &coreFds);
    maxCoreFd = max(maxCoreFd, controlFd);
  }

  while (!halted) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : serverPortFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
    if (controlFd >= 0 && FD_ISSET(controlFd, &rfds)) {
      acceptControlPeer();
    }
  }

  shutdown();
}

void LivePatchServer::halt() { halted = true; }

bool LivePatchServer::isHalted() { return halted; }

bool LivePatchServer::acceptNewConnection(int fd) {
  reapConnectionThreads();
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  VLOG(1) << "Accepted client socket fd: " << clientSocketFd;
  clientHandlerThreadPool->enqueue(
      [this, clientSocketFd]() { this->clientHandler(clientSocketFd); });
  return true;
}

void LivePatchServer::acceptControlPeer() {
  int peerFd = controlRouter->acceptPeer();
  if (peerFd < 0) {
    return;
  }
  // A silent peer must not hold up the accept loop
  auto router = controlRouter;
  clientHandlerThreadPool->enqueue(
      [router, peerFd]() { router->servePeer(peerFd); });
}

void LivePatchServer::clientHandler(int clientSocketFd) {
  el::Helpers::setThreadName("http-worker");

  HttpRequest request;
  try {
    request = HttpMessage::readRequest(socketHandler.get(), clientSocketFd);
  } catch (const HttpParseException& pe) {
    LOG(WARNING) << "Rejecting request on fd " << clientSocketFd << ": "
                 << pe.what();
    writeResponse(clientSocketFd,
                  HttpResponse(pe.getStatus(), "text/plain; charset=utf-8",
                               HttpMessage::reasonPhrase(pe.getStatus()) +
                                   "\n"));
    socketHandler->close(clientSocketFd);
    return;
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Dropping client on fd " << clientSocketFd << ": "
            << re.what();
    socketHandler->close(clientSocketFd);
    return;
  }

  string sessionId = request.cookie(SESSION_COOKIE_NAME);
  bool sessionIssued = false;
  if (!isValidSessionId(sessionId)) {
    if (!sessionId.empty()) {
      VLOG(1) << "Ignoring malformed session cookie";
    }
    sessionId = newSessionId();
    sessionIssued = true;
    VLOG(1) << "Issued session " << sessionId;
  }

  if (request.path == WEBSOCKET_PATH) {
    handleUpgrade(clientSocketFd, request, sessionId, sessionIssued);
    return;
  }

  HttpResponse response;
  try {
    response = route(request, sessionId);
  } catch (const std::exception& e) {
    STERROR << "Routing " << request.method << " " << request.path
            << " failed: " << e.what();
    response = HttpResponse(500, "text/plain; charset=utf-8",
                            "Internal Server Error\n");
  }
  if (sessionIssued) {
    response.setHeader("Set-Cookie", sessionCookie(sessionId));
  }
  VLOG(1) << request.method << " " << request.target << " -> "
          << response.status;
  writeResponse(clientSocketFd, response);
  socketHandler->close(clientSocketFd);
}

HttpResponse LivePatchServer::route(const HttpRequest& request,
                                    const string& sessionId) {
  if (request.path == POLL_PATH) {
    return handlePoll(request, sessionId);
  }
  if (request.path == INVALID_TARGET_PATH) {
    return handleInvalid(request, sessionId);
  }
  if (request.path == CLIENT_SCRIPT_PATH) {
    if (request.method != "GET") {
      return HttpResponse(405, "text/plain; charset=utf-8",
                          "Method Not Allowed\n");
    }
    HttpResponse response(200, "application/javascript; charset=utf-8",
                          ClientScript::source());
    response.setHeader("Cache-Control", "no-cache");
    return response;
  }

  RouteHandler handler;
  {
    lock_guard<std::recursive_mutex> guard(routeMutex);
    if (request.method == "GET") {
      auto it = pages.find(request.path);
      if (it != pages.end()) {
        handler = it->second;
      }
    } else if (request.method == "POST") {
      auto it = actions.find(request.path);
      if (it != actions.end()) {
        handler = it->second;
      }
    }
  }
  if (!handler) {
    return HttpResponse(404, "text/plain; charset=utf-8", "Not Found\n");
  }
  return runHandler(handler, request, sessionId);
}

HttpResponse LivePatchServer::handlePoll(const HttpRequest& request,
                                         const string& sessionId) {
  if (request.method != "GET") {
    return HttpResponse(405, "text/plain; charset=utf-8",
                        "Method Not Allowed\n");
  }
  auto patches = dispatcher->drainPatches(sessionId);
  VLOG(2) << "Poll from session " << sessionId << " drained "
          << patches.size() << " patches";
  HttpResponse response(200, "application/json",
                        envelopeToString(makePatchEnvelope(patches)));
  response.setHeader("Cache-Control", "no-store");
  return response;
}

HttpResponse LivePatchServer::handleInvalid(const HttpRequest& request,
                                            const string& sessionId) {
  if (request.method != "POST") {
    return HttpResponse(405, "text/plain; charset=utf-8",
                        "Method Not Allowed\n");
  }
  try {
    json body = json::parse(request.body);
    if (body.is_object() && body.contains("id") && body["id"].is_string()) {
      dispatcher->notifyInvalid(sessionId, body["id"].get<string>());
    } else {
      VLOG(1) << "Invalid-target report without an id";
    }
  } catch (const json::exception& je) {
    VLOG(1) << "Ignoring malformed invalid-target report: " << je.what();
  }
  return HttpResponse(204, "", "");
}

HttpResponse LivePatchServer::runHandler(const RouteHandler& handler,
                                         const HttpRequest& request,
                                         const string& sessionId) {
  RequestContext context(sessionId, request, dispatcher, scheduler);
  try {
    string html = handler(context);
    HttpResponse response(200, "text/html; charset=utf-8", html);
    response.setHeader("Cache-Control", "no-store");
    return response;
  } catch (const std::exception& e) {
    STERROR << "Handler for " << request.method << " " << request.path
            << " threw: " << e.what();
    return HttpResponse(500, "text/html; charset=utf-8",
                        "<h1>Internal Server Error</h1>\n");
  }
}

void LivePatchServer::handleUpgrade(int clientSocketFd,
                                    const HttpRequest& request,
                                    const string& sessionId,
                                    bool sessionIssued) {
  if (request.method != "GET") {
    writeResponse(clientSocketFd, HttpResponse(405, "text/plain; charset=utf-8",
                                               "Method Not Allowed\n"));
    socketHandler->close(clientSocketFd);
    return;
  }
  string key = request.header("sec-websocket-key");
  if (key.empty() ||
      toLower(request.header("upgrade")).find("websocket") == string::npos) {
    VLOG(1) << "Rejecting WebSocket request without key or upgrade header";
    writeResponse(clientSocketFd, HttpResponse(400, "text/plain; charset=utf-8",
                                               "Bad Request\n"));
    socketHandler->close(clientSocketFd);
    return;
  }

  HttpResponse response(101, "", "");
  response.setHeader("Upgrade", "websocket");
  response.setHeader("Connection", "Upgrade");
  response.setHeader("Sec-WebSocket-Accept", WebSocketCodec::acceptToken(key));
  if (sessionIssued) {
    response.setHeader("Set-Cookie", sessionCookie(sessionId));
  }
  string head = response.serialize();
  if (socketHandler->writeAllOrReturn(clientSocketFd, head.data(),
                                      head.length()) < 0) {
    VLOG(1) << "Client went away during the handshake";
    socketHandler->close(clientSocketFd);
    return;
  }

  auto connection =
      make_shared<WebSocketConnection>(socketHandler, clientSocketFd, sessionId);
  if (halted) {
    connection->shutdown();
    return;
  }
  try {
    dispatcher->attachConnection(sessionId, connection);
  } catch (const std::exception& e) {
    STERROR << "Could not attach connection " << connection->getId()
            << " for session " << sessionId << ": " << e.what();
    dispatcher->detachConnection(sessionId, connection);
    connection->shutdown();
    return;
  }

  lock_guard<std::mutex> guard(connectionThreadMutex);
  auto receiveThread =
      make_shared<thread>([this, connection, sessionId]() {
        connection->run();
        dispatcher->detachConnection(sessionId, connection);
        lock_guard<std::mutex> guard(connectionThreadMutex);
        finishedConnectionThreads.push_back(connection->getId());
      });
  connectionThreads[connection->getId()] = receiveThread;
}

void LivePatchServer::writeResponse(int clientSocketFd,
                                    const HttpResponse& response) {
  string payload = response.serialize();
  if (socketHandler->writeAllOrReturn(clientSocketFd, payload.data(),
                                      payload.length()) < 0) {
    VLOG(1) << "Could not write " << response.status << " response to fd "
            << clientSocketFd;
  }
}

void LivePatchServer::reapConnectionThreads() {
  lock_guard<std::mutex> guard(connectionThreadMutex);
  for (auto id : finishedConnectionThreads) {
    auto it = connectionThreads.find(id);
    if (it != connectionThreads.end()) {
      it->second->join();
      connectionThreads.erase(it);
    }
  }
  finishedConnectionThreads.clear();
}

void LivePatchServer::shutdown() {
  if (!clientHandlerThreadPool) {
    // Already shut down
    return;
  }
  halted = true;
  LOG(INFO) << "Shutting down server on " << serverEndpoint;
  scheduler->shutdown();
  socketHandler->stopListening(serverEndpoint);
  controlRouter.reset();
  // Waits for in-flight requests
  clientHandlerThreadPool.reset();
  dispatcher->getRegistry()->closeAll();

  map<int64_t, shared_ptr<thread>> toJoin;
  {
    lock_guard<std::mutex> guard(connectionThreadMutex);
    toJoin.swap(connectionThreads);
    finishedConnectionThreads.clear();
  }
  for (auto& it : toJoin) {
    it.second->join();
  }
}

int LivePatchServer::getPort() {
  set<int> fds = socketHandler->getEndpointFds(serverEndpoint);
  return TcpSocketHandler::getLocalPort(*fds.begin());
}

string LivePatchServer::newSessionId() {
  return "sess-" + genRandomAlphaNum(16);
}

bool LivePatchServer::isValidSessionId(const string& sessionId) {
  if (sessionId.empty() || sessionId.length() > MAX_SESSION_ID_LENGTH) {
    return false;
  }
  for (char c : sessionId) {
    if (!isalnum((unsigned char)c) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

string LivePatchServer::sessionCookie(const string& sessionId) {
  return SESSION_COOKIE_NAME + "=" + sessionId +
         "; Path=/; HttpOnly; SameSite=Lax";
}
}  // namespace lp
