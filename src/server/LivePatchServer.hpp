#ifndef __LP_LIVE_PATCH_SERVER__
#define __LP_LIVE_PATCH_SERVER__

#include "ControlRouter.hpp"
#include "Headers.hpp"
#include "HttpMessage.hpp"
#include "IntervalScheduler.hpp"
#include "PatchDispatcher.hpp"
#include "PipeSocketHandler.hpp"
#include "SocketHandler.hpp"
#include "WebSocketConnection.hpp"

namespace lp {
/**
 * @brief What a page or action handler gets to work with: the caller's
 * session, its request, and helpers to patch the page later.
 */
class RequestContext {
 public:
  RequestContext(const string& _sessionId, const HttpRequest& _request,
                 shared_ptr<PatchDispatcher> _dispatcher,
                 shared_ptr<IntervalScheduler> _scheduler)
      : sessionId(_sessionId),
        request(_request),
        dispatcher(_dispatcher),
        scheduler(_scheduler) {}

  inline const string& getSessionId() const { return sessionId; }
  inline const HttpRequest& getRequest() const { return request; }
  inline shared_ptr<PatchDispatcher> getDispatcher() { return dispatcher; }

  /** @brief Queues a patch for this request's session. */
  void patch(const string& targetId, SwapMode swap, const string& html,
             std::function<void()> cleanup = nullptr);

  /**
   * @brief Starts a periodic task on the server's scheduler. Its stop() is a
   * natural cleanup for the patches it sends.
   */
  shared_ptr<Interval> every(std::chrono::milliseconds period,
                             std::function<void()> fn);

 protected:
  string sessionId;
  const HttpRequest& request;
  shared_ptr<PatchDispatcher> dispatcher;
  shared_ptr<IntervalScheduler> scheduler;
};

typedef std::function<string(RequestContext&)> RouteHandler;

/**
 * @brief HTTP/1.1 + WebSocket front door of the patch system.
 *
 * run() selects on the listening sockets (and the optional control socket).
 * Plain requests are served one per connection on a worker pool. Upgraded
 * sockets get their own receive thread and are attached to the dispatcher
 * under the caller's session.
 */
class LivePatchServer {
 public:
  LivePatchServer(shared_ptr<SocketHandler> _socketHandler,
                  const SocketEndpoint& _serverEndpoint,
                  shared_ptr<PatchDispatcher> _dispatcher);
  ~LivePatchServer();

  /**
   * @brief Opens the control channel at `controlEndpoint`. Must be called
   * before run().
   */
  void enableControlChannel(shared_ptr<PipeSocketHandler> pipeSocketHandler,
                            const SocketEndpoint& controlEndpoint);

  /** @brief GET route returning HTML. */
  void registerPage(const string& path, RouteHandler handler);
  /** @brief POST route returning HTML. */
  void registerAction(const string& path, RouteHandler handler);

  /** @brief Accept loop. Returns after halt(), once everything is shut down. */
  void run();
  /** @brief Asks run() to return. Safe from any thread. */
  void halt();
  bool isHalted();

  /**
   * @brief Accepts a pending socket and hands it to the worker pool.
   */
  bool acceptNewConnection(int fd);
  /** @brief Accepts a control peer and answers it on the worker pool. */
  void acceptControlPeer();
  /**
   * @brief Serves one request on a pool thread; takes ownership of the fd.
   */
  void clientHandler(int clientSocketFd);

  /** @brief Dispatches a parsed request to the protocol or app routes. */
  HttpResponse route(const HttpRequest& request, const string& sessionId);

  /** @brief Port of the first listening socket. */
  int getPort();

  inline shared_ptr<PatchDispatcher> getDispatcher() { return dispatcher; }
  inline shared_ptr<IntervalScheduler> getScheduler() { return scheduler; }

  static string newSessionId();
  static bool isValidSessionId(const string& sessionId);
  static string sessionCookie(const string& sessionId);

 protected:
  void handleUpgrade(int clientSocketFd, const HttpRequest& request,
                     const string& sessionId, bool sessionIssued);
  HttpResponse handlePoll(const HttpRequest& request, const string& sessionId);
  HttpResponse handleInvalid(const HttpRequest& request,
                             const string& sessionId);
  HttpResponse runHandler(const RouteHandler& handler,
                          const HttpRequest& request, const string& sessionId);
  void writeResponse(int clientSocketFd, const HttpResponse& response);
  void reapConnectionThreads();
  void shutdown();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<PatchDispatcher> dispatcher;
  shared_ptr<IntervalScheduler> scheduler;
  shared_ptr<ControlRouter> controlRouter;
  unique_ptr<ThreadPool> clientHandlerThreadPool;

  std::recursive_mutex routeMutex;
  map<string, RouteHandler> pages;
  map<string, RouteHandler> actions;

  std::mutex connectionThreadMutex;
  map<int64_t, shared_ptr<thread>> connectionThreads;
  vector<int64_t> finishedConnectionThreads;
  atomic<bool> halted;
};
}  // namespace lp

#endif  // __LP_LIVE_PATCH_SERVER__
