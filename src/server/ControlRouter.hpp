#ifndef __LP_CONTROL_ROUTER__
#define __LP_CONTROL_ROUTER__

#include "Headers.hpp"
#include "PatchDispatcher.hpp"
#include "PipeSocketHandler.hpp"

namespace lp {
const string DEFAULT_CONTROL_PATH = "/tmp/lpserver-control.sock";

/**
 * @brief Local administration socket of a running server.
 *
 * A peer connects to the UNIX socket, writes one length-prefixed
 * ControlRequest and reads one ControlResponse back.
 */
class ControlRouter {
 public:
  ControlRouter(shared_ptr<PipeSocketHandler> _socketHandler,
                const SocketEndpoint& _routerEndpoint,
                shared_ptr<PatchDispatcher> _dispatcher);
  ~ControlRouter();

  inline int getServerFd() { return serverFd; }

  /**
   * @brief Accepts one pending peer, if any, and answers its request.
   * @return true if a request was served.
   */
  bool acceptNewConnection();

  /** @return the accepted peer fd, or -1 if nobody was waiting. */
  int acceptPeer();

  /**
   * @brief Reads one request from an accepted peer, answers it and closes
   * the peer. May block until the peer's read timeout, so callers on an
   * accept loop should run it elsewhere.
   */
  bool servePeer(int peerFd);

  ControlResponse handleRequest(const ControlRequest& request);

  /**
   * @brief Client side: connects to a router, sends `request` and waits for
   * the response.
   * @throws std::runtime_error if the router is unreachable or hangs up.
   */
  static ControlResponse sendRequest(
      shared_ptr<PipeSocketHandler> socketHandler,
      const SocketEndpoint& routerEndpoint, const ControlRequest& request);

 protected:
  int serverFd;
  SocketEndpoint routerEndpoint;
  shared_ptr<PipeSocketHandler> socketHandler;
  shared_ptr<PatchDispatcher> dispatcher;
  recursive_mutex routerMutex;
};
}  // namespace lp

#endif  // __LP_CONTROL_ROUTER__
