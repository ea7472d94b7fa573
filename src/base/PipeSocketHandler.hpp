#ifndef __LP_PIPE_SOCKET_HANDLER__
#define __LP_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace lp {
/**
 * @brief UNIX domain stream sockets addressed by filesystem path (the
 * endpoint name).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket file named by the endpoint.
   * @return A tracked socket, or -1 with errno set.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates the socket file (replacing a stale one) with owner-only
   * permissions and listens on it.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /** @brief Closes the listening fd and removes the socket file. */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  map<string, set<int>> pipeServerSockets;
};
}  // namespace lp

#endif  // __LP_PIPE_SOCKET_HANDLER__
