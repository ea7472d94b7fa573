#ifndef __LP_TCP_SOCKET_HANDLER__
#define __LP_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace lp {
/**
 * @brief IPv4/IPv6 TCP sockets on top of UnixSocketHandler.
 *
 * Listening sockets are keyed by port. An endpoint with a name binds only to
 * that address; an endpoint without one binds every interface.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects with a 3 second timeout.
   * @return A blocking, tracked socket, or -1.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's port.
   * @throws std::runtime_error when the port is already bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /** @brief Closes every listening fd of the endpoint's port. */
  virtual void stopListening(const SocketEndpoint& endpoint);

  /**
   * @brief Returns the local port a socket is bound to (useful after listening
   * on port 0).
   */
  static int getLocalPort(int fd);

 protected:
  map<int, set<int>> portServerSockets;

  /** @brief Adds TCP_NODELAY on top of the base socket setup. */
  virtual void initSocket(int fd);
};
}  // namespace lp

#endif  // __LP_TCP_SOCKET_HANDLER__
