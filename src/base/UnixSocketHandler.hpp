#ifndef __LP_UNIX_SOCKET_HANDLER__
#define __LP_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace lp {
/**
 * @brief POSIX SocketHandler that tracks every open descriptor and serializes
 * reads/writes per descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable or the timeout
   * elapses.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes, retrying EAGAIN for up to 5 seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Closes the descriptor and forgets it. */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  void addToActiveSockets(int fd);
  /**
   * @brief Makes the descriptor non-blocking and SIGPIPE-safe.
   */
  virtual void initSocket(int fd);
  /**
   * @brief initSocket() plus SO_REUSEADDR for listening sockets.
   */
  virtual void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace lp

#endif  // __LP_UNIX_SOCKET_HANDLER__
