#include "TcpSocketHandler.hpp"

#include <resolv.h>

namespace lp {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.port());
  std::string hostname = endpoint.name();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Set nonblocking just for the connect phase
    {
      int opts = fcntl(sockFd, F_GETFL);
      FATAL_FAIL(opts);
      opts |= O_NONBLOCK;
      FATAL_FAIL(fcntl(sockFd, F_SETFL, opts));
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      VLOG(1) << "Error connecting to " << endpoint << ": " << errno << " "
              << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = 3; /* 3 second timeout */
    tv.tv_usec = 0;
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    if (FD_ISSET(sockFd, &fdset)) {
      int so_error;
      socklen_t len = sizeof so_error;
      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));

      if (so_error == 0) {
        VLOG(1) << "Connected to " << endpoint << " using fd " << sockFd;
        // The socket is blocking once it's attached to a server.
        {
          int opts = fcntl(sockFd, F_GETFL);
          FATAL_FAIL(opts);
          opts &= (~O_NONBLOCK);
          FATAL_FAIL(fcntl(sockFd, F_SETFL, opts));
        }
        int flag = 1;
        FATAL_FAIL_UNLESS_EINVAL(setsockopt(sockFd, IPPROTO_TCP, TCP_NODELAY,
                                            (char *)&flag, sizeof(int)));
        break;
      }
      VLOG(1) << "Error connecting to " << endpoint << ": " << so_error << " "
              << strerror(so_error);
    } else {
      VLOG(1) << "Timed out connecting to " << endpoint;
    }
    ::close(sockFd);
    sockFd = -1;
  }
  if (sockFd == -1) {
    LOG(WARNING) << "Could not connect to " << endpoint;
  } else {
    addToActiveSockets(sockFd);
  }

  freeaddrinfo(results);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    throw std::runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo, *p;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *bindHost =
      (endpoint.has_name() && !endpoint.name().empty()) ? endpoint.name().c_str()
                                                        : NULL;

  int rc = getaddrinfo(bindHost, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": "
        << gai_strerror(rc);
    throw std::runtime_error(oss.str());
  }

  set<int> serverSockets;
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPv6 sockets only listen on IPv6 interfaces, IPv4 gets its own socket.
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      stringstream oss;
      oss << "Error binding port " << port << ": " << errno << " "
          << strerror(errno);
      LOG(ERROR) << oss.str();
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(oss.str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on " << endpoint << " (family " << p->ai_family
              << ", fd " << sockFd << ")";
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface");
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) == portServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a port without calling listen() "
               "first";
  }
  return portServerSockets[port];
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

int TcpSocketHandler::getLocalPort(int fd) {
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(fd, (sockaddr *)&addr, &len));
  if (addr.ss_family == AF_INET6) {
    return ntohs(((sockaddr_in6 *)&addr)->sin6_port);
  }
  return ntohs(((sockaddr_in *)&addr)->sin_port);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace lp
