#include "tcp_link.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace meshdispatch::transport {

TcpLink::TcpLink(std::string host, std::uint16_t port, std::chrono::milliseconds reconnect_interval,
                 std::chrono::milliseconds write_timeout, std::size_t max_frame_bytes)
    : StreamLink("tcp:" + host + ":" + std::to_string(port), reconnect_interval, write_timeout, max_frame_bytes), host_(std::move(host)), port_(port) {
}

TcpLink::~TcpLink() {
  Stop();
}

int TcpLink::OpenLink() {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*         result  = nullptr;
  const std::string service = std::to_string(port_);
  const int         rc      = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw util::TransportError("resolve " + host_ + ": " + ::gai_strerror(rc));
  }

  std::string last_error = "no addresses";
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      ::freeaddrinfo(result);
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
      // writes are bounded by StreamLink::Send
      const int flags = ::fcntl(fd, F_GETFL, 0);
      if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        const std::string error = std::strerror(errno);
        ::close(fd);
        throw util::TransportError("configure " + Name() + ": " + error);
      }
      return fd;
    }
    last_error = std::strerror(errno);
    ::close(fd);
  }

  ::freeaddrinfo(result);
  throw util::TransportError("connect " + Name() + ": " + last_error);
}

ssize_t TcpLink::WriteSome(int fd, const char* data, std::size_t size) {
  return ::send(fd, data, size, MSG_NOSIGNAL);
}

} // namespace meshdispatch::transport
