#include "gitdock/stream.hpp"

#include "gitdock/error.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace gitdock {

namespace {

[[nodiscard]] auto gai_error_to_exception(int rc, std::string_view where, std::string_view host,
                                          int port) -> std::runtime_error {
  std::ostringstream os;
  os << where << " failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return std::runtime_error(os.str());
}

struct AddrInfoList {
  addrinfo *head{nullptr};
  ~AddrInfoList() {
    if (head) {
      ::freeaddrinfo(head);
    }
  }
};

} // namespace

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

void read_exact(ByteStream &in, std::uint8_t *dst, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    const std::size_t r = in.read_some(dst + got, n - got);
    if (r == 0) {
      throw Error(Errc::Protocol, "unexpected end of stream");
    }
    got += r;
  }
}

std::size_t FdStream::read_some(std::uint8_t *dst, std::size_t n) {
  for (;;) {
    if (timeout_.count() > 0) {
      pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
      const int rc = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
      if (rc == 0) {
        throw Error(Errc::Timeout, "peer stalled");
      }
      if (rc < 0) {
        if (errno == EINTR)
          continue;
        throw std::system_error(errno, std::generic_category(), "poll");
      }
    }
    const ssize_t r = ::recv(fd_, dst, n, 0);
    if (r < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    return static_cast<std::size_t>(r);
  }
}

void FdStream::write(std::span<const std::uint8_t> data) {
  const auto *p = data.data();
  std::size_t n = data.size();
  while (n != 0U) {
    const ssize_t w = ::send(fd_, p, n, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "send");
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

void FdStream::close_write() { ::shutdown(fd_, SHUT_WR); }

[[nodiscard]] auto connect_tcp(const std::string &host, int port) -> UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  AddrInfoList res;
  const std::string port_s = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res.head); rc != 0) {
    throw gai_error_to_exception(rc, "getaddrinfo", host, port);
  }

  UniqueFd sock;
  int last_errno = 0;
  for (addrinfo *rp = res.head; rp != nullptr; rp = rp->ai_next) {
    UniqueFd fd{::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol)};
    if (!fd) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0) {
      sock = std::move(fd);
      break;
    }
    last_errno = errno;
  }
  if (!sock) {
    throw std::system_error(last_errno, std::generic_category(),
                            "connect " + host + ":" + port_s);
  }
  return sock;
}

[[nodiscard]] auto listen_tcp(const std::string &address, int port, int backlog) -> UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  AddrInfoList res;
  const std::string port_s = std::to_string(port);
  const char *node = address.empty() ? nullptr : address.c_str();
  if (const int rc = ::getaddrinfo(node, port_s.c_str(), &hints, &res.head); rc != 0) {
    throw gai_error_to_exception(rc, "getaddrinfo", address, port);
  }

  int last_errno = 0;
  for (addrinfo *rp = res.head; rp != nullptr; rp = rp->ai_next) {
    UniqueFd fd{::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol)};
    if (!fd) {
      last_errno = errno;
      continue;
    }
    int yes = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(fd.get(), backlog) == 0) {
      return fd;
    }
    last_errno = errno;
  }
  throw std::system_error(last_errno, std::generic_category(), "bind " + address + ":" + port_s);
}

int bound_port(int fd) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&ss), &len) != 0) {
    throw std::system_error(errno, std::generic_category(), "getsockname");
  }
  if (ss.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6 *>(&ss)->sin6_port);
  }
  return ntohs(reinterpret_cast<sockaddr_in *>(&ss)->sin_port);
}

} // namespace gitdock
