#include "Sock.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <unistd.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
std::string address_literal(addrinfo const* ai)
{
  char str[INET6_ADDRSTRLEN]{'\0'};

  switch (ai->ai_family) {
  case AF_INET: {
    auto const in4 = reinterpret_cast<sockaddr_in const*>(ai->ai_addr);
    PCHECK(inet_ntop(AF_INET, &in4->sin_addr, str, sizeof str));
    return fmt::format("[{}]", str);
  }
  case AF_INET6: {
    auto const in6 = reinterpret_cast<sockaddr_in6 const*>(ai->ai_addr);
    PCHECK(inet_ntop(AF_INET6, &in6->sin6_addr, str, sizeof str));
    return fmt::format("[IPv6:{}]", str);
  }
  }
  return "[unknown]";
}

// Returns 0 or the errno of the failed connect.
int try_connect(int fd, addrinfo const* ai, std::chrono::milliseconds timeout)
{
  if (timeout == Config::no_timeout) {
    while (connect(fd, ai->ai_addr, ai->ai_addrlen) == -1) {
      if (errno != EINTR)
        return errno;
    }
    return 0;
  }

  POSIX::set_nonblocking(fd);
  if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
    return 0;
  if (errno != EINPROGRESS)
    return errno;

  if (!POSIX::output_ready(fd, timeout))
    return ETIMEDOUT;

  int       err = 0;
  socklen_t len = sizeof(err);
  PCHECK(getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0);
  return err;
}

int conn(std::string const&        host,
         uint16_t                  port,
         std::chrono::milliseconds timeout,
         std::string&              addr_lit)
{
  auto hints{addrinfo{}};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  auto const service = fmt::format("{}", port);

  addrinfo* res = nullptr;
  auto const rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    throw std::runtime_error(
        fmt::format("can't resolve {}: {}", host, gai_strerror(rc)));
  }
  auto const addrs = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(
      res, &freeaddrinfo);

  auto last_err{ECONNREFUSED};
  for (auto ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
    auto const lit = address_literal(ai);

    int const fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      last_err = errno;
      PLOG(WARNING) << "socket() failed for " << lit;
      continue;
    }

    last_err = try_connect(fd, ai, timeout);
    if (last_err == 0) {
      addr_lit = lit;
      return fd;
    }

    LOG(WARNING) << "connect failed " << lit << ":" << port << ": "
                 << std::strerror(last_err);
    close(fd);
  }

  throw std::system_error(last_err, std::generic_category(),
                          fmt::format("can't connect to {}:{}", host, port));
}
} // namespace

Sock::Sock(std::string const&        host,
           uint16_t                  port,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout)
  : fd_(conn(host, port, write_timeout, them_address_literal_))
  , iostream_(fd_, read_timeout, write_timeout)
{
  LOG(INFO) << "connected to " << host << " " << them_address_literal_ << ":"
            << port;
}

Sock::~Sock()
{
  if (close(fd_) == -1) {
    PLOG(WARNING) << "close() failed";
  }
}
