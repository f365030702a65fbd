#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "SockBuffer.hpp"

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  // Connects to the first address of host that will take a TCP
  // connection on port.  Throws std::runtime_error if host doesn't
  // resolve, std::system_error if no address accepts the connection.
  Sock(std::string const&        host,
       uint16_t                  port,
       std::chrono::milliseconds read_timeout  = Config::no_timeout,
       std::chrono::milliseconds write_timeout = Config::no_timeout);

  ~Sock();

  std::string const& them_address_literal() const
  {
    return them_address_literal_;
  }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  bool timed_out() { return iostream_->timed_out(); }
  int  error() { return iostream_->error(); }

  std::streamsize octets_read() { return iostream_->octets_read(); }
  std::streamsize octets_written() { return iostream_->octets_written(); }

private:
  std::string them_address_literal_;

  int fd_;

  boost::iostreams::stream<SockBuffer> iostream_;
};

#endif // SOCK_DOT_HPP
