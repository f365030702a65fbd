#ifndef WHOIS_DOT_HPP
#define WHOIS_DOT_HPP

// RFC 3912 WHOIS client: one query line out, everything the server
// sends back until it closes the connection.

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "POSIX.hpp"

namespace Config {
constexpr uint16_t whois_port = 43;
} // namespace Config

namespace WHOIS {

// No WHOIS server is known for the domain's TLD.
class resolution_error : public std::runtime_error {
public:
  explicit resolution_error(std::string suffix);

  std::string const& suffix() const { return suffix_; }

private:
  std::string suffix_;
};

// The WHOIS server couldn't be reached, or the exchange with it failed.
class query_error : public std::runtime_error {
public:
  query_error(std::string server, std::string const& cause);

  std::string const& server() const { return server_; }

private:
  std::string server_;
};

// Sends text plus CRLF to server, returns the response.  With the
// default timeout of zero this blocks until the server closes the
// connection.  Throws query_error.
std::string query(std::string const&        server,
                  std::string_view          text,
                  std::chrono::milliseconds timeout = Config::no_timeout,
                  uint16_t                  port    = Config::whois_port);

} // namespace WHOIS

#endif // WHOIS_DOT_HPP
