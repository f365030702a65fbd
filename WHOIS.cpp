#include "WHOIS.hpp"

#include "Sock.hpp"

#include <cstring>
#include <iterator>
#include <memory>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

namespace WHOIS {

resolution_error::resolution_error(std::string suffix)
  : std::runtime_error(suffix.empty()
                           ? std::string("No whois server found, no TLD")
                           : fmt::format("No whois server found for TLD {}",
                                         suffix))
  , suffix_(std::move(suffix))
{
}

query_error::query_error(std::string server, std::string const& cause)
  : std::runtime_error(fmt::format("whois query to {} failed: {}", server,
                                   cause))
  , server_(std::move(server))
{
}

std::string query(std::string const&        server,
                  std::string_view          text,
                  std::chrono::milliseconds timeout,
                  uint16_t                  port)
{
  auto sock = [&] {
    try {
      return std::make_unique<Sock>(server, port, timeout, timeout);
    }
    catch (std::exception const& ex) {
      throw query_error(server, ex.what());
    }
  }();

  LOG(INFO) << "C: " << text;
  sock->out() << text << "\r\n" << std::flush;
  if (!sock->out()) {
    if (sock->timed_out())
      throw query_error(server, "timed out sending query");
    throw query_error(server, std::strerror(sock->error()));
  }

  // Read until the server closes the connection.
  auto response = std::string(std::istreambuf_iterator<char>(sock->in()),
                              std::istreambuf_iterator<char>());

  auto const& addr = sock->them_address_literal();

  if (sock->timed_out()) {
    auto const msg = fmt::format("timed out at {} after {} octets", addr,
                                 sock->octets_read());
    throw query_error(server, msg);
  }
  if (sock->error()) {
    if (response.empty())
      throw query_error(server, std::strerror(sock->error()));
    LOG(WARNING) << "connection to " << server << " " << addr
                 << " lost after " << sock->octets_read()
                 << " octets: " << std::strerror(sock->error());
  }

  LOG(INFO) << "S: " << sock->octets_read() << " octets from " << server
            << " " << addr << " for " << sock->octets_written()
            << " octets sent";
  return response;
}

} // namespace WHOIS
