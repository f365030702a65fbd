#ifndef WHOIS_DRIVER_DOT_HPP
#define WHOIS_DRIVER_DOT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "TLD.hpp"
#include "WHOIS-classify.hpp"
#include "WHOIS-registry.hpp"
#include "WHOIS-resolver.hpp"
#include "fs.hpp"

namespace Config {
// Longest time we'll agree to wait on a server.
constexpr auto max_timeout = std::chrono::hours(24);
} // namespace Config

namespace WHOIS {

// Zero (wait forever) or no more than Config::max_timeout.
bool valid_timeout(std::uint64_t seconds);

// One domain per line, trimmed; blank lines and '#' lines skipped.
std::vector<std::string> parse_domains(std::string_view text);
std::vector<std::string> read_domains(fs::path const& path);

// "[FREE ] example.com", "[TAKEN] example.com" or "[?????] example.com"
std::string status_line(status st, std::string_view domain);

// Sends text to server and returns the response, throwing query_error.
using query_fn
    = std::function<std::string(std::string const& server,
                                std::string_view   text)>;

class Driver {
public:
  struct options {
    std::string server; // if set, bypasses the registry
    bool        keep_going{true};
    bool        registered_domain{false};
    bool        color{false};
  };

  Driver(Driver const&) = delete;
  Driver& operator=(Driver const&) = delete;

  Driver(Registry registry, query_fn query, options opts);

  // Suffixes that have a server, "xn--" ones left out.
  void list(std::ostream& os) const;

  // The raw response for domain.
  void lookup(std::string const& domain, std::ostream& os) const;

  // A status_line for each domain.  A domain that can't be resolved or
  // queried gets an "[ERROR]" line, or ends the run if keep_going is off.
  void simple(std::vector<std::string> const& domains,
              std::ostream&                   os) const;

private:
  std::string query_domain_(std::string const& domain) const;
  std::string server_for_(std::string const& domain) const;

  Registry const registry_;
  Resolver const res_;

  query_fn query_;
  options  opts_;

  std::optional<TLD> tld_;
};

} // namespace WHOIS

#endif // WHOIS_DRIVER_DOT_HPP
