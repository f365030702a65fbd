#ifndef WHOIS_RESOLVER_DOT_HPP
#define WHOIS_RESOLVER_DOT_HPP

#include <string>
#include <string_view>

#include "WHOIS-registry.hpp"

namespace WHOIS {

class Resolver {
public:
  explicit Resolver(Registry const& registry = Registry::root_zone())
    : registry_(registry)
  {
  }

  // Holds a reference, so no temporaries.
  Resolver(Registry&&) = delete;

  // The WHOIS server for domain's TLD.  Throws resolution_error.
  std::string resolve(std::string_view domain) const;

  // ".com" from "www.Example.COM", or empty if there is no dot.
  static std::string suffix(std::string_view domain);

private:
  Registry const& registry_;
};

} // namespace WHOIS

#endif // WHOIS_RESOLVER_DOT_HPP
