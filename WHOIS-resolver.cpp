#include "WHOIS-resolver.hpp"

#include "WHOIS.hpp"

#include <glog/logging.h>

#include <boost/algorithm/string/trim.hpp>

namespace WHOIS {

std::string Resolver::suffix(std::string_view domain)
{
  auto dom = boost::algorithm::trim_right_copy(std::string(domain));

  // A fully qualified "example.com." names the same TLD.
  if (!dom.empty() && dom.back() == '.')
    dom.pop_back();

  auto const dot = dom.rfind('.');
  if (dot == std::string::npos || dot + 1 == dom.size())
    return "";

  return normalize_suffix(std::string_view(dom).substr(dot));
}

std::string Resolver::resolve(std::string_view domain) const
{
  auto const tld = suffix(domain);
  if (tld.empty()) {
    LOG(WARNING) << "no TLD in «" << domain << "»";
    throw resolution_error(tld);
  }

  auto const server = registry_.find(tld);
  if (server == nullptr) {
    LOG(WARNING) << "TLD " << tld << " not in registry";
    throw resolution_error(tld);
  }
  if (!*server) {
    LOG(WARNING) << "TLD " << tld << " has no public whois server";
    throw resolution_error(tld);
  }

  LOG(INFO) << "whois server for " << domain << " is " << **server;
  return **server;
}

} // namespace WHOIS
