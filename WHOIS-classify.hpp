#ifndef WHOIS_CLASSIFY_DOT_HPP
#define WHOIS_CLASSIFY_DOT_HPP

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace WHOIS {

enum class status {
  free,
  taken,
  unknown,
};

constexpr char const* c_str(status st)
{
  switch (st) {
  case status::free: return "free";
  case status::taken: return "taken";
  case status::unknown: return "unknown";
  }
  return "*** unknown status ***";
}

inline std::ostream& operator<<(std::ostream& os, status st)
{
  return os << c_str(st);
}

// Decides availability from one server's response to a query for
// domain.
using matcher
    = std::function<status(std::string_view response, std::string_view domain)>;

// Free if the response contains free_fmt with the upper-cased domain
// substituted for "{}", taken if it contains taken_marker.
matcher phrase_matcher(std::string free_fmt, std::string taken_marker);

// Server host name to matcher.  Servers with no rule, and responses no
// rule recognizes, classify as unknown.

class Classifier {
public:
  Classifier() = default;

  // Rules for the servers whose responses we know how to read.
  static Classifier const& standard();

  // Adds a rule, replacing any rule already there for server.
  void add_rule(std::string_view server, matcher m);

  bool has_rule(std::string_view server) const;

  status classify(std::string_view server,
                  std::string_view response,
                  std::string_view domain) const noexcept;

private:
  std::map<std::string, matcher, std::less<>> rules_;
};

} // namespace WHOIS

#endif // WHOIS_CLASSIFY_DOT_HPP
