#include "WHOIS-classify.hpp"

#include <exception>
#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace WHOIS {

matcher phrase_matcher(std::string free_fmt, std::string taken_marker)
{
  return [free_fmt = std::move(free_fmt),
          taken_marker
          = std::move(taken_marker)](std::string_view response,
                                     std::string_view domain) -> status {
    auto const upper = boost::algorithm::to_upper_copy(std::string(domain));
    auto const free_phrase = fmt::format(fmt::runtime(free_fmt), upper);

    if (response.find(free_phrase) != std::string_view::npos)
      return status::free;

    if (response.find(taken_marker) != std::string_view::npos)
      return status::taken;

    return status::unknown;
  };
}

Classifier const& Classifier::standard()
{
  static Classifier const cls = [] {
    Classifier c;
    // .com and .net
    c.add_rule("whois.verisign-grs.com",
               phrase_matcher("No match for domain \"{}\"", "Registrar:"));
    return c;
  }();
  return cls;
}

void Classifier::add_rule(std::string_view server, matcher m)
{
  CHECK(m) << "empty matcher for " << server;
  rules_[boost::algorithm::to_lower_copy(std::string(server))] = std::move(m);
}

bool Classifier::has_rule(std::string_view server) const
{
  return rules_.find(boost::algorithm::to_lower_copy(std::string(server)))
         != rules_.end();
}

status Classifier::classify(std::string_view server,
                            std::string_view response,
                            std::string_view domain) const noexcept
{
  try {
    auto const rule
        = rules_.find(boost::algorithm::to_lower_copy(std::string(server)));
    if (rule == rules_.end()) {
      LOG(INFO) << "no classification rule for " << server;
      return status::unknown;
    }

    auto const st = rule->second(response, domain);
    LOG(INFO) << domain << " is " << st << " according to " << server;
    return st;
  }
  catch (std::exception const& ex) {
    LOG(WARNING) << "classifying " << domain << " from " << server
                 << " failed: " << ex.what();
  }
  catch (...) {
    LOG(WARNING) << "classifying " << domain << " from " << server
                 << " failed with a non-standard exception";
  }
  return status::unknown;
}

} // namespace WHOIS
