#include "WHOIS-resolver.hpp"

#include "WHOIS.hpp"

#include <type_traits>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
void check_unresolved(WHOIS::Resolver const& res,
                      char const*            domain,
                      char const*            suffix)
{
  try {
    res.resolve(domain);
    LOG(FATAL) << "should have thrown for " << domain;
  }
  catch (WHOIS::resolution_error const& ex) {
    CHECK_EQ(ex.suffix(), suffix);
  }
}
} // namespace

// A Resolver refers to its registry, so it can't be built from a
// temporary.
static_assert(
    std::is_constructible_v<WHOIS::Resolver, WHOIS::Registry const&>);
static_assert(!std::is_constructible_v<WHOIS::Resolver, WHOIS::Registry>);
static_assert(!std::is_constructible_v<WHOIS::Resolver, WHOIS::Registry&&>);

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(WHOIS::Resolver::suffix("example.com"), ".com");
  CHECK_EQ(WHOIS::Resolver::suffix("www.Example.COM"), ".com");
  CHECK_EQ(WHOIS::Resolver::suffix("example.com."), ".com");
  CHECK_EQ(WHOIS::Resolver::suffix("example.com \r\n"), ".com");
  CHECK_EQ(WHOIS::Resolver::suffix("example"), "");
  CHECK_EQ(WHOIS::Resolver::suffix("example."), "");
  CHECK_EQ(WHOIS::Resolver::suffix(""), "");

  WHOIS::Resolver const res;

  CHECK_EQ(res.resolve("example.com"), "whois.verisign-grs.com");
  CHECK_EQ(res.resolve("EXAMPLE.COM"), "whois.verisign-grs.com");
  CHECK_EQ(res.resolve("example.Net"), "whois.verisign-grs.com");
  CHECK_EQ(res.resolve("www.example.co.uk"), "whois.nic.uk");
  CHECK_EQ(res.resolve("example.org."), "whois.pir.org");

  check_unresolved(res, "example.zz", ".zz");
  check_unresolved(res, "example.ZZ", ".zz");
  check_unresolved(res, "example.ad", ".ad"); // no public server
  check_unresolved(res, "localhost", "");

  try {
    res.resolve("example.zz");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::runtime_error const& ex) {
    CHECK_EQ(ex.what(), "No whois server found for TLD .zz"s);
  }

  // Every suffix with a server resolves to it, every other one fails.
  for (auto const& [suffix, server] : WHOIS::Registry::root_zone()) {
    auto const domain = "example" + suffix;
    if (server) {
      CHECK_EQ(res.resolve(domain), *server);
    }
    else {
      check_unresolved(res, domain.c_str(), suffix.c_str());
    }
  }

  WHOIS::Registry const reg{
      {".test", "whois.example.test"},
      {".com", std::nullopt},
  };
  WHOIS::Resolver const local{reg};

  CHECK_EQ(local.resolve("a.b.TEST"), "whois.example.test");
  check_unresolved(local, "example.com", ".com");
  check_unresolved(local, "example.net", ".net");
}
