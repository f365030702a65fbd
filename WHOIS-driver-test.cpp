#include "WHOIS-driver.hpp"

#include "WHOIS.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <glog/logging.h>

#include <fmt/format.h>

using namespace std::string_literals;

namespace {
WHOIS::Registry const reg{
    {".com", "whois.verisign-grs.com"},
    {".test", "whois.example.test"},
    {".down", "whois.down.test"},
    {".ad", std::nullopt},
    {".xn--p1ai", "whois.tcinet.ru"},
};

// Who was asked what.
std::vector<std::pair<std::string, std::string>> asked;

std::string canned(std::string const& server, std::string_view text)
{
  asked.emplace_back(server, std::string(text));
  if (server == "whois.down.test")
    throw WHOIS::query_error(server, "Connection refused");
  if (text == "domain free.com")
    return R"(No match for domain "FREE.COM".)";
  if (text == "domain taken.com" || text == "taken.com")
    return "Registrar: Example Registrar, Inc.";
  return "nothing to see here";
}

WHOIS::Driver::options defaults()
{
  WHOIS::Driver::options opts;
  opts.keep_going = true;
  opts.color      = false;
  return opts;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(WHOIS::valid_timeout(0));
  CHECK(WHOIS::valid_timeout(60));
  CHECK(WHOIS::valid_timeout(24 * 60 * 60));
  CHECK(!WHOIS::valid_timeout(24 * 60 * 60 + 1));
  CHECK(!WHOIS::valid_timeout(std::numeric_limits<std::uint64_t>::max()));

  CHECK_EQ(WHOIS::status_line(WHOIS::status::free, "a.com"), "[FREE ] a.com");
  CHECK_EQ(WHOIS::status_line(WHOIS::status::taken, "a.com"), "[TAKEN] a.com");
  CHECK_EQ(WHOIS::status_line(WHOIS::status::unknown, "a.com"),
           "[?????] a.com");

  auto const list_text = "  free.com \n\n# not this one\ntaken.com\r\n"
                         "   \n\t#indented comment\nother.test"s;
  auto const domains   = WHOIS::parse_domains(list_text);
  CHECK_EQ(domains.size(), 3u);
  CHECK_EQ(domains[0], "free.com");
  CHECK_EQ(domains[1], "taken.com");
  CHECK_EQ(domains[2], "other.test");

  CHECK(WHOIS::parse_domains("").empty());
  CHECK(WHOIS::parse_domains("\n\n# nothing\n").empty());

  auto const path
      = fs::temp_directory_path() / fmt::format("domains-{}", getpid());
  {
    std::ofstream out(path);
    out << list_text;
  }
  CHECK(WHOIS::read_domains(path) == domains);
  {
    std::ofstream out(path, std::ios::trunc);
  }
  CHECK(WHOIS::read_domains(path).empty());
  fs::remove(path);

  try {
    WHOIS::read_domains(path);
    LOG(FATAL) << "should have thrown";
  }
  catch (std::runtime_error const&) {
  }

  // List: no suffixes without a server, no punycode.
  {
    WHOIS::Driver drv(reg, canned, defaults());
    std::ostringstream os;
    drv.list(os);
    auto const pad = [](std::string suffix) {
      suffix.resize(24, ' ');
      return suffix;
    };
    CHECK_EQ(os.str(), pad(".com") + " whois.verisign-grs.com\n"
                           + pad(".down") + " whois.down.test\n"
                           + pad(".test") + " whois.example.test\n");
    CHECK(asked.empty());
  }

  // Lookup prints the raw response, the query is the bare domain.
  {
    WHOIS::Driver drv(reg, canned, defaults());
    std::ostringstream os;
    drv.lookup("taken.com", os);
    CHECK_EQ(os.str(), "Registrar: Example Registrar, Inc.\n");
    CHECK_EQ(asked.size(), 1u);
    CHECK_EQ(asked.back().first, "whois.verisign-grs.com");
    CHECK_EQ(asked.back().second, "taken.com");

    try {
      drv.lookup("example.zz", os);
      LOG(FATAL) << "should have thrown";
    }
    catch (WHOIS::resolution_error const& ex) {
      CHECK_EQ(ex.suffix(), ".zz");
    }
  }

  // Simple mode carries on past failures.
  {
    asked.clear();
    WHOIS::Driver      drv(reg, canned, defaults());
    std::ostringstream os;
    drv.simple({"free.com", "taken.com", "other.test", "example.zz", "x.ad",
                "host.down"},
               os);
    CHECK_EQ(os.str(),
             "[FREE ] free.com\n"
             "[TAKEN] taken.com\n"
             "[?????] other.test\n"
             "[ERROR] example.zz: No whois server found for TLD .zz\n"
             "[ERROR] x.ad: No whois server found for TLD .ad\n"
             "[ERROR] host.down: whois query to whois.down.test failed: "
             "Connection refused\n");

    CHECK_EQ(asked.size(), 4u);
    CHECK_EQ(asked[0].first, "whois.verisign-grs.com");
    CHECK_EQ(asked[0].second, "domain free.com");
    CHECK_EQ(asked[2].first, "whois.example.test");
    CHECK_EQ(asked[2].second, "domain other.test");
    CHECK_EQ(asked[3].first, "whois.down.test");
  }

  // Without keep_going the first failure ends the run.
  {
    asked.clear();
    auto opts       = defaults();
    opts.keep_going = false;
    WHOIS::Driver      drv(reg, canned, opts);
    std::ostringstream os;
    try {
      drv.simple({"free.com", "example.zz", "taken.com"}, os);
      LOG(FATAL) << "should have thrown";
    }
    catch (WHOIS::resolution_error const& ex) {
      CHECK_EQ(ex.suffix(), ".zz");
    }
    CHECK_EQ(os.str(), "[FREE ] free.com\n");
    CHECK_EQ(asked.size(), 1u);

    try {
      drv.simple({"host.down"}, os);
      LOG(FATAL) << "should have thrown";
    }
    catch (WHOIS::query_error const& ex) {
      CHECK_EQ(ex.server(), "whois.down.test");
    }
  }

  // A fixed server skips the registry.
  {
    asked.clear();
    auto opts   = defaults();
    opts.server = "whois.verisign-grs.com";
    WHOIS::Driver      drv(reg, canned, opts);
    std::ostringstream os;
    drv.simple({"example.zz", "free.com"}, os);
    CHECK_EQ(os.str(), "[?????] example.zz\n[FREE ] free.com\n");
    CHECK_EQ(asked.size(), 2u);
    CHECK_EQ(asked[0].first, "whois.verisign-grs.com");
  }

  // Color on request.
  {
    auto opts  = defaults();
    opts.color = true;
    WHOIS::Driver      drv(reg, canned, opts);
    std::ostringstream os;
    drv.simple({"taken.com"}, os);
    CHECK_NE(os.str().find("\x1b["), std::string::npos);
    CHECK_NE(os.str().find("[TAKEN] taken.com"), std::string::npos);
  }

  // Host names reduced to their registered domain.
  {
    asked.clear();
    auto opts              = defaults();
    opts.registered_domain = true;
    WHOIS::Driver      drv(reg, canned, opts);
    std::ostringstream os;
    drv.lookup("www.taken.com", os);
    CHECK_EQ(asked.back().second, "taken.com");
    CHECK_EQ(os.str(), "Registrar: Example Registrar, Inc.\n");
  }
}
