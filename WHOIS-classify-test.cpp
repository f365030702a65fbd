#include "WHOIS-classify.hpp"

#include <stdexcept>
#include <string>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const& cls    = WHOIS::Classifier::standard();
  auto constexpr vgrs = "whois.verisign-grs.com";

  CHECK(cls.has_rule(vgrs));
  CHECK(!cls.has_rule("whois.pir.org"));

  CHECK_EQ(cls.classify(vgrs, R"(No match for domain "EXAMPLE.COM")",
                        "example.com"),
           WHOIS::status::free);
  CHECK_EQ(cls.classify(vgrs, "Registrar: Example Registrar Inc.",
                        "example.com"),
           WHOIS::status::taken);
  CHECK_EQ(cls.classify(vgrs, "some unrelated text", "example.com"),
           WHOIS::status::unknown);

  auto const response = R"(
   Domain Name: GOOGLE.COM
   Registry Domain ID: 2138514_DOMAIN_COM-VRSN
   Registrar WHOIS Server: whois.markmonitor.com
   Registrar: MarkMonitor Inc.
)"s;
  CHECK_EQ(cls.classify(vgrs, response, "google.com"), WHOIS::status::taken);

  // The phrase must name the domain that was asked about.
  CHECK_EQ(cls.classify(vgrs, R"(No match for domain "OTHER.COM")",
                        "example.com"),
           WHOIS::status::unknown);
  CHECK_EQ(cls.classify(vgrs, R"(No match for domain "example.com")",
                        "example.com"),
           WHOIS::status::unknown);

  // Free wins over taken.
  CHECK_EQ(cls.classify(vgrs,
                        "No match for domain \"EXAMPLE.COM\"\nRegistrar:",
                        "example.com"),
           WHOIS::status::free);

  // Host names compare without regard to case.
  CHECK_EQ(cls.classify("WHOIS.Verisign-GRS.com", "Registrar: x",
                        "example.com"),
           WHOIS::status::taken);

  // No rule for the server.
  CHECK_EQ(cls.classify("whois.pir.org", "Registrar: x", "example.org"),
           WHOIS::status::unknown);
  CHECK_EQ(cls.classify("", "", ""), WHOIS::status::unknown);

  auto const junk = "\0\xff\xfe\x80 Registrar\r\n\0"s;
  CHECK_EQ(cls.classify(vgrs, junk, "example.com"), WHOIS::status::unknown);
  CHECK_EQ(cls.classify(vgrs, junk, junk), WHOIS::status::unknown);

  // Same inputs, same answer.
  for (auto i = 0; i < 3; ++i) {
    CHECK_EQ(cls.classify(vgrs, response, "google.com"), WHOIS::status::taken);
  }

  WHOIS::Classifier custom;
  CHECK_EQ(custom.classify(vgrs, response, "google.com"),
           WHOIS::status::unknown);

  custom.add_rule("whois.pir.org",
                  WHOIS::phrase_matcher("NOT FOUND", "Registry Domain ID:"));
  CHECK_EQ(custom.classify("whois.pir.org", "NOT FOUND", "example.org"),
           WHOIS::status::free);
  CHECK_EQ(custom.classify("whois.pir.org", "Registry Domain ID: D123",
                           "example.org"),
           WHOIS::status::taken);

  custom.add_rule("whois.example.test",
                  [](std::string_view response, std::string_view domain) {
                    return response == domain ? WHOIS::status::free
                                              : WHOIS::status::taken;
                  });
  CHECK_EQ(custom.classify("whois.example.test", "a.test", "a.test"),
           WHOIS::status::free);
  CHECK_EQ(custom.classify("whois.example.test", "b.test", "a.test"),
           WHOIS::status::taken);

  // Replace a rule.
  custom.add_rule("whois.example.test",
                  [](std::string_view, std::string_view) {
                    return WHOIS::status::unknown;
                  });
  CHECK_EQ(custom.classify("whois.example.test", "a.test", "a.test"),
           WHOIS::status::unknown);

  // A rule that throws is no worse than no rule.
  custom.add_rule("whois.broken.test",
                  [](std::string_view, std::string_view) -> WHOIS::status {
                    throw std::runtime_error("broken rule");
                  });
  CHECK_EQ(custom.classify("whois.broken.test", "Registrar:", "a.test"),
           WHOIS::status::unknown);

  custom.add_rule("whois.odd.test",
                  [](std::string_view, std::string_view) -> WHOIS::status {
                    throw 42;
                  });
  CHECK_EQ(custom.classify("whois.odd.test", "Registrar:", "a.test"),
           WHOIS::status::unknown);

  // A brace in the phrase is a format error, caught like any other.
  custom.add_rule("whois.badfmt.test",
                  WHOIS::phrase_matcher("No match {", "Registrar:"));
  CHECK_EQ(custom.classify("whois.badfmt.test", "Registrar:", "a.test"),
           WHOIS::status::unknown);

  CHECK_EQ(std::string(WHOIS::c_str(WHOIS::status::free)), "free");
  CHECK_EQ(std::string(WHOIS::c_str(WHOIS::status::taken)), "taken");
  CHECK_EQ(std::string(WHOIS::c_str(WHOIS::status::unknown)), "unknown");
}
