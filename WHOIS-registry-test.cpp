#include "WHOIS-registry.hpp"

#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include <glog/logging.h>

#include <fmt/format.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const& db = WHOIS::Registry::root_zone();
  CHECK_EQ(db.size(), 750u);
  CHECK_EQ(&db, &WHOIS::Registry::root_zone());

  for (auto const& [suffix, server] : db) {
    CHECK_EQ(suffix.front(), '.') << suffix;
    CHECK_EQ(suffix, WHOIS::normalize_suffix(suffix)) << suffix;
    if (server)
      CHECK(!server->empty()) << suffix;
  }

  auto const com = db.find(".com");
  CHECK_NOTNULL(com);
  CHECK(com->has_value());
  CHECK_EQ(**com, "whois.verisign-grs.com");

  auto const com_uc = db.find(".COM");
  CHECK_EQ(com, com_uc);

  CHECK_EQ(**db.find(".org"), "whois.pir.org");
  CHECK_EQ(**db.find(".uk"), "whois.nic.uk");

  // Known, but no public server.
  auto const ad = db.find(".ad");
  CHECK_NOTNULL(ad);
  CHECK(!ad->has_value());
  CHECK(db.contains(".ad"));

  // Not known at all.
  CHECK(db.find(".zz") == nullptr);
  CHECK(!db.contains(".zz"));
  CHECK(db.find("com") == nullptr);
  CHECK(db.find("") == nullptr);

  WHOIS::Registry const small{
      {".Test", "whois.example.test"},
      {".none", std::nullopt},
  };
  CHECK_EQ(small.size(), 2u);
  CHECK_EQ(**small.find(".test"), "whois.example.test");
  CHECK(!small.find(".NONE")->has_value());

  try {
    WHOIS::Registry const dup{
        {".dup", "whois.one.test"},
        {".DUP", "whois.two.test"},
    };
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK_EQ(ex.what(), "duplicate entry for suffix «.dup»"s);
  }

  try {
    WHOIS::Registry const bad{{"com", "whois.verisign-grs.com"}};
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK_EQ(ex.what(), "suffix «com» must be a dot followed by a label"s);
  }

  auto constexpr text = R"(# test registry
.alpha      whois.alpha.test
.beta       -                  # no public server
  .Gamma	whois-gamma.example.test

.com        whois.override.test
)";

  auto const parsed = WHOIS::Registry::parse(text, "text");
  CHECK_EQ(parsed.size(), 4u);
  CHECK_EQ(**parsed.find(".alpha"), "whois.alpha.test");
  CHECK(!parsed.find(".beta")->has_value());
  CHECK_EQ(**parsed.find(".gamma"), "whois-gamma.example.test");

  // Overrides replace, everything else is kept.
  auto const merged = db.merged(parsed);
  CHECK_EQ(merged.size(), db.size() + 3);
  CHECK_EQ(**merged.find(".com"), "whois.override.test");
  CHECK_EQ(**merged.find(".net"), "whois.verisign-grs.com");
  CHECK_EQ(**db.find(".com"), "whois.verisign-grs.com");

  CHECK(WHOIS::Registry::parse("", "empty").empty());
  CHECK_EQ(WHOIS::Registry::parse(".last whois.last.test", "no-eol").size(), 1u);

  try {
    WHOIS::Registry::parse(".one whois.one.test\n.one -\n", "dups");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK_EQ(ex.what(), "dups:2: duplicate entry for suffix «.one»"s);
  }

  try {
    WHOIS::Registry::parse(".ok whois.ok.test\nnot a registry line\n", "junk");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK_NE(std::string(ex.what()).find("junk"), std::string::npos);
  }

  try {
    WHOIS::Registry::parse(".nohost\n", "short");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const&) {
  }

  auto const path = fs::temp_directory_path()
                    / fmt::format("whois-servers-{}", getpid());
  {
    std::ofstream out(path);
    out << text;
  }
  auto const loaded = WHOIS::Registry::load(path);
  CHECK_EQ(loaded.size(), parsed.size());
  CHECK_EQ(**loaded.find(".com"), "whois.override.test");
  fs::remove(path);

  try {
    WHOIS::Registry::load(path);
    LOG(FATAL) << "should have thrown";
  }
  catch (std::runtime_error const&) {
  }
}
