#include "TLD.hpp"

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  TLD tld;

  CHECK(tld.registered_domain("example.com"));
  CHECK_EQ(*tld.registered_domain("example.com"), "example.com");
  CHECK_EQ(*tld.registered_domain("www.example.com"), "example.com");
  CHECK_EQ(*tld.registered_domain("www.example.co.uk"), "example.co.uk");
  CHECK_EQ(*tld.registered_domain("outmail14.phi.meetup.com"), "meetup.com");

  CHECK(!tld.registered_domain("not_a_domain_at_all"));
  CHECK(!tld.registered_domain(".com"));
  CHECK(!tld.registered_domain("."));
  CHECK(!tld.registered_domain("co.uk"));

  CHECK(tld.is_public_suffix("com"));
  CHECK(tld.is_public_suffix("co.uk"));
  CHECK(!tld.is_public_suffix("example.com"));
}
