#include "osutil.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const config_path = osutil::get_config_dir();
  auto const exe_path    = osutil::get_exe_path();

  fs::path argv0 = argv[0];
  CHECK_EQ(argv0.filename(), exe_path.filename());
  CHECK_EQ(config_path, exe_path.parent_path());

  CHECK_EQ(*osutil::get_port("43", "tcp"), 43);
  CHECK(!osutil::get_port("70000", "tcp"));
  CHECK(!osutil::get_port("no-such-service-at-all", "tcp"));

  // Not every system has whois in services(5).
  auto const whois = osutil::get_port("whois", "tcp");
  if (whois) {
    CHECK_EQ(*whois, 43);
  }
}
