#include "WHOIS-driver.hpp"
#include "WHOIS-registry.hpp"
#include "WHOIS.hpp"
#include "fs.hpp"
#include "osutil.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/color.h>
#include <fmt/format.h>

DEFINE_string(server, "", "whois server to query, bypassing the TLD registry");
DEFINE_string(input, "", "file of domains, one per line, with --simple only");
DEFINE_bool(simple, false, "simple output: free or taken");
DEFINE_bool(list, false, "display the whois servers");

DEFINE_string(registry, "", "registry file to add to the built-in servers");
DEFINE_string(service, "whois", "service name or port number");
DEFINE_uint64(timeout, 60, "seconds to wait on a server, 0 to wait forever");

DEFINE_bool(keep_going, true, "carry on with the next domain after a failure");
DEFINE_bool(registered_domain,
            false,
            "query the registered domain of a host name (www.example.com "
            "becomes example.com)");
DEFINE_bool(color, true, "color the output on a terminal");

bool validate_timeout(char const* flagname, uint64_t value)
{
  if (WHOIS::valid_timeout(value))
    return true;
  LOG(ERROR) << "--" << flagname << "=" << value << " is more than "
             << std::chrono::seconds(Config::max_timeout).count()
             << " seconds";
  return false;
}

DEFINE_validator(timeout, &validate_timeout);

namespace {
auto constexpr registry_file = "whois-servers";

bool use_color(FILE* fp) { return FLAGS_color && isatty(fileno(fp)); }

void print_in(FILE* fp, fmt::color color, std::string const& line)
{
  if (use_color(fp))
    fmt::print(fp, fmt::fg(color), "{}\n", line);
  else
    fmt::print(fp, "{}\n", line);
}

WHOIS::Registry get_registry()
{
  auto path = fs::path(FLAGS_registry);
  if (path.empty()) {
    path = osutil::get_config_dir() / registry_file;
    if (!fs::exists(path))
      return WHOIS::Registry::root_zone();
  }
  LOG(INFO) << "adding servers from " << path;
  return WHOIS::Registry::root_zone().merged(WHOIS::Registry::load(path));
}

int run(int argc, char* argv[])
{
  auto const port = osutil::get_port(FLAGS_service.c_str(), "tcp")
                        .value_or(Config::whois_port);
  auto const timeout = std::chrono::milliseconds(
      std::chrono::seconds(static_cast<int64_t>(FLAGS_timeout)));

  auto query = [port, timeout](std::string const& server,
                               std::string_view   text) {
    return WHOIS::query(server, text, timeout, port);
  };

  WHOIS::Driver::options opts;
  opts.server            = FLAGS_server;
  opts.keep_going        = FLAGS_keep_going;
  opts.registered_domain = FLAGS_registered_domain;
  opts.color             = use_color(stdout);

  WHOIS::Driver drv(get_registry(), query, opts);

  if (FLAGS_list) {
    drv.list(std::cout);
    return 0;
  }

  std::optional<std::string> domain;
  for (int a = 1; a < argc; ++a) {
    if (domain)
      throw std::runtime_error(fmt::format("Unknown argument: {}", argv[a]));
    domain = argv[a];
  }

  if (FLAGS_simple) {
    auto const domains = !FLAGS_input.empty()
                             ? WHOIS::read_domains(FLAGS_input)
                             : std::vector<std::string>{domain.value_or("")};
    if (domains.size() == 1 && domains.front().empty())
      throw std::runtime_error("Domain is missing!");
    drv.simple(domains, std::cout);
    return 0;
  }

  if (!FLAGS_input.empty())
    throw std::runtime_error("--input works with --simple only");

  if (!domain)
    throw std::runtime_error("Domain is missing!");

  drv.lookup(*domain, std::cout);
  return 0;
}
} // namespace

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage(R"(look up a domain in whois

  whois [options] domain

Examples:
  whois --list
  whois google.com
  whois --simple --input=domainlist.txt
  whois --server=whois.iana.org google.com)");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  google::InitGoogleLogging(argv[0]);

  if (argc == 1 && !FLAGS_list && FLAGS_input.empty()) {
    std::cout << gflags::ProgramUsage() << '\n';
    return 0;
  }

  try {
    return run(argc, argv);
  }
  catch (std::exception const& ex) {
    LOG(ERROR) << ex.what();
    std::fflush(stdout);
    print_in(stderr, fmt::color::red, ex.what());
    return 1;
  }
}
