#include "osutil.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(config_dir, "", "path to support/config files");

namespace osutil {

fs::path get_config_dir()
{
  if (!FLAGS_config_dir.empty()) {
    return FLAGS_config_dir;
  }
  return get_exe_path().parent_path();
}

fs::path get_exe_path()
{
  auto constexpr exe = "/proc/self/exe";

  auto constexpr max_link = 4 * 1024;
  char buf[max_link];

  auto const len{::readlink(exe, buf, max_link)};

  PCHECK(len != -1) << "readlink";
  if (len == max_link) {
    LOG(FATAL) << exe << " link too long";
  }
  buf[len] = '\0';
  return fs::path(buf);
}

std::optional<uint16_t> get_port(char const* const service,
                                 char const* const proto)
{
  char*      ep = nullptr;
  auto const service_no{strtoul(service, &ep, 10)};
  if (ep && (ep != service) && (*ep == '\0')) {
    if (service_no > std::numeric_limits<uint16_t>::max()) {
      LOG(WARNING) << "port " << service << " out of range";
      return {};
    }
    return static_cast<uint16_t>(service_no);
  }

  std::vector<char> str_buf(1024); // suggested by getservbyname_r(3)

  auto     result_buf{servent{}};
  servent* result_ptr = nullptr;
  while (getservbyname_r(service, proto, &result_buf, str_buf.data(),
                         str_buf.size(), &result_ptr)
         == ERANGE) {
    CHECK_LT(str_buf.size(), 64 * 1024); // ridiculous
    str_buf.resize(str_buf.size() * 2);
  }
  if (result_ptr == nullptr) {
    LOG(WARNING) << "service " << service << " unknown";
    return {};
  }
  return ntohs(result_buf.s_port);
}

} // namespace osutil
