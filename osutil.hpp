#ifndef OSUTIL_DOT_HPP_INCLUDED
#define OSUTIL_DOT_HPP_INCLUDED

#include <cstdint>
#include <optional>

#include "fs.hpp"

namespace osutil {
fs::path get_config_dir();
fs::path get_exe_path();

// Port number for a numeric service, or from services(5).
std::optional<uint16_t> get_port(char const* const service,
                                 char const* const proto);
} // namespace osutil

#endif // OSUTIL_DOT_HPP_INCLUDED
