#include "SockBuffer.hpp"

#include <cerrno>
#include <cstdlib>
#include <ios>
#include <string_view>

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <fmt/format.h>

DEFINE_bool(log_data, false, "log all WHOIS protocol data");

SockBuffer::SockBuffer(int                       fd,
                       std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout)
  : fd_(fd)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout)
{
  POSIX::set_nonblocking(fd_);
  log_data_ = (FLAGS_log_data || (getenv("GHWHOIS_LOG_DATA") != nullptr));
}

SockBuffer::SockBuffer(SockBuffer const& that)
  : fd_(that.fd_)
  , read_timeout_(that.read_timeout_)
  , write_timeout_(that.write_timeout_)
  , log_data_(that.log_data_)
{
  CHECK(!that.timed_out_);
  CHECK_EQ(that.error_, 0);
  CHECK_EQ(that.octets_read_, 0);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  if (error_ || timed_out_)
    return static_cast<std::streamsize>(-1);

  auto const read = POSIX::read(fd_, s, n, read_timeout_, timed_out_);
  if (read == static_cast<std::streamsize>(-1)) {
    if (!timed_out_)
      error_ = errno;
    return read;
  }
  if (read == 0) {
    return static_cast<std::streamsize>(-1); // EOF
  }

  octets_read_ += read;

  if (log_data_) {
    auto const str = std::string_view(s, static_cast<size_t>(read));
    LOG(INFO) << "< " << fmt::format("{:?}", str);
  }

  return read;
}

std::streamsize SockBuffer::write(const char* s, std::streamsize n)
{
  auto const written = POSIX::write(fd_, s, n, write_timeout_, timed_out_);
  if (written == static_cast<std::streamsize>(-1)) {
    if (!timed_out_)
      error_ = errno;
    // The stream buffer can't take a short write, the ostream turns
    // this into badbit.
    throw std::ios_base::failure(timed_out_ ? "write timed out"
                                            : "write failed");
  }

  octets_written_ += written;

  if (log_data_) {
    auto const str = std::string_view(s, static_cast<size_t>(written));
    LOG(INFO) << "> " << fmt::format("{:?}", str);
  }

  return written;
}
