#include "POSIX.hpp"

#include <cerrno>

#include <glog/logging.h>

#include <fcntl.h>
#include <sys/select.h>
#include <sys/socket.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;

namespace {
// A null tvp waits forever.
bool select_ready(int fd, bool for_read, timeval* tvp)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd, &fds);

  int puts;
  while ((puts = select(fd + 1, for_read ? &fds : nullptr,
                        for_read ? nullptr : &fds, nullptr, tvp))
         == -1) {
    PCHECK(errno == EINTR) << "select(2) failed";
  }

  return 0 != puts;
}

bool ready(int fd, bool for_read, milliseconds wait)
{
  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;
  return select_ready(fd, for_read, &tv);
}

// Wait for fd until end_time, or without limit if there is no timeout.
bool wait_for(int                       fd,
              bool                      for_read,
              milliseconds              timeout,
              steady_clock::time_point  end_time)
{
  if (timeout == Config::no_timeout)
    return select_ready(fd, for_read, nullptr);

  auto const now = steady_clock::now();
  if (now < end_time) {
    auto const time_left = duration_cast<milliseconds>(end_time - now);
    return ready(fd, for_read, time_left);
  }
  return false;
}

bool would_block(int err) { return (err == EWOULDBLOCK) || (err == EAGAIN); }
} // namespace

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return ready(fd_in, true, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return ready(fd_out, false, wait);
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);
    if (n_ret >= 0)
      return n_ret;

    auto const err = errno;
    if (err == EINTR)
      continue; // try read again

    if (!would_block(err)) {
      PLOG(WARNING) << "read(2) failed";
      errno = err;
      return -1;
    }

    if (wait_for(fd, true, timeout, end_time))
      continue;

    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

// The fd must be a socket: send(2) with MSG_NOSIGNAL keeps a peer that
// has gone away from raising SIGPIPE.

std::streamsize POSIX::write(int             fd,
                             char const*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret
        = ::send(fd, static_cast<void const*>(s), n - written, MSG_NOSIGNAL);

    if (n_ret == -1) {
      auto const err = errno;
      if (err == EINTR)
        continue; // try write again

      if (!would_block(err)) {
        PLOG(WARNING) << "send(2) failed";
        errno = err;
        return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    if (wait_for(fd, false, timeout, end_time))
      continue; // write some more

    t_o = true;
    LOG(WARNING) << "send(2) timed out";
    return -1;
  }
}
