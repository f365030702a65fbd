#include "POSIX.hpp"

#include <cerrno>
#include <chrono>
#include <string>

#include <sys/socket.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], 1ms));
  CHECK(POSIX::output_ready(fds[1], 1ms));

  bool t_o = false;

  auto const msg = std::string("domain example.com\r\n");
  CHECK_EQ(POSIX::write(fds[1], msg.data(), msg.size(), 1s, t_o),
           static_cast<std::streamsize>(msg.size()));
  CHECK(!t_o);

  CHECK(POSIX::input_ready(fds[0], 1ms));

  char buf[64];
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof(buf), Config::no_timeout, t_o),
           static_cast<std::streamsize>(msg.size()));
  CHECK_EQ(std::string(buf, msg.size()), msg);

  // Nothing to read.
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof(buf), 10ms, t_o), -1);
  CHECK(t_o);

  // End of file.
  t_o = false;
  close(fds[1]);
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof(buf), 1s, t_o), 0);
  CHECK(!t_o);

  // Peer is gone, no SIGPIPE, just an error.
  CHECK_EQ(POSIX::write(fds[0], msg.data(), msg.size(), 1s, t_o), -1);
  CHECK(!t_o);
  CHECK_EQ(errno, EPIPE);

  close(fds[0]);
}
