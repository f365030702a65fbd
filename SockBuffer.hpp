#ifndef SOCKBUFFER_DOT_HPP
#define SOCKBUFFER_DOT_HPP

#include <chrono>
#include <ios>

#include "POSIX.hpp"

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

// A boost::iostreams device over a connected socket.  End of stream
// and read errors both read as EOF; error() and timed_out() tell them
// apart.  A failed write sets badbit on the stream.

class SockBuffer
  : public boost::iostreams::device<boost::iostreams::bidirectional> {
public:
  SockBuffer(int                       fd,
             std::chrono::milliseconds read_timeout,
             std::chrono::milliseconds write_timeout);

  SockBuffer& operator=(const SockBuffer&) = delete;
  SockBuffer(SockBuffer const& that);

  bool timed_out() const { return timed_out_; }

  // The errno of the first failed read or write, or zero.
  int error() const { return error_; }

  std::streamsize read(char* s, std::streamsize n);
  std::streamsize write(const char* s, std::streamsize n);

  std::streamsize octets_read() const { return octets_read_; }
  std::streamsize octets_written() const { return octets_written_; }

private:
  int fd_;

  std::chrono::milliseconds read_timeout_;
  std::chrono::milliseconds write_timeout_;

  std::streamsize octets_read_{0};
  std::streamsize octets_written_{0};

  int error_{0};

  bool timed_out_{false};
  bool log_data_{false};
};

#endif // SOCKBUFFER_DOT_HPP
