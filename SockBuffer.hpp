#ifndef SOCKBUFFER_DOT_HPP
#define SOCKBUFFER_DOT_HPP

#include <chrono>
#include <ios>
#include <string>

#include "POSIX.hpp"

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace Config {
constexpr auto read_timeout_default  = std::chrono::seconds(30);
constexpr auto write_timeout_default = std::chrono::minutes(3);
} // namespace Config

// How long a single read or write may wait on the peer, for every
// operation over the life of a connection.
struct Timeouts {
  std::chrono::milliseconds read{Config::read_timeout_default};
  std::chrono::milliseconds write{Config::write_timeout_default};
};

// The client end of an SMTP connection as a boost::iostreams device.
// Input ends at end of file, on a reset, or when a read times out.
// Once a write fails every later write fails at once, the stream goes
// bad and stays that way.
class SockBuffer
  : public boost::iostreams::device<boost::iostreams::bidirectional> {
public:
  SockBuffer(int fd_in, int fd_out, Timeouts timeouts, std::string log_prefix);

  SockBuffer& operator=(const SockBuffer&) = delete;
  SockBuffer(SockBuffer const& that);

  bool input_ready(std::chrono::milliseconds wait) const
  {
    return POSIX::input_ready(fd_in_, wait);
  }
  bool timed_out() const { return timed_out_; }

  std::streamsize octets_read() const { return octets_read_; }
  std::streamsize octets_written() const { return octets_written_; }

  std::streamsize read(char* s, std::streamsize n);
  std::streamsize write(const char* s, std::streamsize n);

  void log_stats() const;

private:
  int fd_in_;
  int fd_out_;

  Timeouts    timeouts_;
  std::string log_prefix_;

  std::streamsize octets_read_{0};
  std::streamsize octets_written_{0};

  bool timed_out_{false};
  bool write_failed_{false};
};

#endif // SOCKBUFFER_DOT_HPP
