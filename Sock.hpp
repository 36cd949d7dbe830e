#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <chrono>
#include <istream>
#include <ostream>
#include <string>

#include "SockBuffer.hpp"

// Owns the descriptors of one connection: closed by close_fds() or on
// destruction, whichever comes first.
class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int         fd_in,
       int         fd_out,
       Timeouts    timeouts   = Timeouts{},
       std::string log_prefix = "");
  ~Sock();

  bool input_ready(std::chrono::milliseconds wait)
  {
    return iostream_->input_ready(wait);
  }
  bool timed_out() { return iostream_->timed_out(); }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  void log_stats() { iostream_->log_stats(); }

  void close_fds();

private:
  boost::iostreams::stream<SockBuffer> iostream_;

  int fd_in_;
  int fd_out_;
};

#endif // SOCK_DOT_HPP
