#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ios>
#include <string>

// The system calls under a client connection, each failure logged.
// Nothing here aborts: a peer that misbehaves is an error to report.

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  // A stream socket connected to the first address of host that takes
  // it, IPv4 or IPv6.  Returns -1 if none does.
  static int connect(std::string const& host, uint16_t port);

  static void close(int fd);

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  // Returns the octets read, zero at end of file, and -1 on error or
  // when nothing came within timeout; t_o is set for the latter.
  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  // All n octets, or -1.
  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);
};

#endif // POSIX_DOT_HPP
