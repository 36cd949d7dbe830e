#ifndef REPLY_DOT_HPP
#define REPLY_DOT_HPP

#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace SMTP {

// The peer went away, or stopped talking, before finishing a reply.
class ConnectionClosed : public std::runtime_error {
public:
  ConnectionClosed()
    : std::runtime_error("Connection closed by foreign host")
  {
  }
  using std::runtime_error::runtime_error;
};

// A 4xx or 5xx reply, what() is the whole line.
class NegativeReply : public std::runtime_error {
public:
  explicit NegativeReply(std::string const& reply)
    : std::runtime_error(reply)
  {
  }
  std::string reply() const { return what(); }
};

class Reply {
public:
  // Reply-code SP, or a bare Reply-code: the last line of a reply.
  // Reply-code "-" is a continuation.
  static bool is_last_line(std::string_view line);

  // 2yz and 3yz.
  static bool is_positive(std::string_view line);

  // Reads one reply, a line at a time, logging every line.  Returns the
  // last line of a positive reply, throws NegativeReply for any other,
  // and ConnectionClosed if the input ends first.
  static std::string recv(std::istream& in, std::string_view log_prefix);
};

} // namespace SMTP

#endif // REPLY_DOT_HPP
