#ifndef SEND_DOT_HPP
#define SEND_DOT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "Settings.hpp"
#include "Sock.hpp"
#include "fs.hpp"

namespace SMTP {

using ::Timeouts;

// One client connection, closed when it goes away.
class Connection {
public:
  Connection(int         fd_in,
             int         fd_out,
             std::string log_prefix = "",
             Timeouts    timeouts   = Timeouts{});

  Connection(Connection const&) = delete;
  Connection& operator=(Connection const&) = delete;

  // Throws std::runtime_error if no address of host will take a
  // connection.
  static std::unique_ptr<Connection> open(std::string const& host,
                                          uint16_t           port,
                                          std::string        log_prefix = "",
                                          Timeouts timeouts = Timeouts{});

  Sock sock;

  // Leads every log line, "id: 2, " for a parallel worker, empty
  // otherwise.
  std::string const prefix;
};

// Reads one reply, see Reply::recv.
std::string recv_line(Connection& conn);

// Writes cmd and CRLF, waits for the reply.  Fatal replies throw.
std::string send_line(Connection& conn, std::string_view cmd);

void send_hello(Connection& conn);
void send_from(Connection& conn, std::string_view from_address);
void send_rcpt_to(Connection& conn, std::vector<std::string> const& to_addresses);
void send_data(Connection& conn);
void send_crlf_dot(Connection& conn);
void send_rset(Connection& conn);
void send_quit(Connection& conn);

// The message bytes themselves, written as is.
void send_mail(Connection& conn, fs::path const& path, std::string_view mail);

// The whole conversation, greeting to QUIT, for the eml files in
// order.  Missing and malformed files are skipped; a negative reply
// or a lost connection ends it with an exception.
void send_messages(Connection&                     conn,
                   Settings const&                 settings,
                   std::vector<std::string> const& eml_files);

} // namespace SMTP

#endif // SEND_DOT_HPP
