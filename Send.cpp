#include "Send.hpp"

#include "POSIX.hpp"
#include "Reply.hpp"
#include "message.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <glog/logging.h>

#include <boost/algorithm/string/replace.hpp>

namespace {

// The CRLF-dot terminator is logged as "<CRLF>.", not as a line break.
std::string printable(std::string_view cmd)
{
  return boost::algorithm::replace_all_copy(std::string(cmd), "\r\n",
                                            "<CRLF>");
}

} // namespace

namespace SMTP {

Connection::Connection(int         fd_in,
                       int         fd_out,
                       std::string log_prefix,
                       Timeouts    timeouts)
  : sock(fd_in, fd_out, timeouts, log_prefix)
  , prefix(std::move(log_prefix))
{
}

std::unique_ptr<Connection> Connection::open(std::string const& host,
                                             uint16_t           port,
                                             std::string        log_prefix,
                                             Timeouts           timeouts)
{
  auto const fd = POSIX::connect(host, port);
  if (fd == -1)
    throw std::runtime_error(fmt::format("can't connect to {}:{}", host, port));

  return std::make_unique<Connection>(fd, fd, std::move(log_prefix), timeouts);
}

std::string recv_line(Connection& conn)
{
  try {
    return Reply::recv(conn.sock.in(), conn.prefix);
  }
  catch (ConnectionClosed const&) {
    if (conn.sock.timed_out())
      throw ConnectionClosed("Connection timed out waiting for a reply");
    throw;
  }
}

std::string send_line(Connection& conn, std::string_view cmd)
{
  LOG(INFO) << conn.prefix << "send: " << printable(cmd);

  conn.sock.out() << cmd << "\r\n" << std::flush;
  if (!conn.sock.out().good()) {
    conn.sock.log_stats();
    throw ConnectionClosed(fmt::format("failed to send \"{}\"", printable(cmd)));
  }

  return recv_line(conn);
}

void send_hello(Connection& conn) { send_line(conn, "EHLO localhost"); }

void send_from(Connection& conn, std::string_view from_address)
{
  send_line(conn, fmt::format("MAIL FROM: <{}>", from_address));
}

void send_rcpt_to(Connection& conn, std::vector<std::string> const& to_addresses)
{
  for (auto const& addr : to_addresses) {
    send_line(conn, fmt::format("RCPT TO: <{}>", addr));
  }
}

void send_data(Connection& conn) { send_line(conn, "DATA"); }

void send_crlf_dot(Connection& conn) { send_line(conn, "\r\n."); }

void send_rset(Connection& conn) { send_line(conn, "RSET"); }

void send_quit(Connection& conn) { send_line(conn, "QUIT"); }

void send_mail(Connection& conn, fs::path const& path, std::string_view mail)
{
  LOG(INFO) << conn.prefix << "send: " << path.string();

  conn.sock.out().write(mail.data(), mail.size());
  conn.sock.out() << std::flush;
  if (!conn.sock.out().good()) {
    conn.sock.log_stats();
    throw ConnectionClosed(
        fmt::format("{}: failed to send message", path.string()));
  }
}

void send_messages(Connection&                     conn,
                   Settings const&                 settings,
                   std::vector<std::string> const& eml_files)
{
  recv_line(conn); // greeting
  send_hello(conn);

  auto reset{false};
  for (auto const& file : eml_files) {
    // A directory, or anything else that isn't a file, counts as missing.
    if (!fs::is_regular_file(file)) {
      LOG(WARNING) << conn.prefix << file << ": EML file does not exist";
      continue;
    }

    // Read and rewrite before starting the transaction, a message we
    // can't send is skipped and costs nothing on the wire.
    std::optional<message::content> eml;
    std::optional<std::string>      replaced;
    try {
      eml.emplace(file);
      replaced = message::replace(*eml, settings.update_date,
                                  settings.update_message_id);
    }
    catch (message::MalformedMessage const& e) {
      LOG(ERROR) << conn.prefix << file << ": " << e.what();
      continue;
    }
    catch (std::exception const& e) {
      throw std::runtime_error(fmt::format("{}: {}", file, e.what()));
    }

    if (reset) {
      LOG(INFO) << conn.prefix << "---";
      send_rset(conn);
    }

    send_from(conn, settings.from_address);
    send_rcpt_to(conn, settings.to_addresses);
    send_data(conn);
    send_mail(conn, file,
              replaced ? std::string_view(*replaced) : std::string_view(*eml));
    send_crlf_dot(conn);

    reset = true;
  }

  send_quit(conn);
}

} // namespace SMTP
