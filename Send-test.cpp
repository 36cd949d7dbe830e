#include "Send.hpp"

#include "Reply.hpp"
#include "message.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {

auto constexpr mail_one
    = "From: a001 <a001@ah62.example.jp>\r\n"
      "Subject: one\r\n"
      "To: a002@ah62.example.jp\r\n"
      "Message-ID: <b0e564a5-4f70-761a-e103-70119d1bcb32@ah62.example.jp>\r\n"
      "Date: Sun, 26 Jul 2020 22:01:37 +0900\r\n"
      "\r\n"
      "body one\r\n";

// Bare LFs and a leading dot, sent as they are.
auto constexpr mail_two
    = "Subject: two\n"
      "Date: Sun, 26 Jul 2020 22:01:37 +0900\r\n"
      "\r\n"
      ".dot\n"
      "body two";

auto constexpr malformed = "Subject: no body\r\nDate: x\r\n";

auto constexpr ehlo_reply
    = "250-mx.example.com\r\n"
      "250-PIPELINING\r\n"
      "250 8BITMIME\r\n";

struct Session {
  std::string wire;    // what the client wrote
  std::string error;   // what it threw, if anything
  bool closed{false};  // and it was a ConnectionClosed
};

// With hang_up false the server goes quiet after its last reply, but
// keeps the connection open.
Session run_session(std::string const&              replies,
                    Settings const&                 settings,
                    std::vector<std::string> const& files,
                    bool                            hang_up = true)
{
  int fds[2];
  PCHECK(pipe(fds) == 0);
  // The whole script fits in the pipe.
  PCHECK(write(fds[1], replies.data(), replies.size())
         == static_cast<ssize_t>(replies.size()));
  if (hang_up)
    PCHECK(close(fds[1]) == 0);

  char out_path[]{"/tmp/Send-test-XXXXXX"};
  auto const fd_out{mkstemp(out_path)};
  PCHECK(fd_out != -1) << "mkstemp";

  Session session;
  {
    auto const timeouts{SMTP::Timeouts{std::chrono::milliseconds(100),
                                       std::chrono::milliseconds(100)}};
    SMTP::Connection conn(fds[0], fd_out, "test: ", timeouts);
    try {
      SMTP::send_messages(conn, settings, files);
    }
    catch (SMTP::ConnectionClosed const& e) {
      session.error  = e.what();
      session.closed = true;
    }
    catch (std::exception const& e) {
      session.error = e.what();
    }
  }
  if (!hang_up)
    PCHECK(close(fds[1]) == 0);

  std::ifstream     ifs(out_path, std::ios::binary);
  std::stringstream wire;
  wire << ifs.rdbuf();
  session.wire = wire.str();

  PCHECK(unlink(out_path) == 0) << "unlink " << out_path;
  return session;
}

Settings make_settings(bool update)
{
  Settings settings;
  settings.smtp_host         = "localhost";
  settings.from_address      = "a001@ah62.example.jp";
  settings.to_addresses      = {"a002@ah62.example.jp", "a003@ah62.example.jp"};
  settings.update_date       = update;
  settings.update_message_id = update;
  return settings;
}

std::string transaction(std::string_view mail)
{
  return fmt::format("MAIL FROM: <a001@ah62.example.jp>\r\n"
                     "RCPT TO: <a002@ah62.example.jp>\r\n"
                     "RCPT TO: <a003@ah62.example.jp>\r\n"
                     "DATA\r\n"
                     "{}\r\n.\r\n",
                     mail);
}

auto constexpr transaction_replies
    = "250 2.1.0 Ok\r\n"
      "250 2.1.5 Ok\r\n"
      "250 2.1.5 Ok\r\n"
      "354 End data with <CR><LF>.<CR><LF>\r\n"
      "250 2.0.0 Ok: queued\r\n";

class Test {
public:
  Test()
  {
    char tmplt[]{"/tmp/Send-test-dir-XXXXXX"};
    PCHECK(mkdtemp(tmplt) != nullptr);
    dir_ = tmplt;
  }
  ~Test() { fs::remove_all(dir_); }

  std::string eml(char const* name, std::string_view contents) const
  {
    auto const path{dir_ / name};
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(contents.data(), contents.size());
    return path.string();
  }
  std::string missing(char const* name) const { return (dir_ / name).string(); }
  std::string directory(char const* name) const
  {
    auto const path{dir_ / name};
    CHECK(fs::create_directory(path)) << path;
    return path.string();
  }

  void as_is();
  void updated();
  void skipped();
  void not_a_file();
  void nothing_to_send();
  void negative_reply();
  void connection_closed();
  void timed_out();

private:
  fs::path dir_;
};

// Byte for byte, one RSET between messages, one QUIT at the end.
void Test::as_is()
{
  auto const files{std::vector<std::string>{
      eml("one.eml", mail_one),
      missing("missing.eml"),
      eml("two.eml", mail_two),
      eml("malformed.eml", malformed),
  }};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + transaction_replies + "250 2.0.0 Ok\r\n"
                     + transaction_replies + "250 2.0.0 Ok\r\n"
                     + transaction_replies + "221 2.0.0 Bye\r\n"};

  auto const session{run_session(replies, make_settings(false), files)};
  CHECK_EQ(session.error, "");

  // Left as is, a malformed message goes too.
  auto const expected{"EHLO localhost\r\n"s + transaction(mail_one)
                      + "RSET\r\n" + transaction(mail_two) + "RSET\r\n"
                      + transaction(malformed) + "QUIT\r\n"};
  CHECK_EQ(session.wire, expected);
}

void Test::updated()
{
  auto const files{std::vector<std::string>{eml("one.eml", mail_one)}};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + transaction_replies + "221 2.0.0 Bye\r\n"};

  auto const session{run_session(replies, make_settings(true), files)};
  CHECK_EQ(session.error, "");

  auto const& wire{session.wire};
  auto const  data{wire.find("DATA\r\n")};
  CHECK_NE(data, std::string::npos);
  auto const mail_start{data + 6};
  auto const mail_end{wire.rfind("\r\n.\r\nQUIT\r\n")};
  CHECK_NE(mail_end, std::string::npos);

  auto const mail{std::string_view(wire).substr(mail_start,
                                                mail_end - mail_start)};
  auto const parts{message::split(mail)};
  CHECK(parts);
  CHECK_EQ(parts->body, "body one\r\n");

  auto const lines{message::get_lines(parts->header)};
  CHECK_EQ(lines.size(), 5U);
  CHECK_EQ(lines[1], "Subject: one\r\n");
  CHECK(message::is_message_id_line(lines[3]));
  CHECK(message::is_date_line(lines[4]));
  CHECK_EQ(mail.find("b0e564a5-4f70-761a-e103-70119d1bcb32"), std::string::npos);
  CHECK_EQ(mail.find("Sun, 26 Jul 2020 22:01:37 +0900"), std::string::npos);
}

// Missing and malformed files cost nothing on the wire, and the RSET
// is only for a message that went before.
void Test::skipped()
{
  auto const files{std::vector<std::string>{
      missing("missing.eml"),
      eml("malformed.eml", malformed),
      eml("one.eml", mail_one),
      eml("malformed2.eml", malformed),
      missing("missing2.eml"),
      eml("two.eml", mail_two),
  }};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + transaction_replies + "250 2.0.0 Ok\r\n"
                     + transaction_replies + "221 2.0.0 Bye\r\n"};

  auto const session{run_session(replies, make_settings(true), files)};
  CHECK_EQ(session.error, "");

  auto const& wire{session.wire};
  CHECK_EQ(wire.substr(0, 16 + 35), "EHLO localhost\r\n"
                                    "MAIL FROM: <a001@ah62.example.jp>\r\n");

  auto count = [&wire](std::string_view what) {
    auto n{0};
    for (auto pos{wire.find(what)}; pos != std::string::npos;
         pos = wire.find(what, pos + what.size())) {
      ++n;
    }
    return n;
  };
  CHECK_EQ(count("MAIL FROM:"), 2);
  CHECK_EQ(count("RSET\r\n"), 1);
  CHECK_EQ(count("QUIT\r\n"), 1);
  CHECK_EQ(count("Subject: no body"), 0);
  CHECK_LT(wire.find("body one"), wire.find("RSET\r\n"));
  CHECK_LT(wire.find("RSET\r\n"), wire.find("body two"));
  CHECK_EQ(wire.substr(wire.size() - 6), "QUIT\r\n");
}

// A directory named like an eml file is passed over, the session goes on.
void Test::not_a_file()
{
  auto const files{std::vector<std::string>{
      eml("first.eml", mail_one),
      directory("folder.eml"),
      eml("second.eml", mail_two),
  }};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + transaction_replies + "250 2.0.0 Ok\r\n"
                     + transaction_replies + "221 2.0.0 Bye\r\n"};

  auto const session{run_session(replies, make_settings(false), files)};
  CHECK_EQ(session.error, "");
  CHECK_EQ(session.wire, "EHLO localhost\r\n"s + transaction(mail_one)
                             + "RSET\r\n" + transaction(mail_two)
                             + "QUIT\r\n");
}

void Test::nothing_to_send()
{
  auto const files{std::vector<std::string>{missing("missing.eml")}};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + "221 2.0.0 Bye\r\n"};

  auto const session{run_session(replies, make_settings(true), files)};
  CHECK_EQ(session.error, "");
  CHECK_EQ(session.wire, "EHLO localhost\r\nQUIT\r\n");
}

// A negative reply ends the session where it stands, no QUIT.
void Test::negative_reply()
{
  auto const files{std::vector<std::string>{eml("one.eml", mail_one),
                                            eml("two.eml", mail_two)}};

  auto const replies{"220 mx.example.com ESMTP\r\n"s + ehlo_reply
                     + "250 2.1.0 Ok\r\n"
                       "550 5.1.1 <a002@ah62.example.jp>: user unknown\r\n"};

  auto const session{run_session(replies, make_settings(false), files)};
  CHECK_EQ(session.error, "550 5.1.1 <a002@ah62.example.jp>: user unknown");
  CHECK_EQ(session.wire, "EHLO localhost\r\n"
                         "MAIL FROM: <a001@ah62.example.jp>\r\n"
                         "RCPT TO: <a002@ah62.example.jp>\r\n");

  // Refused at the greeting.
  auto const refused{
      run_session("554 5.3.2 go away\r\n", make_settings(false), files)};
  CHECK_EQ(refused.error, "554 5.3.2 go away");
  CHECK_EQ(refused.wire, "");
}

void Test::connection_closed()
{
  auto const files{std::vector<std::string>{eml("one.eml", mail_one)}};

  auto const closed{run_session("220 mx.example.com ESMTP\r\n"s + ehlo_reply
                                    + "250 2.1.0 Ok\r\n",
                                make_settings(false), files)};
  CHECK_EQ(closed.error, "Connection closed by foreign host");
  CHECK_EQ(closed.wire, "EHLO localhost\r\n"
                        "MAIL FROM: <a001@ah62.example.jp>\r\n"
                        "RCPT TO: <a002@ah62.example.jp>\r\n");

  // The reply is cut off mid way.
  auto const cut{run_session("220-mx.example.com\r\n", make_settings(false),
                             files)};
  CHECK_EQ(cut.error, "Connection closed by foreign host");
  CHECK_EQ(cut.wire, "");
}

// The server stops answering: the read times out and the session ends
// as if the connection had closed.
void Test::timed_out()
{
  auto const files{std::vector<std::string>{eml("one.eml", mail_one)}};

  auto const session{run_session("220 mx.example.com ESMTP\r\n"s + ehlo_reply,
                                 make_settings(false), files, false)};
  CHECK(session.closed);
  CHECK_EQ(session.error, "Connection timed out waiting for a reply");
  CHECK_EQ(session.wire, "EHLO localhost\r\n"
                         "MAIL FROM: <a001@ah62.example.jp>\r\n");
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Test test;
  test.as_is();
  test.updated();
  test.skipped();
  test.not_a_file();
  test.nothing_to_send();
  test.negative_reply();
  test.connection_closed();
  test.timed_out();

  std::cout << "all Send tests passed\n";
}
