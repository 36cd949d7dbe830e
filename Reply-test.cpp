#include "Reply.hpp"

#include <iostream>
#include <sstream>

#include <glog/logging.h>

using SMTP::Reply;

namespace {

std::string recv(char const* text)
{
  std::istringstream in{text};
  return Reply::recv(in, "test: ");
}

template <typename E>
std::string recv_throws(char const* text)
{
  try {
    recv(text);
  }
  catch (E const& e) {
    return e.what();
  }
  LOG(FATAL) << "no exception for " << text;
  return {};
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(Reply::is_last_line("250 OK"));
  CHECK(Reply::is_last_line("250 "));
  CHECK(Reply::is_last_line("250"));
  CHECK(Reply::is_last_line("999 whatever"));
  CHECK(!Reply::is_last_line("250-PIPELINING"));
  CHECK(!Reply::is_last_line("250-"));
  CHECK(!Reply::is_last_line("25 OK"));
  CHECK(!Reply::is_last_line("2500 OK"));
  CHECK(!Reply::is_last_line("OK 250"));
  CHECK(!Reply::is_last_line(" 250 OK"));
  CHECK(!Reply::is_last_line(""));

  CHECK(Reply::is_positive("220 ready"));
  CHECK(Reply::is_positive("250 OK"));
  CHECK(Reply::is_positive("354 go ahead"));
  CHECK(!Reply::is_positive("421 closing"));
  CHECK(!Reply::is_positive("550 no such user"));
  CHECK(!Reply::is_positive("150 huh"));
  CHECK(!Reply::is_positive(""));

  CHECK_EQ(recv("250 OK\r\n"), "250 OK");
  CHECK_EQ(recv("354 Start mail input; end with <CRLF>.<CRLF>\r\n"),
           "354 Start mail input; end with <CRLF>.<CRLF>");

  // Trailing whitespace goes, leading stays.
  CHECK_EQ(recv("250 OK  \t\r\n"), "250 OK");

  // A multi-line reply is read to its last line, and no further.
  std::istringstream ehlo{"250-mx.example.com\r\n"
                          "250-PIPELINING\r\n"
                          "250-8BITMIME\r\n"
                          "250 SMTPUTF8\r\n"
                          "221 bye\r\n"};
  CHECK_EQ(Reply::recv(ehlo, ""), "250 SMTPUTF8");
  CHECK_EQ(Reply::recv(ehlo, ""), "221 bye");

  CHECK_EQ(recv("250\r\n"), "250");
  CHECK_EQ(recv("250 no line ending"), "250 no line ending");

  CHECK_EQ(recv_throws<SMTP::NegativeReply>("550 no such user\r\n"),
           "550 no such user");
  CHECK_EQ(recv_throws<SMTP::NegativeReply>("250-first\r\n451 try later\r\n"),
           "451 try later");

  try {
    recv("554 go away\r\n");
  }
  catch (SMTP::NegativeReply const& e) {
    CHECK_EQ(e.reply(), "554 go away");
  }

  CHECK_EQ(recv_throws<SMTP::ConnectionClosed>(""),
           "Connection closed by foreign host");
  CHECK_EQ(recv_throws<SMTP::ConnectionClosed>("250-more to come\r\n"),
           "Connection closed by foreign host");
  CHECK_EQ(recv_throws<SMTP::ConnectionClosed>("garbage\r\n"),
           "Connection closed by foreign host");

  std::cout << "all Reply tests passed\n";
}
