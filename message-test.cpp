#include "message.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {

auto constexpr simple_mail
    = "From: a001 <a001@ah62.example.jp>\r\n"
      "Subject: test\r\n"
      "To: a002@ah62.example.jp\r\n"
      "Message-ID: <b0e564a5-4f70-761a-e103-70119d1bcb32@ah62.example.jp>\r\n"
      "Date: Sun, 26 Jul 2020 22:01:37 +0900\r\n"
      "User-Agent: Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:78.0) "
      "Gecko/20100101\r\n"
      " Thunderbird/78.0.1\r\n"
      "MIME-Version: 1.0\r\n"
      "Content-Type: text/plain; charset=utf-8; format=flowed\r\n"
      "Content-Transfer-Encoding: 7bit\r\n"
      "Content-Language: en-US\r\n"
      "\r\n"
      "test";

auto constexpr folded_mail
    = "From: a001 <a001@ah62.example.jp>\r\n"
      "Subject: test\r\n"
      "To: a002@ah62.example.jp\r\n"
      "Message-ID:\r\n"
      " <b0e564a5-4f70-761a-e103-70119d1bcb32@ah62.example.jp>\r\n"
      "Date:\r\n"
      " Sun, 26 Jul 2020\r\n"
      "\t22:01:37 +0900\r\n"
      "User-Agent: Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:78.0) "
      "Gecko/20100101\r\n"
      " Thunderbird/78.0.1\r\n"
      "MIME-Version: 1.0\r\n"
      "\r\n"
      "Date: in the body, not a header\r\n"
      "\r\n"
      " also body\r\n";

bool is_alnum(std::string_view s)
{
  return std::all_of(begin(s), end(s),
                     [](unsigned char c) { return std::isalnum(c); });
}

void test_get_lines()
{
  std::string_view const mail{simple_mail};
  auto const             lines{message::get_lines(mail)};

  CHECK_EQ(lines.size(), 13U);
  CHECK_EQ(lines[0], "From: a001 <a001@ah62.example.jp>\r\n");
  CHECK_EQ(lines[1], "Subject: test\r\n");
  CHECK_EQ(lines[2], "To: a002@ah62.example.jp\r\n");
  CHECK_EQ(lines[10], "Content-Language: en-US\r\n");
  CHECK_EQ(lines[11], "\r\n");
  CHECK_EQ(lines[12], "test");

  // Views into the buffer, end to end.
  CHECK(lines[0].data() == mail.data());
  std::string joined;
  for (auto const line : lines) {
    CHECK(line.data() == mail.data() + joined.size());
    joined.append(line.data(), line.size());
  }
  CHECK_EQ(joined, mail);

  CHECK(message::get_lines("").empty());

  auto const one{message::get_lines("no line ending")};
  CHECK_EQ(one.size(), 1U);
  CHECK_EQ(one[0], "no line ending");

  auto const lf{message::get_lines("a\nb\r\n")};
  CHECK_EQ(lf.size(), 2U);
  CHECK_EQ(lf[0], "a\n");
  CHECK_EQ(lf[1], "b\r\n");

  auto const blank{message::get_lines("\n\n")};
  CHECK_EQ(blank.size(), 2U);
}

void test_match_header_field()
{
  CHECK(message::is_date_line("Date: xxx"));
  CHECK(message::is_date_line("Date:"));
  CHECK(!message::is_date_line("xxx: Date"));
  CHECK(!message::is_date_line("X-Date: xxx"));
  CHECK(!message::is_date_line("date: xxx"));
  CHECK(!message::is_date_line("Date"));
  CHECK(!message::is_date_line(" Date: xxx"));

  CHECK(message::is_message_id_line("Message-ID: xxx"));
  CHECK(!message::is_message_id_line("xxx: Message-ID"));
  CHECK(!message::is_message_id_line("X-Message-ID: xxx"));
  CHECK(!message::is_message_id_line("Message-Id: xxx"));

  CHECK(message::is_folded_line(" folded"));
  CHECK(message::is_folded_line("\tfolded"));
  CHECK(!message::is_folded_line("Date: x"));
  CHECK(!message::is_folded_line(""));
}

void test_make_lines()
{
  auto const date{message::make_date_line()};
  CHECK_EQ(date.substr(0, 6), "Date: ");
  CHECK_EQ(date.substr(date.size() - 2), "\r\n");
  CHECK_LE(date.size(), 76U);
  // "Date: Sun, 26 Jul 2020 22:01:37 +0900\r\n"
  CHECK_EQ(date.size(), 39U);
  CHECK(date[9] == ',');
  CHECK(date[32] == '+' || date[32] == '-');

  auto const mid{message::make_message_id_line()};
  CHECK_EQ(mid.substr(0, 13), "Message-ID: <");
  CHECK_EQ(mid.substr(mid.size() - 3), ">\r\n");
  CHECK_LE(mid.size(), 80U);
  CHECK_EQ(mid.size(), 13U + 62U + 3U);
  CHECK(is_alnum(std::string_view(mid).substr(13, 62)));

  CHECK_NE(mid, message::make_message_id_line());
}

void test_find_blank_line()
{
  std::string_view const mail{simple_mail};
  auto const             idx{message::find_blank_line(mail)};
  CHECK_EQ(idx, mail.find("\r\n\r\n"));
  CHECK_EQ(mail.substr(idx + 4), "test");

  CHECK_EQ(message::find_blank_line("\r\n\r\n"), 0U);
  CHECK_EQ(message::find_blank_line("a\r\n\r\nb"), 1U);
  CHECK_EQ(message::find_blank_line(""), std::string_view::npos);
  CHECK_EQ(message::find_blank_line("a\r\nb\r\n"), std::string_view::npos);
  CHECK_EQ(message::find_blank_line("a\r\n\r"), std::string_view::npos);
  CHECK_EQ(message::find_blank_line("a\n\nb"), std::string_view::npos);
  CHECK_EQ(message::find_blank_line("a\r\r\n\r\nb"), 2U);
}

void test_split_combine()
{
  std::string_view const mail{simple_mail};

  auto const parts{message::split(mail)};
  CHECK(parts);
  CHECK_EQ(parts->header.substr(0, 5), "From:");
  // The blank line takes the last header line's CRLF with it.
  CHECK_EQ(parts->header.substr(parts->header.size() - 5), "en-US");
  CHECK_EQ(parts->body, "test");
  CHECK_EQ(message::combine(parts->header, parts->body), mail);

  auto const header{"Subject: x\r\nTo: y"s};
  auto const body{"line one\r\nline two\r\n"s};
  auto const again{message::split(message::combine(header, body))};
  CHECK(again);
  CHECK_EQ(again->header, header);
  CHECK_EQ(again->body, body);

  auto const empty_body{message::split("Subject: x\r\n\r\n")};
  CHECK(empty_body);
  CHECK_EQ(empty_body->header, "Subject: x");
  CHECK(empty_body->body.empty());

  CHECK(!message::split("Subject: x\r\nno blank line\r\n"));
  CHECK(!message::split("Subject: x\n\nbare LFs\n"));
}

void test_replace_header()
{
  auto const parts{message::split(simple_mail)};
  CHECK(parts);
  auto const lines{message::get_lines(parts->header)};

  CHECK(!message::replace_header(parts->header, false, false));

  auto const both{message::replace_header(parts->header, true, true)};
  CHECK(both);
  auto const repl_lines{message::get_lines(*both)};
  CHECK_EQ(repl_lines.size(), lines.size());
  for (auto i{0u}; i < lines.size(); ++i) {
    if (i == 3 || i == 4)
      continue;
    CHECK_EQ(lines[i], repl_lines[i]);
  }
  CHECK(message::is_message_id_line(repl_lines[3]));
  CHECK(message::is_date_line(repl_lines[4]));
  CHECK_NE(lines[3], repl_lines[3]);
  CHECK_NE(lines[4], repl_lines[4]);

  auto const date_only{message::replace_header(parts->header, true, false)};
  CHECK(date_only);
  auto const date_lines{message::get_lines(*date_only)};
  CHECK_EQ(date_lines[3], lines[3]);
  CHECK_NE(date_lines[4], lines[4]);

  auto const mid_only{message::replace_header(parts->header, false, true)};
  CHECK(mid_only);
  auto const mid_lines{message::get_lines(*mid_only)};
  CHECK_NE(mid_lines[3], lines[3]);
  CHECK_EQ(mid_lines[4], lines[4]);

  // Neither field present: nothing to do, but still a copy.
  auto const absent{"Subject: x\r\nX-Date: y\r\nX-Message-ID: z"s};
  auto const same{message::replace_header(absent, true, true)};
  CHECK(same);
  CHECK_EQ(*same, absent);

  // Only the first match is replaced.
  auto const twice{"Date: one\r\nDate: two\r\nSubject: x"s};
  auto const first{message::replace_header(twice, true, false)};
  CHECK(first);
  auto const first_lines{message::get_lines(*first)};
  CHECK_EQ(first_lines.size(), 3U);
  CHECK_NE(first_lines[0], "Date: one\r\n");
  CHECK_EQ(first_lines[1], "Date: two\r\n");
}

void test_replace_folded()
{
  auto const parts{message::split(folded_mail)};
  CHECK(parts);

  CHECK_EQ(message::get_lines(parts->header).size(), 11U);

  auto const header{message::replace_header(parts->header, true, true)};
  CHECK(header);
  auto const lines{message::get_lines(*header)};

  // The one continuation line of Message-ID: and the two of Date: are gone.
  CHECK_EQ(lines.size(), 8U);
  CHECK_EQ(lines[2], "To: a002@ah62.example.jp\r\n");
  CHECK(message::is_message_id_line(lines[3]));
  CHECK(message::is_date_line(lines[4]));
  CHECK_EQ(lines[5].substr(0, 11), "User-Agent:");

  // The fold of a field we don't touch stays.
  CHECK_EQ(lines[6], " Thunderbird/78.0.1\r\n");
  CHECK_EQ(lines[7], "MIME-Version: 1.0");

  // The body is never looked at, header-like lines in it included.
  auto const replaced{message::replace(folded_mail, true, true)};
  CHECK(replaced);
  auto const new_parts{message::split(*replaced)};
  CHECK(new_parts);
  CHECK_EQ(new_parts->body, parts->body);
  CHECK_EQ(new_parts->header, *header);
}

void test_replace_last_header_line()
{
  // Date: is the last header line, and folded, the blank line must
  // come out as one blank line.
  auto const mail{"Subject: x\r\n"
                  "Date: Sun, 26 Jul 2020\r\n"
                  " 22:01:37 +0900\r\n"
                  "\r\n"
                  "body\r\n"s};

  auto const replaced{message::replace(mail, true, false)};
  CHECK(replaced);
  auto const parts{message::split(*replaced)};
  CHECK(parts);
  CHECK_EQ(parts->body, "body\r\n");

  auto const lines{message::get_lines(parts->header)};
  CHECK_EQ(lines.size(), 2U);
  CHECK_EQ(lines[0], "Subject: x\r\n");
  CHECK(message::is_date_line(lines[1]));
  CHECK_NE(lines[1].back(), '\n');

  CHECK_EQ(replaced->find("\r\n\r\n"), replaced->rfind("\r\n\r\n"));
  CHECK_EQ(replaced->find("\r\n\r\n\r\n"), std::string::npos);

  // Same for Message-ID: on the last line, unfolded.
  auto const mid{"Subject: x\r\nMessage-ID: <a@b>\r\n\r\nbody"s};
  auto const new_mid{message::replace(mid, false, true)};
  CHECK(new_mid);
  CHECK_EQ(message::split(*new_mid)->body, "body");
  CHECK_EQ(message::get_lines(message::split(*new_mid)->header).size(), 2U);
}

void test_replace()
{
  std::string const mail{simple_mail};
  std::string const orig{mail};

  // Identity: nothing to build, send the original.
  CHECK(!message::replace(mail, false, false));
  CHECK(!message::replace("no blank line at all", false, false));

  auto const replaced{message::replace(mail, true, true)};
  CHECK(replaced);
  CHECK_NE(*replaced, mail);
  CHECK_EQ(mail, orig);

  auto const parts{message::split(*replaced)};
  CHECK(parts);
  CHECK_EQ(parts->body, message::split(mail)->body);

  auto const date_only{message::replace(mail, true, false)};
  CHECK(date_only);
  CHECK_EQ(date_only->find("Date: Sun, 26 Jul 2020 22:01:37 +0900"),
           std::string::npos);
  auto constexpr old_id
      = "Message-ID: <b0e564a5-4f70-761a-e103-70119d1bcb32@ah62.example.jp>";
  CHECK_NE(date_only->find(old_id), std::string::npos);

  auto threw{false};
  try {
    message::replace("Subject: x\r\nno blank line\r\n", true, true);
  }
  catch (message::MalformedMessage const& e) {
    threw = true;
    LOG(INFO) << "expected: " << e.what();
  }
  CHECK(threw);
}

void test_content()
{
  char path[]{"/tmp/message-test-XXXXXX"};
  auto const fd{mkstemp(path)};
  PCHECK(fd != -1) << "mkstemp";
  close(fd);

  {
    message::content const empty{path};
    CHECK(empty.empty());
    CHECK_EQ(std::string_view(empty), "");
  }

  // Bytes as they are, bare LF, NUL and 8 bit included.
  auto const bytes{"Subject: x\r\n\r\n\xff\x00 bare\n"s};
  {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(bytes.data(), bytes.size());
  }
  {
    message::content const eml{path};
    CHECK_EQ(eml.size(), bytes.size());
    CHECK_EQ(std::string_view(eml), bytes);
  }

  PCHECK(unlink(path) == 0) << "unlink " << path;
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  test_get_lines();
  test_match_header_field();
  test_make_lines();
  test_find_blank_line();
  test_split_combine();
  test_replace_header();
  test_replace_folded();
  test_replace_last_header_line();
  test_replace();
  test_content();

  std::cout << "all message tests passed\n";
}
