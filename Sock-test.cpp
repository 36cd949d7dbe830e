#include "Sock.hpp"

#include <cstring>
#include <iostream>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  // One descriptor for both directions, like a TCP connection.
  Sock sock(fds[0], fds[0],
            Timeouts{std::chrono::milliseconds(100),
                     std::chrono::milliseconds(100)},
            "test: ");

  auto const greeting{"220 ready\r\n"s};
  PCHECK(write(fds[1], greeting.data(), greeting.size())
         == static_cast<ssize_t>(greeting.size()));

  CHECK(sock.input_ready(std::chrono::milliseconds(100)));
  std::string line;
  CHECK(std::getline(sock.in(), line));
  CHECK_EQ(line, "220 ready\r");

  sock.out() << "EHLO localhost\r\n" << std::flush;
  CHECK(sock.out().good());

  char buf[64];
  auto const n{read(fds[1], buf, sizeof buf)};
  CHECK_EQ(std::string(buf, n), "EHLO localhost\r\n");

  // No reply coming.
  CHECK(!std::getline(sock.in(), line));
  CHECK(sock.timed_out());
  sock.log_stats();

  sock.close_fds();
  sock.close_fds(); // only the once

  // The peer sees the close.
  CHECK_EQ(read(fds[1], buf, sizeof buf), 0);
  PCHECK(close(fds[1]) == 0);

  std::cout << "sizeof(Sock) == " << sizeof(Sock) << '\n';
}
