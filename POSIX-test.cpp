#include "POSIX.hpp"

#include <csignal>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using std::chrono::milliseconds;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::signal(SIGPIPE, SIG_IGN);

  int fds[2];
  PCHECK(pipe(fds) == 0);
  auto const [rd, wr] = fds;

  POSIX::set_nonblocking(rd);
  POSIX::set_nonblocking(wr);
  POSIX::set_nonblocking(rd); // twice is fine

  CHECK(!POSIX::input_ready(rd, milliseconds(1)));
  CHECK(POSIX::output_ready(wr, milliseconds(1)));

  char buf[64];
  auto t_o{false};

  // Nothing to read.
  CHECK_EQ(POSIX::read(rd, buf, sizeof buf, milliseconds(10), t_o), -1);
  CHECK(t_o);

  t_o = false;
  constexpr char hello[]{"220 hello\r\n"};
  auto const len{static_cast<std::streamsize>(strlen(hello))};
  CHECK_EQ(POSIX::write(wr, hello, len, milliseconds(10), t_o), len);
  CHECK(!t_o);

  CHECK(POSIX::input_ready(rd, milliseconds(1)));
  CHECK_EQ(POSIX::read(rd, buf, sizeof buf, milliseconds(10), t_o), len);
  CHECK(!t_o);
  CHECK_EQ(std::string(buf, len), hello);

  // The writer goes away: end of file.
  PCHECK(close(wr) == 0);
  CHECK(POSIX::input_ready(rd, milliseconds(1)));
  CHECK_EQ(POSIX::read(rd, buf, sizeof buf, milliseconds(10), t_o), 0);
  CHECK(!t_o);
  PCHECK(close(rd) == 0);

  // The reader goes away: an error, not a time out.
  PCHECK(pipe(fds) == 0);
  PCHECK(close(fds[0]) == 0);
  POSIX::set_nonblocking(fds[1]);
  CHECK_EQ(POSIX::write(fds[1], hello, len, milliseconds(10), t_o), -1);
  CHECK(!t_o);
  PCHECK(close(fds[1]) == 0);

  // Descriptors numbered past FD_SETSIZE wait like any other.
  auto rl{rlimit{}};
  PCHECK(getrlimit(RLIMIT_NOFILE, &rl) == 0);
  auto const high_fd{FD_SETSIZE + 8};
  if (rl.rlim_cur <= rlim_t(high_fd) && rl.rlim_max > rlim_t(high_fd)) {
    rl.rlim_cur = rlim_t(high_fd) + 1;
    PCHECK(setrlimit(RLIMIT_NOFILE, &rl) == 0);
  }
  if (rl.rlim_cur > rlim_t(high_fd)) {
    PCHECK(pipe(fds) == 0);
    PCHECK(dup2(fds[0], high_fd) == high_fd);
    PCHECK(close(fds[0]) == 0);
    POSIX::set_nonblocking(high_fd);

    CHECK(!POSIX::input_ready(high_fd, milliseconds(1)));
    t_o = false;
    CHECK_EQ(POSIX::read(high_fd, buf, sizeof buf, milliseconds(10), t_o), -1);
    CHECK(t_o);

    t_o = false;
    PCHECK(write(fds[1], hello, len) == len);
    CHECK(POSIX::input_ready(high_fd, milliseconds(1)));
    CHECK_EQ(POSIX::read(high_fd, buf, sizeof buf, milliseconds(10), t_o), len);
    CHECK(!t_o);
    PCHECK(close(fds[1]) == 0);
    PCHECK(close(high_fd) == 0);
  }
  else {
    LOG(WARNING) << "RLIMIT_NOFILE " << rl.rlim_max << ", no fd past "
                 << FD_SETSIZE << " to test with";
  }

  // Names under .invalid never resolve.
  CHECK_EQ(POSIX::connect("mx.example.invalid", 25), -1);

  // A loopback listener takes the connection.
  auto const listener{socket(AF_INET, SOCK_STREAM, 0)};
  PCHECK(listener != -1);
  auto addr{sockaddr_in{}};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof addr) == 0);
  PCHECK(listen(listener, 1) == 0);
  auto addr_len{socklen_t{sizeof addr}};
  PCHECK(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &addr_len)
         == 0);

  auto const fd{POSIX::connect("127.0.0.1", ntohs(addr.sin_port))};
  CHECK_NE(fd, -1);
  POSIX::close(fd);
  POSIX::close(listener);
}
