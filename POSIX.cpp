#include "POSIX.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>

#include <glog/logging.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {
// Any fd number, FD_SETSIZE is no limit here.
bool ready(int fd, bool for_output, milliseconds wait)
{
  auto pfd{pollfd{}};
  pfd.fd     = fd;
  pfd.events = for_output ? POLLOUT : POLLIN;

  auto const ms = std::clamp(wait.count(), milliseconds::rep{0},
                             milliseconds::rep{std::numeric_limits<int>::max()});
  auto const puts = poll(&pfd, 1, static_cast<int>(ms));
  if (puts == -1) {
    PLOG_IF(WARNING, errno != EINTR) << "poll() failed on fd " << fd;
    return false;
  }
  // An error or hang up is ready too: the next read or write reports it.
  return 0 != puts;
}

std::string addr_str(addrinfo const* ai)
{
  char str[INET6_ADDRSTRLEN]{'\0'};
  void const* addr
      = (ai->ai_family == AF_INET6)
            ? static_cast<void const*>(
                &reinterpret_cast<sockaddr_in6 const*>(ai->ai_addr)->sin6_addr)
            : static_cast<void const*>(
                &reinterpret_cast<sockaddr_in const*>(ai->ai_addr)->sin_addr);
  if (inet_ntop(ai->ai_family, addr, str, sizeof str) == nullptr) {
    PLOG(WARNING) << "inet_ntop failed";
    return "?";
  }
  return str;
}
} // namespace

int POSIX::connect(std::string const& host, uint16_t port)
{
  auto hints{addrinfo{}};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*  res     = nullptr;
  auto const service = std::to_string(port);
  if (auto const rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
      rc != 0) {
    LOG(WARNING) << "getaddrinfo(" << host << ") failed: " << gai_strerror(rc);
    return -1;
  }

  auto fd{-1};
  for (auto ai = res; ai; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      PLOG(WARNING) << "socket() failed";
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen)) {
      PLOG(WARNING) << "connect failed " << addr_str(ai) << ":" << port;
      close(fd);
      fd = -1;
      continue;
    }

    LOG(INFO) << "connected to " << addr_str(ai) << ":" << port;
    break;
  }

  freeaddrinfo(res);
  return fd;
}

void POSIX::close(int fd)
{
  PLOG_IF(WARNING, ::close(fd) == -1) << "close(" << fd << ")";
}

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return ready(fd_in, false, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return ready(fd_out, true, wait);
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: continue; // try read again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    case ECONNRESET:
      LOG(WARNING) << "read(2) raised ECONNRESET";
      return -1;

    default: PLOG(ERROR) << "error from read(2)"; return -1;
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
      if (steady_clock::now() < end_time)
        continue; // poll() was interrupted
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret = ::write(fd, static_cast<const void*>(s), n - written);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: break; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      case ECONNRESET:
      case EPIPE:
        PLOG(WARNING) << "write(2) failed";
        return -1;

      default: PLOG(ERROR) << "error from write(2)"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
      if (steady_clock::now() < end_time)
        continue;
    }
    t_o = true;
    LOG(WARNING) << "write(2) time out";
    return -1;
  }
}
