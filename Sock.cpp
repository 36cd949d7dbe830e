#include "Sock.hpp"

#include <utility>

Sock::Sock(int fd_in, int fd_out, Timeouts timeouts, std::string log_prefix)
  : iostream_(SockBuffer(fd_in, fd_out, timeouts, std::move(log_prefix)))
  , fd_in_(fd_in)
  , fd_out_(fd_out)
{
}

Sock::~Sock() { close_fds(); }

void Sock::close_fds()
{
  // Whatever is still buffered goes out, or fails, while the
  // descriptors are still ours.
  if (iostream_.is_open())
    iostream_.close();

  if (fd_in_ != -1)
    POSIX::close(fd_in_);
  if ((fd_out_ != -1) && (fd_out_ != fd_in_))
    POSIX::close(fd_out_);

  fd_in_  = -1;
  fd_out_ = -1;
}
