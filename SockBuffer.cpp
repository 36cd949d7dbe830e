#include "SockBuffer.hpp"

#include <utility>

#include <glog/logging.h>

SockBuffer::SockBuffer(int         fd_in,
                       int         fd_out,
                       Timeouts    timeouts,
                       std::string log_prefix)
  : fd_in_(fd_in)
  , fd_out_(fd_out)
  , timeouts_(timeouts)
  , log_prefix_(std::move(log_prefix))
{
  POSIX::set_nonblocking(fd_in_);
  if (fd_out_ != fd_in_)
    POSIX::set_nonblocking(fd_out_);
}

// boost::iostreams::stream keeps its own copy of the device, taken
// before any I/O.
SockBuffer::SockBuffer(SockBuffer const& that)
  : fd_in_(that.fd_in_)
  , fd_out_(that.fd_out_)
  , timeouts_(that.timeouts_)
  , log_prefix_(that.log_prefix_)
{
  CHECK(!that.timed_out_ && !that.write_failed_);
  CHECK_EQ(that.octets_read_, 0);
  CHECK_EQ(that.octets_written_, 0);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  auto const read = POSIX::read(fd_in_, s, n, timeouts_.read, timed_out_);
  if (read > 0) {
    octets_read_ += read;
    return read;
  }
  return -1; // EOF to boost::iostreams
}

std::streamsize SockBuffer::write(const char* s, std::streamsize n)
{
  if (!write_failed_) {
    auto const written
        = POSIX::write(fd_out_, s, n, timeouts_.write, timed_out_);
    if (written == n) {
      octets_written_ += written;
      return written;
    }
    write_failed_ = true;
  }
  // The stream catches this and sets badbit.
  throw std::ios_base::failure(timed_out_ ? "write timed out" : "write failed");
}

void SockBuffer::log_stats() const
{
  LOG(INFO) << log_prefix_ << "read " << octets_read_ << " octets, wrote "
            << octets_written_ << " octets" << (timed_out_ ? ", timed out" : "");
}
