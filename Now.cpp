#include "Now.hpp"

#include <sys/time.h>

#include <glog/logging.h>

Now::Now()
{
  timeval tv;
  PCHECK(gettimeofday(&tv, nullptr) == 0);
  sec_ = tv.tv_sec;
  format();
}

Now::Now(time_t sec)
  : sec_(sec)
{
  format();
}

void Now::format()
{
  // localtime_r, workers format dates concurrently.
  tm tm_buf;
  PCHECK(localtime_r(&sec_, &tm_buf) != nullptr);
  len_ = strftime(c_str_, sizeof c_str_, "%a, %d %b %Y %H:%M:%S %z", &tm_buf);
  CHECK_EQ(len_, sizeof(c_str_) - 1);
}
