#include "Now.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>

#include <glog/logging.h>

namespace {
void set_tz(char const* tz)
{
  PCHECK(setenv("TZ", tz, 1) == 0);
  tzset();
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Now then;

  std::cout << "sizeof(Now) == " << sizeof(Now) << '\n';

  std::stringstream then_str;
  then_str << then;

  Now then_again{then};
  std::stringstream then_again_str;
  then_again_str << then_again;

  CHECK_EQ(then_str.str(), then_again_str.str());
  CHECK_EQ(then_str.str().length(), 31U);

  set_tz("UTC");
  Now const epoch{0};
  CHECK_EQ(epoch.sec(), 0);
  CHECK_EQ(epoch.as_string_view(), "Thu, 01 Jan 1970 00:00:00 +0000");

  auto constexpr sunday = time_t{1595768497};

  Now const utc{sunday};
  CHECK_EQ(utc.as_string_view(), "Sun, 26 Jul 2020 13:01:37 +0000");

  // Local time, with the offset.
  set_tz("JST-9");
  Now const jst{sunday};
  CHECK_EQ(jst.as_string_view(), "Sun, 26 Jul 2020 22:01:37 +0900");
  CHECK_EQ(std::string(jst.c_str()), "Sun, 26 Jul 2020 22:01:37 +0900");

  set_tz("EST5");
  Now const est{sunday};
  CHECK_EQ(est.as_string_view(), "Sun, 26 Jul 2020 08:01:37 -0500");

  std::cout << then << '\n';
}
