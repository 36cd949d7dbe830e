#include "Pill.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Pill red, blue;
  CHECK(red != blue);

  std::stringstream red_str, blue_str;

  red_str << red;
  blue_str << blue;

  CHECK_NE(red_str.str(), blue_str.str());

  CHECK_EQ(62U, red_str.str().length());
  CHECK_EQ(62U, blue_str.str().length());

  Pill red2(red);
  CHECK(red == red2);
  CHECK_EQ(red.as_string_view(), red2.as_string_view());

  auto const s{red.as_string_view()};
  CHECK(std::all_of(begin(s), end(s),
                    [](unsigned char c) { return std::isalnum(c); }))
      << s;

  // Each thread has its own generator, no two seeded alike.
  std::vector<std::string> pills(8);
  std::vector<std::thread> threads;
  for (auto& p : pills) {
    threads.emplace_back([&p] { p = std::string(Pill{}.as_string_view()); });
  }
  for (auto& t : threads) {
    t.join();
  }
  CHECK_EQ(std::set<std::string>(begin(pills), end(pills)).size(),
           pills.size());

  std::cout << "sizeof(Pill) == " << sizeof(Pill) << '\n';
  std::cout << red << '\n' << blue << '\n';
}
