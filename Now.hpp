#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <cstddef>
#include <ctime>
#include <ostream>
#include <string_view>

// Local time as an RFC 5322 date-time, "Sun, 26 Jul 2020 22:01:37 +0900".

class Now {
public:
  Now();
  explicit Now(time_t sec);

  auto sec() const { return sec_; }

  char const*      c_str() const { return c_str_; }
  std::string_view as_string_view() const { return {c_str_, len_}; }

private:
  void format();

  time_t sec_;
  size_t len_{0};
  char   c_str_[32]; // RFC 5322 date-time section 3.3.

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.as_string_view();
  }
};

#endif // NOW_DOT_HPP
