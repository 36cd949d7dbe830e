#ifndef PILL_DOT_HPP
#define PILL_DOT_HPP

#include <cstddef>
#include <cstring>
#include <ostream>
#include <string_view>

// A pill is a unit of entropy: 62 characters drawn uniformly from
// [A-Za-z0-9], enough to make a Message-ID unique.

class Pill {
public:
  Pill();

  bool operator==(Pill const& that) const
  {
    return std::memcmp(str_, that.str_, ndigits) == 0;
  }
  bool operator!=(Pill const& that) const { return !(*this == that); }

  std::string_view as_string_view() const
  {
    return std::string_view{str_, ndigits};
  }

  auto static constexpr ndigits = std::size_t{62};

private:
  char str_[ndigits + 1];

  friend std::ostream& operator<<(std::ostream& s, Pill const& p)
  {
    return s << p.as_string_view();
  }
};

#endif // PILL_DOT_HPP
