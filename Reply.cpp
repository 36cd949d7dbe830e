#include "Reply.hpp"

#include <glog/logging.h>

#include <boost/algorithm/string/trim.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace SMTP {

// clang-format off

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

// Any three digits; the first is what we judge a reply by, and the
// server's choice of the rest is its own business.
struct reply_code : rep<3, DIGIT> {};

struct last_line  : seq<reply_code, sor<SP, eof>> {};

// clang-format on

bool Reply::is_last_line(std::string_view line)
{
  auto in{memory_input<>{line.data(), line.size(), "reply"}};
  return parse<last_line>(in);
}

bool Reply::is_positive(std::string_view line)
{
  return !line.empty() && ((line.front() == '2') || (line.front() == '3'));
}

std::string Reply::recv(std::istream& in, std::string_view log_prefix)
{
  std::string line;
  for (;;) {
    if (!std::getline(in, line))
      throw ConnectionClosed{};

    boost::algorithm::trim_right(line);
    LOG(INFO) << log_prefix << "recv: " << line;

    if (is_last_line(line)) {
      if (is_positive(line))
        return line;
      throw NegativeReply(line);
    }
  }
}

} // namespace SMTP
