#ifndef MESSAGE_DOT_HPP_INCLUDED
#define MESSAGE_DOT_HPP_INCLUDED

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/iostreams/device/mapped_file.hpp>

#include "fs.hpp"

namespace message {

// RFC-5322 header fields we rewrite, matched as exact, case-sensitive
// prefixes: "X-Date:" is not a "Date:".
auto constexpr Date       = std::string_view{"Date:"};
auto constexpr Message_ID = std::string_view{"Message-ID:"};

auto constexpr CRLF = std::string_view{"\r\n"};

// The empty line between header and body.
auto constexpr blank_line = std::string_view{"\r\n\r\n"};

class MalformedMessage : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raw lines, each running through its LF; the last line may have no
// LF.  The views alias buf, no line is ever copied.
std::vector<std::string_view> get_lines(std::string_view buf);

bool match_header_field(std::string_view line, std::string_view field);

inline bool is_date_line(std::string_view line)
{
  return match_header_field(line, Date);
}

inline bool is_message_id_line(std::string_view line)
{
  return match_header_field(line, Message_ID);
}

// A folded continuation line starts with WSP.
inline bool is_folded_line(std::string_view line)
{
  return !line.empty() && ((line.front() == ' ') || (line.front() == '\t'));
}

std::string make_date_line();
std::string make_message_id_line();

// Returns the rewritten header block.  With neither field to update
// there is nothing to rewrite and the result is empty: use the header
// as is.
std::optional<std::string> replace_header(std::string_view header,
                                          bool             update_date,
                                          bool             update_message_id);

struct parts {
  std::string_view header;
  std::string_view body;
};

// Offset of the first CRLF CRLF, or npos.
std::string_view::size_type find_blank_line(std::string_view buf);

std::optional<parts> split(std::string_view buf);

std::string combine(std::string_view header, std::string_view body);

// Builds the message to transmit into a new buffer, buf is never
// touched.  An empty result means no update was asked for and buf is
// to be sent as is.  Throws MalformedMessage if the header and body
// can't be told apart.
std::optional<std::string>
replace(std::string_view buf, bool update_date, bool update_message_id);

// The bytes of an eml file exactly as they are on disk.
class content {
public:
  explicit content(fs::path path);

  char const* data() const { return file_.is_open() ? file_.data() : ""; }
  size_t      size() const { return file_.is_open() ? file_.size() : 0; }

  bool empty() const { return size() == 0; }
  operator std::string_view() const { return std::string_view(data(), size()); }

  fs::path const& path() const { return path_; }

private:
  fs::path                             path_;
  boost::iostreams::mapped_file_source file_;
};

} // namespace message

#endif // MESSAGE_DOT_HPP_INCLUDED
