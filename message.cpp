#include "message.hpp"

#include "Now.hpp"
#include "Pill.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <numeric>
#include <utility>

#include <fmt/format.h>

#include <glog/logging.h>

namespace message {

std::vector<std::string_view> get_lines(std::string_view buf)
{
  std::vector<std::string_view> lines;

  auto offset{std::string_view::size_type{0}};
  for (;;) {
    auto const lf = buf.find('\n', offset);
    if (lf == std::string_view::npos)
      break;
    lines.push_back(buf.substr(offset, lf - offset + 1));
    offset = lf + 1;
  }
  if (offset < buf.size())
    lines.push_back(buf.substr(offset));

  return lines;
}

bool match_header_field(std::string_view line, std::string_view field)
{
  return (line.size() >= field.size())
         && (line.compare(0, field.size(), field) == 0);
}

std::string make_date_line()
{
  auto const date{Now{}};
  return fmt::format("{} {}{}", Date, date.as_string_view(), CRLF);
}

std::string make_message_id_line()
{
  auto const pill{Pill{}};
  return fmt::format("{} <{}>{}", Message_ID, pill.as_string_view(), CRLF);
}

namespace {

std::string concat(std::vector<std::string_view> const& lines)
{
  auto const length{std::accumulate(
      begin(lines), end(lines), std::string::size_type{0},
      [](auto sum, std::string_view line) { return sum + line.size(); })};

  std::string ret;
  ret.reserve(length);
  for (auto const line : lines) {
    ret.append(line.data(), line.size());
  }
  return ret;
}

// Replace the first line matching the field with new_line and drop
// the folded continuation lines that followed it; they belong to the
// old value.
void replace_line(std::vector<std::string_view>&        lines,
                  std::function<bool(std::string_view)> match_line,
                  std::string_view                      new_line)
{
  auto const line{std::find_if(begin(lines), end(lines), match_line)};
  if (line == end(lines))
    return;

  auto const folded_end{std::find_if_not(std::next(line), end(lines),
                                         is_folded_line)};

  // The last line of the header block has no line ending, the
  // separating blank line brings its own.
  auto const last{*std::prev(folded_end)};
  if (last.empty() || (last.back() != '\n')) {
    CHECK_GE(new_line.size(), CRLF.size());
    new_line.remove_suffix(CRLF.size());
  }

  *line = new_line;
  lines.erase(std::next(line), folded_end);
}

} // namespace

std::optional<std::string> replace_header(std::string_view header,
                                          bool             update_date,
                                          bool             update_message_id)
{
  if (!update_date && !update_message_id)
    return {};

  auto lines{get_lines(header)};

  // The replacement lines outlive the views into them.
  std::string date_line;
  std::string message_id_line;

  if (update_date) {
    date_line = make_date_line();
    replace_line(lines, is_date_line, date_line);
  }
  if (update_message_id) {
    message_id_line = make_message_id_line();
    replace_line(lines, is_message_id_line, message_id_line);
  }

  return concat(lines);
}

std::string_view::size_type find_blank_line(std::string_view buf)
{
  auto offset{std::string_view::size_type{0}};
  for (;;) {
    auto const cr = buf.find('\r', offset);
    if ((cr == std::string_view::npos) || ((cr + 3) >= buf.size()))
      return std::string_view::npos;

    if ((buf[cr + 1] == '\n') && (buf[cr + 2] == '\r') && (buf[cr + 3] == '\n'))
      return cr;

    offset = cr + 1;
  }
}

std::optional<parts> split(std::string_view buf)
{
  auto const idx{find_blank_line(buf)};
  if (idx == std::string_view::npos)
    return {};

  return parts{buf.substr(0, idx), buf.substr(idx + blank_line.size())};
}

std::string combine(std::string_view header, std::string_view body)
{
  std::string ret;
  ret.reserve(header.size() + blank_line.size() + body.size());
  ret.append(header.data(), header.size());
  ret.append(blank_line.data(), blank_line.size());
  ret.append(body.data(), body.size());
  return ret;
}

std::optional<std::string>
replace(std::string_view buf, bool update_date, bool update_message_id)
{
  if (!update_date && !update_message_id)
    return {};

  auto const mail{split(buf)};
  if (!mail)
    throw MalformedMessage(
        "Invalid mail: no blank line between header and body");

  auto const header{
      replace_header(mail->header, update_date, update_message_id)};
  return combine(*header, mail->body);
}

content::content(fs::path path)
  : path_(std::move(path))
{
  // A zero length file can't be mapped.
  if (fs::file_size(path_))
    file_.open(path_.string());
}

} // namespace message
