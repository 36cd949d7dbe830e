#include "Settings.hpp"

#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

#include <fmt/format.h>

#include <json/json.h>

#include <boost/algorithm/string/trim.hpp>

namespace {

char const* const required_keys[]{
    "smtpHost", "smtpPort", "fromAddress", "toAddresses", "emlFiles",
};

// The value as it was written, for error messages.
std::string to_json(Json::Value const& value)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"]  = "";
  builder["commentStyle"] = "None";
  return Json::writeString(builder, value);
}

Json::Value const& get_member(Json::Value const& root, char const* name)
{
  if (!root.isMember(name))
    throw SettingsInvalid(fmt::format("{} key does not exist", name));
  return root[name];
}

std::string get_string(Json::Value const& root, char const* name)
{
  auto const& value = get_member(root, name);
  if (!value.isString())
    throw SettingsInvalid(
        fmt::format("{}: Invalid type: {}", name, to_json(value)));
  return value.asString();
}

uint16_t get_port(Json::Value const& root, char const* name)
{
  auto const& value = get_member(root, name);
  if (!value.isInt() || (value.asInt() <= 0)
      || (value.asInt() > std::numeric_limits<uint16_t>::max())) {
    throw SettingsInvalid(
        fmt::format("{}: Invalid type: {}", name, to_json(value)));
  }
  return static_cast<uint16_t>(value.asInt());
}

std::vector<std::string> get_strings(Json::Value const& root, char const* name)
{
  auto const& value = get_member(root, name);
  if (!value.isArray())
    throw SettingsInvalid(
        fmt::format("{}: Invalid type (array): {}", name, to_json(value)));
  if (value.empty())
    throw SettingsInvalid(fmt::format("{}: empty array", name));

  std::vector<std::string> ret;
  for (auto const& elm : value) {
    if (!elm.isString())
      throw SettingsInvalid(
          fmt::format("{}: Invalid type (element): {}", name, to_json(elm)));
    ret.push_back(elm.asString());
  }
  return ret;
}

bool get_bool(Json::Value const& root, char const* name, bool default_value)
{
  if (!root.isMember(name))
    return default_value;

  auto const& value = root[name];
  if (!value.isBool())
    throw SettingsInvalid(
        fmt::format("{}: Invalid type: {}", name, to_json(value)));
  return value.asBool();
}

} // namespace

Settings get_settings_from_text(std::string_view text)
{
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["allowComments"] = true;

  Json::Value root;
  std::string errs;
  std::unique_ptr<Json::CharReader> const reader{builder.newCharReader()};
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    boost::algorithm::trim_right(errs);
    throw SettingsInvalid(errs);
  }
  if (!root.isObject())
    throw SettingsInvalid(fmt::format("Invalid type: {}", to_json(root)));

  for (auto const key : required_keys) {
    get_member(root, key);
  }

  Settings settings;
  settings.smtp_host         = get_string(root, "smtpHost");
  settings.smtp_port         = get_port(root, "smtpPort");
  settings.from_address      = get_string(root, "fromAddress");
  settings.to_addresses      = get_strings(root, "toAddresses");
  settings.eml_files         = get_strings(root, "emlFiles");
  settings.update_date       = get_bool(root, "updateDate", true);
  settings.update_message_id = get_bool(root, "updateMessageId", true);
  settings.use_parallel      = get_bool(root, "useParallel", false);
  return settings;
}

Settings get_settings(fs::path const& json_file)
{
  if (!fs::exists(json_file))
    throw SettingsInvalid("Json file does not exist");

  std::ifstream ifs{json_file};
  if (!ifs)
    throw SettingsInvalid(fmt::format("can't open {}", json_file.string()));

  std::ostringstream text;
  text << ifs.rdbuf();
  return get_settings_from_text(text.str());
}

char const* json_sample()
{
  return R"({
    "smtpHost": "172.16.3.151",
    "smtpPort": 25,
    "fromAddress": "a001@ah62.example.jp",
    "toAddresses": [
        "a001@ah62.example.jp",
        "a002@ah62.example.jp",
        "a003@ah62.example.jp"
    ],
    "emlFiles": [
        "test1.eml",
        "test2.eml",
        "test3.eml"
    ],
    "updateDate": true,
    "updateMessageId": true,
    "useParallel": false
})";
}
