#include "Settings.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {

using field = std::pair<char const*, std::string>;

std::vector<field> const minimal{
    {"smtpHost", R"("localhost")"},
    {"smtpPort", "2525"},
    {"fromAddress", R"("a001@ah62.example.jp")"},
    {"toAddresses", R"(["a002@ah62.example.jp"])"},
    {"emlFiles", R"(["test1.eml"])"},
};

// minimal, with key's value changed, or dropped if value is empty.
std::string json_with(char const* key, std::string const& value)
{
  auto found{false};
  std::string members;
  for (auto const& [k, v] : minimal) {
    auto const& val = (std::string(k) == key) ? value : v;
    found |= (std::string(k) == key);
    if (val.empty())
      continue;
    if (!members.empty())
      members += ",\n";
    members += fmt::format("  \"{}\": {}", k, val);
  }
  if (!found && !value.empty())
    members += fmt::format(",\n  \"{}\": {}", key, value);
  return fmt::format("{{\n{}\n}}", members);
}

std::string invalid(std::string const& text)
{
  try {
    get_settings_from_text(text);
  }
  catch (SettingsInvalid const& e) {
    return e.what();
  }
  LOG(FATAL) << "accepted: " << text;
  return {};
}

void test_sample()
{
  auto const settings{get_settings_from_text(json_sample())};

  CHECK_EQ(settings.smtp_host, "172.16.3.151");
  CHECK_EQ(settings.smtp_port, 25);
  CHECK_EQ(settings.from_address, "a001@ah62.example.jp");
  CHECK_EQ(settings.to_addresses.size(), 3U);
  CHECK_EQ(settings.to_addresses[0], "a001@ah62.example.jp");
  CHECK_EQ(settings.to_addresses[2], "a003@ah62.example.jp");
  CHECK_EQ(settings.eml_files.size(), 3U);
  CHECK_EQ(settings.eml_files[1], "test2.eml");
  CHECK(settings.update_date);
  CHECK(settings.update_message_id);
  CHECK(!settings.use_parallel);
}

void test_defaults()
{
  auto const settings{get_settings_from_text(json_with("", ""))};

  CHECK_EQ(settings.smtp_host, "localhost");
  CHECK_EQ(settings.smtp_port, 2525);
  CHECK(settings.update_date);
  CHECK(settings.update_message_id);
  CHECK(!settings.use_parallel);

  auto const flags{get_settings_from_text(
      R"({"smtpHost": "h", "smtpPort": 25, "fromAddress": "f",
          "toAddresses": ["t"], "emlFiles": ["e"],
          "updateDate": false, "updateMessageId": false,
          "useParallel": true})")};
  CHECK(!flags.update_date);
  CHECK(!flags.update_message_id);
  CHECK(flags.use_parallel);
}

void test_missing_keys()
{
  for (auto const& [key, value] : minimal) {
    CHECK_EQ(invalid(json_with(key, "")),
             fmt::format("{} key does not exist", key));
  }
}

void test_invalid_types()
{
  CHECK_EQ(invalid(json_with("smtpHost", R"({"a": 1})")),
           R"(smtpHost: Invalid type: {"a":1})");
  CHECK_EQ(invalid(json_with("smtpHost", "172")), "smtpHost: Invalid type: 172");
  CHECK_EQ(invalid(json_with("fromAddress", R"(["a", "b"])")),
           R"(fromAddress: Invalid type: ["a","b"])");

  CHECK_EQ(invalid(json_with("smtpPort", R"("25")")),
           R"(smtpPort: Invalid type: "25")");
  CHECK_EQ(invalid(json_with("smtpPort", "0")), "smtpPort: Invalid type: 0");
  CHECK_EQ(invalid(json_with("smtpPort", "65536")),
           "smtpPort: Invalid type: 65536");
  CHECK_EQ(invalid(json_with("smtpPort", "25.5")),
           "smtpPort: Invalid type: 25.5");
  CHECK_EQ(get_settings_from_text(json_with("smtpPort", "65535")).smtp_port,
           65535);

  CHECK_EQ(invalid(json_with("toAddresses", "[]")),
           "toAddresses: empty array");
  CHECK_EQ(invalid(json_with("toAddresses", R"("a002@ah62.example.jp")")),
           R"(toAddresses: Invalid type (array): "a002@ah62.example.jp")");
  CHECK_EQ(invalid(json_with("emlFiles", R"({"a": "b"})")),
           R"(emlFiles: Invalid type (array): {"a":"b"})");
  CHECK_EQ(invalid(json_with("emlFiles", R"(["a.eml", ["b.eml"]])")),
           R"(emlFiles: Invalid type (element): ["b.eml"])");
  CHECK_EQ(invalid(json_with("emlFiles", R"(["a.eml", 2])")),
           "emlFiles: Invalid type (element): 2");

  CHECK_EQ(invalid(json_with("updateDate", R"("true")")),
           R"(updateDate: Invalid type: "true")");
  CHECK_EQ(invalid(json_with("useParallel", "1")),
           "useParallel: Invalid type: 1");
  CHECK_EQ(invalid(json_with("updateMessageId", "null")),
           "updateMessageId: Invalid type: null");
}

void test_not_json()
{
  LOG(INFO) << invalid("");
  LOG(INFO) << invalid("{");
  LOG(INFO) << invalid(R"({"smtpHost": "h",})");
  LOG(INFO) << invalid(R"({"smtpHost": "h"} trailing)");
  CHECK_EQ(invalid("{}"), "smtpHost key does not exist");
  CHECK_EQ(invalid(R"(["smtpHost"])"), R"(Invalid type: ["smtpHost"])");
}

// Comments go anywhere whitespace does.
void test_comments()
{
  auto const text{"// sendeml settings\n"s
                  + "{\n"
                    "  /* where to */\n"
                    "  \"smtpHost\": \"localhost\", // no TLS\n"
                    "  \"smtpPort\": 2525,\n"
                    "  \"fromAddress\": \"a001@ah62.example.jp\",\n"
                    "  \"toAddresses\": [\"a002@ah62.example.jp\" /* one */],\n"
                    "  \"emlFiles\": [\"test1.eml\"]\n"
                    "}\n"
                    "/* end */\n"};

  auto const settings{get_settings_from_text(text)};
  CHECK_EQ(settings.smtp_host, "localhost");
  CHECK_EQ(settings.smtp_port, 2525);
  CHECK_EQ(settings.to_addresses.size(), 1U);
  CHECK_EQ(settings.to_addresses[0], "a002@ah62.example.jp");
  CHECK_EQ(settings.eml_files[0], "test1.eml");

  // Still nothing but comments after the root.
  LOG(INFO) << invalid(text + "trailing");
}

void test_file()
{
  auto const missing{fs::path("/tmp/Settings-test-no-such-file.json")};
  try {
    get_settings(missing);
    LOG(FATAL) << "accepted " << missing;
  }
  catch (SettingsInvalid const& e) {
    CHECK_EQ(std::string(e.what()), "Json file does not exist");
  }

  char path[]{"/tmp/Settings-test-XXXXXX"};
  auto const fd{mkstemp(path)};
  PCHECK(fd != -1) << "mkstemp";
  close(fd);
  {
    std::ofstream ofs(path);
    ofs << json_sample();
  }

  auto const settings{get_settings(path)};
  CHECK_EQ(settings.smtp_host, "172.16.3.151");
  CHECK_EQ(settings.eml_files.size(), 3U);

  PCHECK(unlink(path) == 0) << "unlink " << path;
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  test_sample();
  test_defaults();
  test_missing_keys();
  test_invalid_types();
  test_not_json();
  test_comments();
  test_file();

  std::cout << "all Settings tests passed\n";
}
