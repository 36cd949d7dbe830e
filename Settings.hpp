#ifndef SETTINGS_DOT_HPP
#define SETTINGS_DOT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "fs.hpp"

// One JSON settings file: where to send which eml files.
struct Settings {
  std::string              smtp_host;
  uint16_t                 smtp_port{25};
  std::string              from_address;
  std::vector<std::string> to_addresses;
  std::vector<std::string> eml_files;

  bool update_date{true};
  bool update_message_id{true};
  bool use_parallel{false};
};

class SettingsInvalid : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

Settings get_settings(fs::path const& json_file);
Settings get_settings_from_text(std::string_view text);

char const* json_sample();

#endif // SETTINGS_DOT_HPP
