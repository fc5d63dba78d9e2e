#pragma once

#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "xdccdl",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","anime"}}
                    }));

  // Prints usage and exits with status 1 on malformed arguments.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  struct OptionToken {
    std::string name;
    std::optional<std::string> inline_value;
  };

  static bool is_option_token(const std::string& candidate);
  static OptionToken split_option(const std::string& token);
  void assign_positionals(const std::vector<std::string>& words, SettingsManager& settings) const;
  [[noreturn]] void fail(const std::string& message) const;

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
