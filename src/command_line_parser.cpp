#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

// "--key", "--key=value" or "-k".
CommandLineParser::OptionToken CommandLineParser::split_option(const std::string& token) {
  OptionToken out;
  const bool long_form = token.rfind("--", 0) == 0;
  out.name = token.substr(long_form ? 2 : 1);
  auto eq = out.name.find('=');
  if(long_form && eq != std::string::npos) {
    out.inline_value = out.name.substr(eq + 1);
    out.name.resize(eq);
  }
  return out;
}

void CommandLineParser::fail(const std::string& message) const {
  print_err(nullptr, "{}", message);
  usage();
  std::exit(1);
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> words;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(!is_option_token(token)) {
      words.push_back(token);
      continue;
    }

    const auto option = split_option(token);
    const auto resolved = settings.resolve_key(option.name);
    if(!resolved) {
      fail("Unknown option " + token);
    }

    std::string value;
    if(option.inline_value) {
      value = *option.inline_value;
    } else if(settings.is_bool_setting(*resolved)) {
      // A bool flag takes the next word only if it reads as a bool.
      if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        fail("Missing value for option '" + option.name + "'");
      }
      value = args[++i];
    }

    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      fail("Invalid value for option '" + option.name + "': " + error);
    }
  }

  assign_positionals(words, settings);
}

// Surplus words fold into the last positional so unquoted titles work:
// `xdccdl one piece -e 3`.
void CommandLineParser::assign_positionals(const std::vector<std::string>& words,
                                           SettingsManager& settings) const {
  if(words.empty()) return;
  if(positional_specs_.empty()) {
    fail("Unexpected positional argument '" + words.front() + "'");
  }
  for(std::size_t i = 0; i < positional_specs_.size() && i < words.size(); ++i) {
    std::string value = words[i];
    if(i + 1 == positional_specs_.size()) {
      for(std::size_t j = i + 1; j < words.size(); ++j) value += " " + words[j];
    }
    const auto& spec = positional_specs_[i];
    std::string error;
    if(!settings.set_from_string(spec.key, value, error)) {
      fail("Invalid value for " + spec.key + " '" + value + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - search and fetch releases from XDCC bots", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " <" + pos.key + ">";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    if(entry.contains("choices")) {
      std::string joined;
      for(const auto& choice : entry.at("choices").get<std::vector<std::string>>()) {
        if(choice.empty()) continue;
        joined += joined.empty() ? choice : "|" + choice;
      }
      argument_hint = "{" + joined + "}";
    }
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    if(default_str.empty()) {
      print_out(nullptr, "  --{} {:<12} {}{}", key, argument_hint, description, aliases.str());
    } else {
      print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
                key, argument_hint, description, aliases.str(), default_str);
    }
  }
  print_out(nullptr, "");
}
