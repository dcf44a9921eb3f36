#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Malformed command line; the message is meant for the user, followed by usage.
class CommandLineError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Maps argv onto a SettingsManager. Options are `--key value` or `-alias value`;
// boolean options may stand alone; list options consume values up to the next
// option. `--` ends option parsing. Remaining words fill positional keys.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "integrity_audit",
                             std::vector<std::string> positional_keys = {"directory"});

  // Value of --config/-c, if present, so the settings file can be loaded
  // before the rest of the command line overrides it.
  static std::optional<std::string> find_config_path(int argc, char* argv[]);

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
