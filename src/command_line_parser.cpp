#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

namespace {

std::string argument_hint(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "[true|false]";
    case SettingType::Int: return "<int>";
    case SettingType::String: return "<string>";
    case SettingType::List: return "<pattern>...";
  }
  return "";
}

std::string default_text(const SettingDefinition& def) {
  const auto& value = def.default_value;
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_array() && value.empty()) return "none";
  if(value.is_string()) {
    const auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

// "-1" is a value, "-r" an option.
bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional = 0;
  bool options_done = false;

  auto assign = [&](const std::string& key, const std::string& value, const std::string& shown){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw CommandLineError("Invalid value for option '" + shown + "': " + error);
    }
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }

    if(!options_done && is_option_token(token)) {
      const bool long_form = token.rfind("--", 0) == 0;
      const auto name = token.substr(long_form ? 2 : 1);
      const auto* def = settings.lookup(name);
      if(!def) {
        throw CommandLineError("Unknown option " + token);
      }
      const bool has_next = i + 1 < args.size() && !is_option_token(args[i + 1]);

      switch(def->type) {
        case SettingType::List:
          if(!has_next) {
            throw CommandLineError("Missing value for option '" + token + "'");
          }
          while(i + 1 < args.size() && !is_option_token(args[i + 1])) {
            assign(def->key, args[++i], token);
          }
          break;
        case SettingType::Bool:
          if(has_next && settings_text::parse_bool(args[i + 1])) {
            assign(def->key, args[++i], token);
          } else {
            assign(def->key, "true", token);
          }
          break;
        case SettingType::Int:
        case SettingType::String:
          // a negative number still counts as a value
          if(i + 1 >= args.size()) {
            throw CommandLineError("Missing value for option '" + token + "'");
          }
          assign(def->key, args[++i], token);
          break;
      }
      continue;
    }

    if(positional >= positional_keys_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_keys_[positional++];
    assign(key, token, key);
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string command = process_name_;
  for(const auto& key : positional_keys_) {
    command += " [" + key + "]";
  }
  print_out(nullptr, "{} - verify data integrity via per-directory checksum files", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options]", command);
  print_out(nullptr, "  Pattern options take every following argument up to the next option;");
  print_out(nullptr, "  use -- before the directory when it comes last.");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& def : settings.definitions()) {
    std::ostringstream aliases;
    for(std::size_t i = 0; i < def.aliases.size(); ++i) {
      aliases << (i == 0 ? " (alias: " : ", ") << "-" << def.aliases[i];
    }
    if(!def.aliases.empty()) aliases << ")";
    print_out(nullptr, "  --{:<10} {:<13} {}{} (default: {})",
              def.key, argument_hint(def.type), def.description, aliases.str(), default_text(def));
  }
  print_out(nullptr, "");
}

std::optional<std::string> CommandLineParser::find_config_path(int argc, char* argv[]) {
  for(int i = 1; i + 1 < argc; ++i) {
    const std::string token = argv[i];
    if(token == "--") break;
    if(token == "--config" || token == "-c") {
      return std::string(argv[i + 1]);
    }
  }
  return std::nullopt;
}
