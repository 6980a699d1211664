#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::parse(int argc, char* argv[], ConfigManager& config) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  bool username_seen = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      std::string key_token = token.rfind("--", 0) == 0 ? token.substr(2) : token.substr(1);
      std::string inline_value;
      bool has_inline = false;
      if(auto eq = key_token.find('='); eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token.resize(eq);
        has_inline = true;
      }

      auto resolved = config.resolve_key(key_token);
      if(!resolved) {
        print_out(nullptr, "Unknown option '{}'", token);
        return false;
      }

      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(config.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && ConfigManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          print_out(nullptr, "Missing value for option '{}'", token);
          return false;
        }
        value = args[++i];
      }

      std::string error;
      if(!config.set_from_string(*resolved, value, error)) {
        print_out(nullptr, "Invalid value for option '{}': {}", token, error);
        return false;
      }
      continue;
    }

    if(username_seen) {
      print_out(nullptr, "Unexpected argument '{}'", token);
      return false;
    }
    std::string error;
    if(!config.set_from_string("username", token, error)) {
      print_out(nullptr, "Invalid username '{}': {}", token, error);
      return false;
    }
    username_seen = true;
  }
  return true;
}

void CommandLineParser::usage(const ConfigManager& config) const {
  print_out(nullptr, "{} - LAN peer discovery and file drop", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [username] [options]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : config.specification()) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases") && !entry.at("aliases").empty()) {
      aliases << " (alias: ";
      bool first = true;
      for(const auto& alias : entry.at("aliases")) {
        if(!first) aliases << ", ";
        aliases << "-" << alias.get<std::string>();
        first = false;
      }
      aliases << ")";
    }
    const auto& def = entry.at("default");
    std::string default_str = def.is_string() ? def.get<std::string>() : def.dump();
    print_out(nullptr, "  --{:<22} {:<14} {}{} (default: {})",
              key, hint, entry.value("description", ""), aliases.str(), default_str);
  }
  print_out(nullptr, "");
}
