#pragma once

#include <string>
#include <vector>

#include "config_manager.hpp"

// Maps `--key value`, `-alias value` and bare bool flags onto a ConfigManager.
// An optional single positional argument sets the username.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "landrop");

  // Returns false (after printing why) when the arguments are unusable.
  bool parse(int argc, char* argv[], ConfigManager& config) const;
  void usage(const ConfigManager& config) const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
};
