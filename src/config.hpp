#pragma once

#include <optional>
#include <string>

#ifndef IRE_VERSION
#define IRE_VERSION "0.1.0"
#endif

enum ConfigStatus {
  Config_OK = 0,
  Config_Help,
  Config_Version,
  Config_BadArguments,
};

struct Config {
  std::optional<std::string> filename;
  std::optional<std::string> glob;
  std::optional<std::string> output;
  std::optional<std::string> pattern;
  bool printOnly = false;
  std::string pathFont = "sarasa-mono-j-regular.ttf";
};

ConfigStatus Config_Parse(Config &out,
                          std::string &error,
                          int argc,
                          const char *const *argv);

std::string Config_Usage(const char *argv0);
