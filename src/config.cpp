#include "config.hpp"

#include <vector>

#include <fmt/core.h>

struct ArgReader {
  std::vector<std::string> args;
  size_t idxNext = 1;

  ArgReader(int argc, const char *const *argv) {
    for (int i = 0; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }

  bool Done() const { return idxNext >= args.size(); }
  const std::string &Next() { return args[idxNext++]; }

  // Value of an option given either as `--name value` or `--name=value`
  bool TakeValue(const std::string &flag,
                 const std::optional<std::string> &inlineValue,
                 std::string &out,
                 std::string &error) {
    if (inlineValue) {
      out = *inlineValue;
      return true;
    }
    if (Done()) {
      error = fmt::format("option '{}' requires a value", flag);
      return false;
    }
    out = Next();
    return true;
  }
};

ConfigStatus Config_Parse(Config &out,
                          std::string &error,
                          int argc,
                          const char *const *argv) {
  ArgReader reader(argc, argv);
  bool onlyPositionals = false;

  while (!reader.Done()) {
    auto arg = reader.Next();

    if (onlyPositionals || arg.size() < 2 || arg[0] != '-') {
      if (out.filename) {
        error = fmt::format("unexpected argument '{}'", arg);
        return Config_BadArguments;
      }
      out.filename = arg;
      continue;
    }

    if (arg == "--") {
      onlyPositionals = true;
      continue;
    }

    std::optional<std::string> inlineValue;
    if (arg.rfind("--", 0) == 0) {
      auto offEq = arg.find('=');
      if (offEq != std::string::npos) {
        inlineValue = arg.substr(offEq + 1);
        arg = arg.substr(0, offEq);
      }
    }

    std::string value;
    if (arg == "-h" || arg == "--help") {
      return Config_Help;
    } else if (arg == "-V" || arg == "--version") {
      return Config_Version;
    } else if (arg == "-g" || arg == "--glob") {
      if (!reader.TakeValue(arg, inlineValue, value, error)) {
        return Config_BadArguments;
      }
      out.glob = value;
    } else if (arg == "-o" || arg == "--output") {
      if (!reader.TakeValue(arg, inlineValue, value, error)) {
        return Config_BadArguments;
      }
      out.output = value;
    } else if (arg == "-p" || arg == "--pattern") {
      if (!reader.TakeValue(arg, inlineValue, value, error)) {
        return Config_BadArguments;
      }
      out.pattern = value;
    } else if (arg == "--font") {
      if (!reader.TakeValue(arg, inlineValue, value, error)) {
        return Config_BadArguments;
      }
      out.pathFont = value;
    } else if (arg == "--print") {
      if (inlineValue) {
        error = "option '--print' takes no value";
        return Config_BadArguments;
      }
      out.printOnly = true;
    } else {
      error = fmt::format("unknown option '{}'", arg);
      return Config_BadArguments;
    }
  }

  if (out.glob && out.glob->empty()) {
    error = "glob must not be empty";
    return Config_BadArguments;
  }

  if (out.output && out.output->empty()) {
    error = "output path must not be empty";
    return Config_BadArguments;
  }

  if (!out.filename && !out.glob) {
    error = "missing <FILENAME> (or --glob <GLOB>)";
    return Config_BadArguments;
  }

  return Config_OK;
}

std::string Config_Usage(const char *argv0) {
  return fmt::format(
      "ire {}\n"
      "Interactively test a regular expression against the lines of a file\n"
      "\n"
      "USAGE:\n"
      "    {} [OPTIONS] <FILENAME>\n"
      "\n"
      "OPTIONS:\n"
      "    -h, --help               Print this help and exit\n"
      "    -V, --version            Print the version and exit\n"
      "    -g, --glob <GLOB>        Use the files matching GLOB instead of "
      "FILENAME\n"
      "    -o, --output <OUTPUT>    Export captured groups to OUTPUT (CSV, or "
      "TSV for *.tsv)\n"
      "    -p, --pattern <REGEX>    Initial pattern\n"
      "        --print              Print matching lines and exit\n"
      "        --font <TTF>         Font used by the window\n"
      "\n"
      "KEYS:\n"
      "    Ctrl+S  export    Ctrl+F  only matching lines    Esc  quit\n",
      IRE_VERSION, argv0 ? argv0 : "ire");
}
