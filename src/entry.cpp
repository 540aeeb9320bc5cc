#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/core.h>

#include "app.hpp"
#include "config.hpp"
#include "session.hpp"
#include "ui.hpp"

int main(int argc, char **argv) {
  Config config;
  std::string error;

  switch (Config_Parse(config, error, argc, argv)) {
    case Config_OK:
      break;
    case Config_Help:
      fmt::print("{}", Config_Usage(argv[0]));
      return EXIT_SUCCESS;
    case Config_Version:
      fmt::print("ire {}\n", IRE_VERSION);
      return EXIT_SUCCESS;
    case Config_BadArguments:
      fmt::print(stderr, "error: {}\n\n{}", error, Config_Usage(argv[0]));
      return EXIT_FAILURE;
  }

  DocumentList documents;
  if (App_LoadInputs(documents, config) != EXIT_SUCCESS) {
    return EXIT_FAILURE;
  }

  Session session(std::move(documents), config.output);
  if (config.pattern) {
    session.Push(SessionEvent::SetPattern(*config.pattern));
    session.ProcessEvents();
  }

  if (config.printOnly) {
    return App_RunBatch(session, config, stdout);
  }

  return UI_Run(session, config);
}
