#include "app.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#if _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "export.hpp"
#include "input.hpp"
#include "render.hpp"

static bool IsTerminal(FILE *stream) {
#if _WIN32
  return _isatty(_fileno(stream)) != 0;
#else
  return isatty(fileno(stream)) != 0;
#endif
}

int App_LoadInputs(DocumentList &out, const Config &config) {
  std::string error;

  std::vector<std::string> paths;
  if (Input_ResolveFiles(paths, config, error) != Input_OK) {
    fmt::print(stderr, "error: {}\n", error);
    return EXIT_FAILURE;
  }

  if (Input_ReadDocuments(out, paths, error) != Input_OK) {
    fmt::print(stderr, "error: {}\n", error);
    return EXIT_FAILURE;
  }

  if (config.output && !Export_CheckDestination(*config.output, error)) {
    fmt::print(stderr, "error: {}\n", error);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

int App_RunBatch(Session &session, const Config &config, FILE *out) {
  if (auto &error = session.GetCompileError()) {
    fmt::print(stderr, "error: {}\n",
               Render_CompileError(session.GetPattern().str(), *error));
    return EXIT_BAD_PATTERN;
  }

  bool colored = IsTerminal(out);
  auto &display = session.GetDisplay();
  for (auto &line : display.lines) {
    if (!line.matched) {
      continue;
    }
    auto text = colored ? Render_Ansi(line) : std::string(line.text);
    if (display.documents.size() > 1) {
      fmt::print(out, "{}:{}: {}\n", line.source, line.lineNumber, text);
    } else {
      fmt::print(out, "{}: {}\n", line.lineNumber, text);
    }
  }

  int ret = EXIT_SUCCESS;
  if (config.output) {
    session.Push(SessionEvent::Export());
    session.ProcessEvents();
    auto &report = session.GetLastExport();
    if (!report || report->status != Export_OK) {
      ret = EXIT_FAILURE;
    }
  }

  session.Push(SessionEvent::Of(SE_Quit));
  session.ProcessEvents();
  return ret;
}
