#include "session.hpp"

#include <fmt/core.h>

#include "matcher.hpp"

#include <Tracy.hpp>

const char *Session_StateName(SessionState state) {
  switch (state) {
    case Session_Editing:
      return "editing";
    case Session_Displaying:
      return "displaying";
    case Session_Exporting:
      return "exporting";
    case Session_Terminated:
      return "terminated";
  }
  return "";
}

Session::Session(DocumentList documents, std::optional<std::string> pathOutput)
    : documents(std::move(documents)), pathOutput(std::move(pathOutput)) {
  results = Match_NoPattern(this->documents);
  display = Render_Results(results, onlyMatched);
}

void Session::Push(SessionEvent &&event) {
  if (state == Session_Terminated) {
    return;
  }
  events.push_back(std::move(event));
}

void Session::ProcessEvents() {
  ZoneScoped;
  bool dirty = false;

  while (!events.empty() && state != Session_Terminated) {
    auto event = std::move(events.front());
    events.pop_front();

    if (ApplyEdit(event)) {
      dirty = true;
      continue;
    }

    if (dirty) {
      Recompile();
      dirty = false;
    }

    switch (event.type) {
      case SE_ToggleOnlyMatched:
        onlyMatched = !onlyMatched;
        display = Render_Results(results, onlyMatched);
        break;
      case SE_Export:
        Export(event.text);
        break;
      case SE_Quit:
        Terminate();
        break;
      default:
        break;
    }
  }

  if (dirty && state != Session_Terminated) {
    Recompile();
  }
}

// Returns true when the event was a pattern edit, whether or not it changed
// the text
bool Session::ApplyEdit(const SessionEvent &event) {
  switch (event.type) {
    case SE_SetPattern:
      pattern.Set(event.text);
      return true;
    case SE_InsertChar:
      if (!pattern.Insert(event.codepoint)) {
        fmt::print(stderr, "[session] ignoring invalid codepoint U+{:X}\n",
                   event.codepoint);
      }
      return true;
    case SE_DeleteChar:
      pattern.DeleteChar();
      return true;
    case SE_DeleteForward:
      pattern.DeleteForward();
      return true;
    case SE_DeleteWord:
      pattern.DeleteWord();
      return true;
    case SE_ClearPattern:
      pattern.Clear();
      return true;
    case SE_CursorLeft:
      pattern.Left();
      return true;
    case SE_CursorRight:
      pattern.Right();
      return true;
    case SE_CursorHome:
      pattern.Home();
      return true;
    case SE_CursorEnd:
      pattern.End();
      return true;
    case SE_CursorNextWord:
      pattern.NextBoundary();
      return true;
    case SE_CursorPrevWord:
      pattern.PreviousBoundary();
      return true;
    default:
      return false;
  }
}

void Session::Recompile() {
  ZoneScoped;
  auto &text = pattern.str();

  // Cursor moves leave the text alone; nothing to redo
  if (compiled && !compileError && compiled->source == text) {
    return;
  }
  if (!compiled && !compileError && text.empty()) {
    return;
  }
  numRecompiles++;

  if (text.empty()) {
    compiled.reset();
    compileError.reset();
    results = Match_NoPattern(documents);
    display = Render_Results(results, onlyMatched);
    state = Session_Editing;
    return;
  }

  CompileError error;
  auto candidate = CompiledPattern::Make(text, error);
  if (!candidate) {
    // Keep the last good pattern and its results on screen
    compileError = std::move(error);
    state = Session_Editing;
    return;
  }

  compileError.reset();
  compiled = std::move(candidate);
  results = Match_Documents(*compiled, documents);
  display = Render_Results(results, onlyMatched);
  state = Session_Displaying;
}

void Session::Export(const std::string &pathOverride) {
  ZoneScoped;
  exportSerial++;

  if (!pathOverride.empty()) {
    pathOutput = pathOverride;
  }

  ExportReport report;
  if (!compiled) {
    report.status = Export_NothingToExport;
    report.message = "nothing to export: no pattern has been applied";
  } else if (!pathOutput) {
    report.status = Export_NoDestination;
    report.message = "nothing to export to: no output path (use --output)";
  } else {
    auto previousState = state;
    state = Session_Exporting;
    report = Export_ToFile(results, *pathOutput);
    state = previousState;
  }

  if (report.status == Export_OK) {
    fmt::print(stderr, "[export] {}: {}\n", report.path, report.message);
  } else {
    fmt::print(stderr, "[export] failed: {}\n", report.message);
  }
  lastExport = std::move(report);
}

void Session::Terminate() {
  state = Session_Terminated;
  events.clear();
  compiled.reset();
  compileError.reset();
  display = DisplayModel();
  results = MatchResultSet();
  documents.clear();
}
