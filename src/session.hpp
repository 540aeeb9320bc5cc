#pragma once

#include <deque>
#include <optional>
#include <string>

#include "data.hpp"
#include "export.hpp"
#include "pattern.hpp"
#include "render.hpp"
#include "utf8.hpp"

enum SessionState {
  Session_Editing = 0,
  Session_Displaying,
  Session_Exporting,
  Session_Terminated,
};

enum SessionEventType {
  SE_SetPattern = 0,
  SE_InsertChar,
  SE_DeleteChar,
  SE_DeleteForward,
  SE_DeleteWord,
  SE_ClearPattern,
  SE_CursorLeft,
  SE_CursorRight,
  SE_CursorHome,
  SE_CursorEnd,
  SE_CursorNextWord,
  SE_CursorPrevWord,
  SE_ToggleOnlyMatched,
  SE_Export,
  SE_Quit,
};

struct SessionEvent {
  SessionEventType type;
  uint32_t codepoint = 0;
  // Pattern for SE_SetPattern, optional destination for SE_Export
  std::string text;

  static SessionEvent SetPattern(std::string pattern) {
    return {SE_SetPattern, 0, std::move(pattern)};
  }
  static SessionEvent InsertChar(uint32_t codepoint) {
    return {SE_InsertChar, codepoint, {}};
  }
  static SessionEvent Export(std::string path = {}) {
    return {SE_Export, 0, std::move(path)};
  }
  static SessionEvent Of(SessionEventType type) { return {type, 0, {}}; }
};

const char *Session_StateName(SessionState state);

struct Session {
  Session(DocumentList documents, std::optional<std::string> pathOutput);

  void Push(SessionEvent &&event);
  // Handles every queued event in order. Runs of pattern edits are coalesced
  // into one recompilation on the final text.
  void ProcessEvents();

  SessionState GetState() const { return state; }
  const EditableUtf8String &GetPattern() const { return pattern; }
  const std::optional<CompileError> &GetCompileError() const {
    return compileError;
  }
  // Last successfully compiled pattern; empty while no pattern is entered
  const std::optional<CompiledPattern> &GetCompiled() const {
    return compiled;
  }
  const MatchResultSet &GetResults() const { return results; }
  const DisplayModel &GetDisplay() const { return display; }
  bool IsOnlyMatched() const { return onlyMatched; }
  const std::optional<std::string> &GetOutputPath() const {
    return pathOutput;
  }
  const std::optional<ExportReport> &GetLastExport() const {
    return lastExport;
  }
  // Bumped after every export attempt
  uint32_t GetExportSerial() const { return exportSerial; }
  uint32_t GetRecompileCount() const { return numRecompiles; }

 private:
  bool ApplyEdit(const SessionEvent &event);
  void Recompile();
  void Export(const std::string &pathOverride);
  void Terminate();

  SessionState state = Session_Editing;
  DocumentList documents;
  std::deque<SessionEvent> events;

  EditableUtf8String pattern;
  std::optional<CompiledPattern> compiled;
  std::optional<CompileError> compileError;

  MatchResultSet results;
  DisplayModel display;
  bool onlyMatched = false;

  std::optional<std::string> pathOutput;
  std::optional<ExportReport> lastExport;
  uint32_t exportSerial = 0;
  uint32_t numRecompiles = 0;
};
