#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "data.hpp"
#include "pattern.hpp"

enum {
  NUM_HIGHLIGHT_COLORS = 3,
};

struct HighlightSpan {
  size_t offStart;
  size_t offEnd;
  uint32_t idxGroup;
  std::string label;
};

struct DisplayLine {
  std::string_view source;
  size_t lineNumber;
  // Points into a document kept alive by DisplayModel::documents
  std::string_view text;
  bool matched;
  bool matchError;
  std::vector<HighlightSpan> spans;
};

struct DisplayModel {
  DocumentList documents;
  std::vector<DisplayLine> lines;
  size_t numLines = 0;
  size_t numMatched = 0;
  size_t numErrors = 0;
};

struct DisplaySegment {
  std::string_view text;
  bool highlighted;
  uint32_t idxGroup;
  size_t idxColor;
};

DisplayModel Render_Results(const MatchResultSet &results,
                            bool onlyMatched = false);

// Splits the line into plain and highlighted runs. Inside a nested group the
// inner group wins; the enclosing group resumes after it ends.
std::vector<DisplaySegment> Render_Segments(const DisplayLine &line);

// Line text with the captured segments colored with ANSI escapes
std::string Render_Ansi(const DisplayLine &line);

// "message\npattern\n   ^"
std::string Render_CompileError(const std::string &pattern,
                                const CompileError &error);
