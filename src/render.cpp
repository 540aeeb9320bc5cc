#include "render.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

#include <Tracy.hpp>

static const fmt::terminal_color HIGHLIGHT_COLORS[NUM_HIGHLIGHT_COLORS] = {
    fmt::terminal_color::yellow,
    fmt::terminal_color::blue,
    fmt::terminal_color::red,
};

DisplayModel Render_Results(const MatchResultSet &results, bool onlyMatched) {
  ZoneScoped;
  DisplayModel ret;
  ret.documents = results.documents;
  ret.numLines = results.lines.size();
  ret.lines.reserve(onlyMatched ? results.NumMatched() : results.lines.size());

  for (auto &result : results.lines) {
    if (result.matched) {
      ret.numMatched++;
    }
    if (result.matchError) {
      ret.numErrors++;
    }
    if (onlyMatched && !result.matched) {
      continue;
    }

    auto &document = *results.documents[result.idxDocument];

    DisplayLine line;
    line.source = document.path;
    line.lineNumber = result.idxLine + 1;
    line.text = document.GetLine(result.idxLine);
    line.matched = result.matched;
    line.matchError = result.matchError;
    for (auto &capture : result.captures) {
      line.spans.push_back({capture.offStart, capture.offEnd, capture.idxGroup,
                            GroupLabel_ToString(capture.label)});
    }
    ret.lines.push_back(std::move(line));
  }

  return ret;
}

std::vector<DisplaySegment> Render_Segments(const DisplayLine &line) {
  std::vector<DisplaySegment> ret;
  if (line.text.empty()) {
    return ret;
  }

  // Owning group per byte, 0 for plain text. Spans are in ascending group
  // order so an inner group paints over its enclosing one.
  std::vector<uint32_t> owner(line.text.size(), 0);
  for (auto &span : line.spans) {
    auto offEnd = std::min(span.offEnd, line.text.size());
    for (size_t off = span.offStart; off < offEnd; off++) {
      owner[off] = span.idxGroup;
    }
  }

  size_t offRun = 0;
  for (size_t off = 1; off <= owner.size(); off++) {
    if (off < owner.size() && owner[off] == owner[offRun]) {
      continue;
    }

    DisplaySegment segment;
    segment.text = line.text.substr(offRun, off - offRun);
    segment.idxGroup = owner[offRun];
    segment.highlighted = segment.idxGroup != 0;
    segment.idxColor =
        segment.highlighted ? (segment.idxGroup - 1) % NUM_HIGHLIGHT_COLORS : 0;
    ret.push_back(segment);
    offRun = off;
  }

  return ret;
}

std::string Render_Ansi(const DisplayLine &line) {
  std::string ret;
  for (auto &segment : Render_Segments(line)) {
    if (segment.highlighted) {
      ret += fmt::format(fmt::fg(HIGHLIGHT_COLORS[segment.idxColor]), "{}",
                         segment.text);
    } else {
      ret += segment.text;
    }
  }
  return ret;
}

std::string Render_CompileError(const std::string &pattern,
                                const CompileError &error) {
  if (!error.offError) {
    return error.message;
  }

  // One caret column per codepoint before the offset
  size_t column = 0;
  auto offError = std::min(*error.offError, pattern.size());
  for (size_t off = 0; off < offError; off++) {
    if ((uint8_t(pattern[off]) & 0xC0) != 0x80) {
      column++;
    }
  }

  return fmt::format("{}\n{}\n{}^", error.message, pattern,
                     std::string(column, ' '));
}
