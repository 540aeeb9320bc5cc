#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct LineInfo {
  size_t offStart;
  // Excludes the line terminator
  size_t offEnd;
};

struct InputDocument {
  std::string path;
  std::string content;
  std::vector<LineInfo> lineInfo;

  size_t NumLines() const { return lineInfo.size(); }

  std::string_view GetLine(size_t idxLine) const {
    auto &line = lineInfo[idxLine];
    return std::string_view(content).substr(line.offStart,
                                            line.offEnd - line.offStart);
  }
};

using DocumentList = std::vector<std::shared_ptr<const InputDocument>>;

struct PositionalLabel {
  uint32_t idxGroup;

  bool operator==(const PositionalLabel &other) const {
    return idxGroup == other.idxGroup;
  }
};

struct NamedLabel {
  std::string name;

  bool operator==(const NamedLabel &other) const { return name == other.name; }
};

using GroupLabel = std::variant<PositionalLabel, NamedLabel>;

inline std::string GroupLabel_ToString(const GroupLabel &label) {
  if (auto *named = std::get_if<NamedLabel>(&label)) {
    return named->name;
  }
  return "group_" + std::to_string(std::get<PositionalLabel>(label).idxGroup);
}

struct GroupInfo {
  uint32_t idxGroup;
  GroupLabel label;

  bool operator==(const GroupInfo &other) const {
    return idxGroup == other.idxGroup && label == other.label;
  }
};

struct CaptureGroup {
  uint32_t idxGroup;
  GroupLabel label;
  size_t offStart;
  size_t offEnd;
  std::string text;

  bool operator==(const CaptureGroup &other) const {
    return idxGroup == other.idxGroup && label == other.label &&
           offStart == other.offStart && offEnd == other.offEnd &&
           text == other.text;
  }
};

struct LineMatchResult {
  size_t idxDocument = 0;
  size_t idxLine = 0;

  bool matched = false;
  // Set when the engine gave up on this line (match limit etc.)
  bool matchError = false;
  int errorCode = 0;

  // Whole match, only meaningful when matched
  size_t offStart = 0;
  size_t offEnd = 0;

  // Empty unless matched; ascending group number
  std::vector<CaptureGroup> captures;

  bool operator==(const LineMatchResult &other) const {
    return idxDocument == other.idxDocument && idxLine == other.idxLine &&
           matched == other.matched && matchError == other.matchError &&
           errorCode == other.errorCode && offStart == other.offStart &&
           offEnd == other.offEnd && captures == other.captures;
  }
  bool operator!=(const LineMatchResult &other) const {
    return !(*this == other);
  }
};

struct MatchResultSet {
  std::string pattern;
  DocumentList documents;
  std::vector<GroupInfo> groups;
  std::vector<LineMatchResult> lines;

  size_t NumMatched() const {
    size_t ret = 0;
    for (auto &line : lines) {
      if (line.matched) {
        ret++;
      }
    }
    return ret;
  }

  bool operator==(const MatchResultSet &other) const {
    return pattern == other.pattern && documents == other.documents &&
           groups == other.groups && lines == other.lines;
  }
  bool operator!=(const MatchResultSet &other) const {
    return !(*this == other);
  }
};
