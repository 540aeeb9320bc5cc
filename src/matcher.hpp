#pragma once

#include <string_view>

#include "data.hpp"
#include "pattern.hpp"

enum {
  MATCH_LIMIT = 1'000'000,
  MATCH_DEPTH_LIMIT = 100'000,
};

struct LineMatcher {
  const CompiledPattern *pattern = nullptr;
  pcre2_match_data *matchData = nullptr;
  pcre2_match_context *matchContext = nullptr;

  explicit LineMatcher(const CompiledPattern &pattern);
  LineMatcher(const LineMatcher &) = delete;
  LineMatcher &operator=(const LineMatcher &) = delete;
  ~LineMatcher();

  // Reports the leftmost match of the pattern in `line` and the groups that
  // took part in it.
  LineMatchResult Match(std::string_view line);
};

MatchResultSet Match_Documents(const CompiledPattern &pattern,
                               const DocumentList &documents);

// Result set used while no pattern is entered: every line is unmatched
MatchResultSet Match_NoPattern(const DocumentList &documents);
