#include "matcher.hpp"

#include <algorithm>

#include <fmt/core.h>

#include <Tracy.hpp>

LineMatcher::LineMatcher(const CompiledPattern &pattern) : pattern(&pattern) {
  matchData = pcre2_match_data_create_from_pattern(pattern.code, nullptr);
  matchContext = pcre2_match_context_create(nullptr);
  if (matchContext != nullptr) {
    pcre2_set_match_limit(matchContext, MATCH_LIMIT);
    pcre2_set_depth_limit(matchContext, MATCH_DEPTH_LIMIT);
  }
}

LineMatcher::~LineMatcher() {
  pcre2_match_context_free(matchContext);
  pcre2_match_data_free(matchData);
}

LineMatchResult LineMatcher::Match(std::string_view line) {
  LineMatchResult result;

  if (matchData == nullptr) {
    result.matchError = true;
    result.errorCode = PCRE2_ERROR_NOMEMORY;
    return result;
  }

  static const char empty[] = "";
  const char *subject = line.data() != nullptr ? line.data() : empty;

  int rc = pcre2_match(pattern->code, (PCRE2_SPTR8)subject, line.size(), 0, 0,
                       matchData, matchContext);
  if (rc < 0) {
    if (rc != PCRE2_ERROR_NOMATCH) {
      result.matchError = true;
      result.errorCode = rc;
    }
    return result;
  }

  auto *ovector = pcre2_get_ovector_pointer(matchData);
  auto numPairs = pcre2_get_ovector_count(matchData);

  result.matched = true;
  result.offStart = ovector[0];
  result.offEnd = ovector[1];
  // \K inside a lookahead can put the start past the end
  if (result.offStart > result.offEnd) {
    result.offStart = result.offEnd;
  }

  for (auto &group : pattern->groups) {
    auto idxGroup = group.idxGroup;
    if (idxGroup >= numPairs || (rc != 0 && idxGroup >= (uint32_t)rc)) {
      continue;
    }

    auto offStart = ovector[2 * idxGroup];
    auto offEnd = ovector[2 * idxGroup + 1];
    if (offStart == PCRE2_UNSET || offEnd == PCRE2_UNSET ||
        offStart > offEnd || offEnd > line.size()) {
      continue;
    }

    CaptureGroup capture;
    capture.idxGroup = idxGroup;
    capture.label = group.label;
    capture.offStart = offStart;
    capture.offEnd = offEnd;
    capture.text = std::string(line.substr(offStart, offEnd - offStart));
    result.captures.push_back(std::move(capture));
  }

  return result;
}

MatchResultSet Match_Documents(const CompiledPattern &pattern,
                               const DocumentList &documents) {
  ZoneScoped;
  MatchResultSet ret;
  ret.pattern = pattern.source;
  ret.documents = documents;
  ret.groups = pattern.groups;

  LineMatcher matcher(pattern);
  size_t numErrors = 0;

  for (size_t idxDocument = 0; idxDocument < documents.size(); idxDocument++) {
    ZoneScopedN("Match document");
    auto &document = *documents[idxDocument];
    ZoneText(document.path.c_str(), document.path.size());
    for (size_t idxLine = 0; idxLine < document.NumLines(); idxLine++) {
      auto result = matcher.Match(document.GetLine(idxLine));
      result.idxDocument = idxDocument;
      result.idxLine = idxLine;
      if (result.matchError) {
        numErrors++;
      }
      ret.lines.push_back(std::move(result));
    }
  }

  if (numErrors > 0) {
    PCRE2_UCHAR8 msg[128];
    auto &first = *std::find_if(ret.lines.begin(), ret.lines.end(),
                                [](auto &line) { return line.matchError; });
    if (pcre2_get_error_message(first.errorCode, msg, sizeof(msg)) < 0) {
      fmt::print(stderr, "[match] {} line(s) failed to match: error {}\n",
                 numErrors, first.errorCode);
    } else {
      fmt::print(stderr, "[match] {} line(s) failed to match: {}\n",
                 numErrors, (const char *)msg);
    }
  }

  return ret;
}

MatchResultSet Match_NoPattern(const DocumentList &documents) {
  MatchResultSet ret;
  ret.documents = documents;

  for (size_t idxDocument = 0; idxDocument < documents.size(); idxDocument++) {
    auto numLines = documents[idxDocument]->NumLines();
    for (size_t idxLine = 0; idxLine < numLines; idxLine++) {
      LineMatchResult result;
      result.idxDocument = idxDocument;
      result.idxLine = idxLine;
      ret.lines.push_back(std::move(result));
    }
  }

  return ret;
}
