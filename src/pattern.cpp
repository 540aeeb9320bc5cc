#include "pattern.hpp"

#include <utility>

#include <fmt/core.h>

#include <Tracy.hpp>

CompiledPattern::CompiledPattern(CompiledPattern &&other) {
  std::swap(source, other.source);
  std::swap(code, other.code);
  std::swap(groups, other.groups);
}

CompiledPattern &CompiledPattern::operator=(CompiledPattern &&other) {
  if (this != &other) {
    std::swap(source, other.source);
    std::swap(code, other.code);
    std::swap(groups, other.groups);
  }
  return *this;
}

CompiledPattern::~CompiledPattern() {
  pcre2_code_free(code);
}

static std::vector<GroupInfo> ReadGroupTable(pcre2_code *code) {
  uint32_t numGroups = 0;
  pcre2_pattern_info(code, PCRE2_INFO_CAPTURECOUNT, &numGroups);

  std::vector<GroupInfo> groups;
  groups.reserve(numGroups);
  for (uint32_t idxGroup = 1; idxGroup <= numGroups; idxGroup++) {
    groups.push_back({idxGroup, PositionalLabel{idxGroup}});
  }

  uint32_t numNames = 0;
  uint32_t sizEntry = 0;
  PCRE2_SPTR nameTable = nullptr;
  pcre2_pattern_info(code, PCRE2_INFO_NAMECOUNT, &numNames);
  if (numNames == 0) {
    return groups;
  }
  pcre2_pattern_info(code, PCRE2_INFO_NAMEENTRYSIZE, &sizEntry);
  pcre2_pattern_info(code, PCRE2_INFO_NAMETABLE, &nameTable);

  // Each entry is a big-endian 16-bit group number followed by the
  // null-terminated name
  for (uint32_t idxName = 0; idxName < numNames; idxName++) {
    auto *entry = nameTable + idxName * sizEntry;
    uint32_t idxGroup = (uint32_t(entry[0]) << 8) | uint32_t(entry[1]);
    if (idxGroup == 0 || idxGroup > numGroups) {
      continue;
    }
    groups[idxGroup - 1].label = NamedLabel{(const char *)(entry + 2)};
  }

  return groups;
}

std::optional<CompiledPattern> CompiledPattern::Make(const std::string &pattern,
                                                     CompileError &error) {
  ZoneScoped;
  int rc;
  PCRE2_SIZE offError;
  auto *code = pcre2_compile((PCRE2_SPTR8)pattern.c_str(), pattern.size(),
                             PCRE2_UTF | PCRE2_MATCH_INVALID_UTF, &rc,
                             &offError, nullptr);

  if (code == nullptr) {
    PCRE2_UCHAR8 buffer[256];
    if (pcre2_get_error_message(rc, buffer, sizeof(buffer)) < 0) {
      error.message = fmt::format("compile error {}", rc);
    } else {
      error.message = std::string((const char *)buffer);
    }
    error.offError = offError;
    return std::nullopt;
  }

  CompiledPattern ret(pattern, code);
  ret.groups = ReadGroupTable(code);
  return std::optional<CompiledPattern>(std::move(ret));
}
