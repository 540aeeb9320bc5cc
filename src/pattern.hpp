#pragma once

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <optional>
#include <string>
#include <vector>

#include "data.hpp"

struct CompileError {
  std::string message;
  // Byte offset into the pattern where the error was detected
  std::optional<size_t> offError;
};

struct CompiledPattern {
  std::string source;
  pcre2_code *code = nullptr;
  std::vector<GroupInfo> groups;

  CompiledPattern(const CompiledPattern &) = delete;
  CompiledPattern &operator=(const CompiledPattern &) = delete;
  CompiledPattern(CompiledPattern &&other);
  CompiledPattern &operator=(CompiledPattern &&other);
  ~CompiledPattern();

  uint32_t NumGroups() const { return (uint32_t)groups.size(); }

  static std::optional<CompiledPattern> Make(const std::string &pattern,
                                             CompileError &error);

 private:
  CompiledPattern(std::string source, pcre2_code *code)
      : source(std::move(source)), code(code) {}
};
