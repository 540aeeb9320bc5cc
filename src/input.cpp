#include "input.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <mio/mmap.hpp>

#include "matcher.hpp"
#include "pattern.hpp"

#include <Tracy.hpp>

namespace fs = std::filesystem;

InputDocument Document_FromString(std::string path, std::string content) {
  InputDocument ret;
  ret.path = std::move(path);
  ret.content = std::move(content);

  const auto *pContents = ret.content.data();
  const size_t offEnd = ret.content.size();
  size_t offCursor = 0;

  LineInfo currentLine;
  currentLine.offStart = offCursor;

  while (offCursor != offEnd) {
    if (pContents[offCursor] == '\n') {
      currentLine.offEnd = offCursor;
      if (currentLine.offEnd > currentLine.offStart &&
          pContents[currentLine.offEnd - 1] == '\r') {
        currentLine.offEnd -= 1;
      }
      ret.lineInfo.push_back(currentLine);
      currentLine.offStart = offCursor + 1;
    }

    offCursor += 1;
  }

  // Last line, unless the content ended with a terminator
  if (currentLine.offStart != offEnd) {
    currentLine.offEnd = offEnd;
    ret.lineInfo.push_back(currentLine);
  }

  return ret;
}

InputStatus Input_ReadDocument(std::shared_ptr<const InputDocument> &out,
                               const std::string &path,
                               std::string &error) {
  ZoneScoped;
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    error = fmt::format("'{}': no such file", path);
    return Input_NotFound;
  }

  if (fs::is_directory(status)) {
    error = fmt::format("'{}': is a directory", path);
    return Input_ReadFailure;
  }

  auto size = fs::file_size(path, ec);
  if (ec) {
    error = fmt::format("'{}': {}", path, ec.message());
    return Input_ReadFailure;
  }

  std::string content;
  // Mapping a zero-length file fails
  if (size > 0) {
    mio::mmap_source mmap;
    mmap.map(path, ec);
    if (ec) {
      error = fmt::format("'{}': {}", path, ec.message());
      return Input_ReadFailure;
    }
    content.assign(mmap.data(), mmap.size());
  }

  out = std::make_shared<const InputDocument>(
      Document_FromString(path, std::move(content)));
  return Input_OK;
}

InputStatus Input_ReadDocuments(DocumentList &out,
                                const std::vector<std::string> &paths,
                                std::string &error) {
  for (auto &path : paths) {
    std::shared_ptr<const InputDocument> document;
    auto rc = Input_ReadDocument(document, path, error);
    if (rc != Input_OK) {
      return rc;
    }
    out.push_back(std::move(document));
  }

  return Input_OK;
}

static bool IsGlobSpecial(char ch) {
  return ch == '*' || ch == '?' || ch == '[' || ch == '{' || ch == '\\';
}

static void AppendLiteral(std::string &out, char ch) {
  if (uint8_t(ch) >= 0x80 || std::isalnum((unsigned char)ch) || ch == '/') {
    out += ch;
  } else {
    out += '\\';
    out += ch;
  }
}

InputStatus Glob_ToRegex(std::string &out,
                         bool &recursive,
                         const std::string &glob,
                         std::string &error) {
  out = "^";
  recursive = false;
  int braceDepth = 0;
  const size_t len = glob.size();

  for (size_t i = 0; i < len; i++) {
    char ch = glob[i];
    // Wildcards never match a leading '.' of a path component
    bool atComponentStart = i == 0 || glob[i - 1] == '/';

    switch (ch) {
      case '*': {
        if (i + 1 < len && glob[i + 1] == '*') {
          recursive = true;
          bool wholeComponent =
              atComponentStart && (i + 2 == len || glob[i + 2] == '/');
          if (wholeComponent && i + 2 < len) {
            out += "(?:[^/.][^/]*/)*";
            i += 2;
          } else if (wholeComponent) {
            out += "(?:[^/.][^/]*/)*[^/.][^/]*";
            i += 1;
          } else {
            out += "[^/]*";
            i += 1;
          }
        } else {
          out += atComponentStart ? "(?![.])[^/]*" : "[^/]*";
        }
        break;
      }
      case '?': {
        out += atComponentStart ? "[^/.]" : "[^/]";
        break;
      }
      case '[': {
        size_t j = i + 1;
        bool negated = false;
        if (j < len && (glob[j] == '!' || glob[j] == '^')) {
          negated = true;
          j++;
        }
        size_t offFirst = j;
        if (j < len && glob[j] == ']') {
          j++;
        }
        while (j < len && glob[j] != ']') {
          j++;
        }
        if (j >= len) {
          error = fmt::format("unterminated '[' at offset {} in '{}'", i, glob);
          return Input_BadGlob;
        }

        out += negated ? "[^/" : "[";
        for (size_t k = offFirst; k < j; k++) {
          char c = glob[k];
          if (c == '\\' || c == '^' || c == '[' || c == ']') {
            out += '\\';
          }
          out += c;
        }
        out += ']';
        i = j;
        break;
      }
      case '{': {
        braceDepth++;
        out += "(?:";
        break;
      }
      case ',': {
        out += braceDepth > 0 ? "|" : ",";
        break;
      }
      case '}': {
        if (braceDepth > 0) {
          braceDepth--;
          out += ')';
        } else {
          out += "\\}";
        }
        break;
      }
      case '\\': {
        if (i + 1 >= len) {
          error = fmt::format("trailing '\\' in '{}'", glob);
          return Input_BadGlob;
        }
        AppendLiteral(out, glob[++i]);
        break;
      }
      default:
        AppendLiteral(out, ch);
        break;
    }
  }

  if (braceDepth > 0) {
    error = fmt::format("unterminated '{{' in '{}'", glob);
    return Input_BadGlob;
  }

  out += '$';
  return Input_OK;
}

InputStatus Input_ExpandGlob(std::vector<std::string> &out,
                             const std::string &glob,
                             std::string &error) {
  ZoneScoped;

  // Split off the leading components that contain no wildcards; they name
  // the directory the walk starts from
  std::vector<std::string> components;
  size_t offComponent = 0;
  while (true) {
    auto offSlash = glob.find('/', offComponent);
    if (offSlash == std::string::npos) {
      components.push_back(glob.substr(offComponent));
      break;
    }
    components.push_back(glob.substr(offComponent, offSlash - offComponent));
    offComponent = offSlash + 1;
  }

  size_t numLiteral = 0;
  while (numLiteral < components.size() &&
         std::none_of(components[numLiteral].begin(),
                      components[numLiteral].end(), IsGlobSpecial)) {
    numLiteral++;
  }

  if (numLiteral == components.size()) {
    std::error_code ec;
    if (fs::is_regular_file(glob, ec)) {
      out.push_back(glob);
      return Input_OK;
    }
    error = fmt::format("no files matched '{}'", glob);
    return Input_NoMatches;
  }

  std::string prefix;
  for (size_t i = 0; i < numLiteral; i++) {
    prefix += components[i];
    prefix += '/';
  }

  std::string rel;
  for (size_t i = numLiteral; i < components.size(); i++) {
    if (i != numLiteral) {
      rel += '/';
    }
    rel += components[i];
  }

  // "/" stays as is for absolute globs; otherwise drop the trailing slash
  auto rootName = prefix.size() > 1 ? prefix.substr(0, prefix.size() - 1)
                                    : prefix;
  fs::path root = rootName.empty() ? fs::path(".") : fs::path(rootName);
  size_t maxDepth = std::count(rel.begin(), rel.end(), '/');

  std::string regex;
  bool recursive = false;
  auto rc = Glob_ToRegex(regex, recursive, rel, error);
  if (rc != Input_OK) {
    return rc;
  }

  CompileError compileError;
  auto pattern = CompiledPattern::Make(regex, compileError);
  if (!pattern) {
    error = fmt::format("bad glob '{}': {}", glob, compileError.message);
    return Input_BadGlob;
  }
  LineMatcher pathMatcher(*pattern);

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    error = fmt::format("no files matched '{}'", glob);
    return Input_NoMatches;
  }

  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    std::error_code ecEntry;
    auto &entry = *it;
    if (entry.is_directory(ecEntry)) {
      if (!recursive && size_t(it.depth()) >= maxDepth) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(ecEntry)) {
      auto relPath = entry.path().lexically_relative(root).generic_string();
      if (pathMatcher.Match(relPath).matched) {
        out.push_back(prefix + relPath);
      }
    }
    it.increment(ec);
  }

  if (ec) {
    error = fmt::format("'{}': {}", root.string(), ec.message());
    return Input_ReadFailure;
  }

  if (out.empty()) {
    error = fmt::format("no files matched '{}'", glob);
    return Input_NoMatches;
  }

  std::sort(out.begin(), out.end());
  return Input_OK;
}

InputStatus Input_ResolveFiles(std::vector<std::string> &out,
                               const Config &config,
                               std::string &error) {
  if (config.glob) {
    if (config.filename) {
      fmt::print(stderr, "[input] --glob given, ignoring FILENAME '{}'\n",
                 *config.filename);
    }
    return Input_ExpandGlob(out, *config.glob, error);
  }

  if (!config.filename) {
    error = "no input file";
    return Input_NotFound;
  }

  out.push_back(*config.filename);
  return Input_OK;
}
