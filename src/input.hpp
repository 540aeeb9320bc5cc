#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "data.hpp"

enum InputStatus {
  Input_OK = 0,
  Input_NotFound,
  Input_ReadFailure,
  Input_BadGlob,
  Input_NoMatches,
};

// Splits `content` into lines; "\r\n" and "\n" both end a line and a final
// terminator does not start an empty line
InputDocument Document_FromString(std::string path, std::string content);

InputStatus Input_ReadDocument(std::shared_ptr<const InputDocument> &out,
                               const std::string &path,
                               std::string &error);

InputStatus Input_ReadDocuments(DocumentList &out,
                                const std::vector<std::string> &paths,
                                std::string &error);

// Translates the glob into an anchored PCRE2 pattern over '/'-separated
// relative paths. Sets `recursive` when the glob contains "**".
InputStatus Glob_ToRegex(std::string &out,
                         bool &recursive,
                         const std::string &glob,
                         std::string &error);

InputStatus Input_ExpandGlob(std::vector<std::string> &out,
                             const std::string &glob,
                             std::string &error);

// The glob when one is configured, FILENAME otherwise
InputStatus Input_ResolveFiles(std::vector<std::string> &out,
                               const Config &config,
                               std::string &error);
