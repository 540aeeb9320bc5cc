#include <gtest/gtest.h>

#include "input.hpp"
#include "matcher.hpp"
#include "test_util.hpp"

static bool GlobMatches(const std::string &glob, const std::string &path) {
  std::string regex, error;
  bool recursive;
  EXPECT_EQ(Input_OK, Glob_ToRegex(regex, recursive, glob, error)) << error;
  CompileError compileError;
  auto pattern = CompiledPattern::Make(regex, compileError);
  EXPECT_TRUE(pattern.has_value()) << regex << ": " << compileError.message;
  if (!pattern) {
    return false;
  }
  LineMatcher matcher(*pattern);
  return matcher.Match(path).matched;
}

TEST(DocumentFromString, SplitsLines) {
  auto document = Document_FromString("f", "one\ntwo\nthree");
  ASSERT_EQ(3u, document.NumLines());
  EXPECT_EQ("one", document.GetLine(0));
  EXPECT_EQ("two", document.GetLine(1));
  EXPECT_EQ("three", document.GetLine(2));
}

TEST(DocumentFromString, FinalTerminatorAddsNoLine) {
  auto document = Document_FromString("f", "one\ntwo\n");
  ASSERT_EQ(2u, document.NumLines());
  EXPECT_EQ("two", document.GetLine(1));
}

TEST(DocumentFromString, StripsCarriageReturns) {
  auto document = Document_FromString("f", "a\r\nb\r\n\r\n");
  ASSERT_EQ(3u, document.NumLines());
  EXPECT_EQ("a", document.GetLine(0));
  EXPECT_EQ("b", document.GetLine(1));
  EXPECT_EQ("", document.GetLine(2));
}

TEST(DocumentFromString, KeepsEmptyLines) {
  auto document = Document_FromString("f", "\n\nx");
  ASSERT_EQ(3u, document.NumLines());
  EXPECT_EQ("", document.GetLine(0));
  EXPECT_EQ("", document.GetLine(1));
  EXPECT_EQ("x", document.GetLine(2));
}

TEST(DocumentFromString, EmptyContentHasNoLines) {
  EXPECT_EQ(0u, Document_FromString("f", "").NumLines());
}

TEST(ReadDocument, ReadsFileContents) {
  TempDir dir;
  auto path = dir.Write("a.txt", "hello\nworld\n");
  std::shared_ptr<const InputDocument> document;
  std::string error;

  ASSERT_EQ(Input_OK, Input_ReadDocument(document, path, error)) << error;
  EXPECT_EQ(path, document->path);
  ASSERT_EQ(2u, document->NumLines());
  EXPECT_EQ("world", document->GetLine(1));
}

TEST(ReadDocument, EmptyFile) {
  TempDir dir;
  auto path = dir.Write("empty.txt", "");
  std::shared_ptr<const InputDocument> document;
  std::string error;

  ASSERT_EQ(Input_OK, Input_ReadDocument(document, path, error)) << error;
  EXPECT_EQ(0u, document->NumLines());
}

TEST(ReadDocument, MissingFile) {
  TempDir dir;
  std::shared_ptr<const InputDocument> document;
  std::string error;

  EXPECT_EQ(Input_NotFound,
            Input_ReadDocument(document, (dir.path / "nope").string(), error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(document);
}

TEST(ReadDocument, DirectoryIsNotReadable) {
  TempDir dir;
  std::shared_ptr<const InputDocument> document;
  std::string error;

  EXPECT_EQ(Input_ReadFailure,
            Input_ReadDocument(document, dir.path.string(), error));
}

TEST(ReadDocuments, StopsAtTheFirstFailure) {
  TempDir dir;
  auto a = dir.Write("a.txt", "a\n");
  DocumentList documents;
  std::string error;

  EXPECT_EQ(Input_NotFound,
            Input_ReadDocuments(documents, {a, (dir.path / "b").string()},
                                error));
  EXPECT_EQ(1u, documents.size());
}

TEST(GlobToRegex, Wildcards) {
  EXPECT_TRUE(GlobMatches("*.log", "app.log"));
  EXPECT_FALSE(GlobMatches("*.log", "app.txt"));
  EXPECT_FALSE(GlobMatches("*.log", "dir/app.log"));
  EXPECT_FALSE(GlobMatches("*.log", ".hidden.log"));

  EXPECT_TRUE(GlobMatches("file?.txt", "file1.txt"));
  EXPECT_FALSE(GlobMatches("file?.txt", "file12.txt"));
}

TEST(GlobToRegex, LiteralCharactersAreEscaped) {
  EXPECT_TRUE(GlobMatches("a+b(1).txt", "a+b(1).txt"));
  EXPECT_FALSE(GlobMatches("a.txt", "abtxt"));
}

TEST(GlobToRegex, ClassesAndAlternatives) {
  EXPECT_TRUE(GlobMatches("log[0-9].txt", "log3.txt"));
  EXPECT_FALSE(GlobMatches("log[0-9].txt", "logx.txt"));
  EXPECT_TRUE(GlobMatches("log[!0-9].txt", "logx.txt"));
  EXPECT_FALSE(GlobMatches("log[!0-9].txt", "log3.txt"));

  EXPECT_TRUE(GlobMatches("*.{csv,tsv}", "data.tsv"));
  EXPECT_TRUE(GlobMatches("*.{csv,tsv}", "data.csv"));
  EXPECT_FALSE(GlobMatches("*.{csv,tsv}", "data.txt"));
}

TEST(GlobToRegex, DoubleStarCrossesDirectories) {
  std::string regex, error;
  bool recursive = false;
  ASSERT_EQ(Input_OK, Glob_ToRegex(regex, recursive, "**/*.log", error));
  EXPECT_TRUE(recursive);

  EXPECT_TRUE(GlobMatches("**/*.log", "a.log"));
  EXPECT_TRUE(GlobMatches("**/*.log", "x/y/a.log"));
  EXPECT_FALSE(GlobMatches("**/*.log", ".git/a.log"));
  EXPECT_TRUE(GlobMatches("src/**", "src/a/b.c"));
  EXPECT_TRUE(GlobMatches("src/**", "src/b.c"));
  EXPECT_FALSE(GlobMatches("src/**", "src/a/.git/x"));
  EXPECT_FALSE(GlobMatches("src/**", "src/a/.x"));
  EXPECT_FALSE(GlobMatches("src/**", "src/.x"));
}

TEST(GlobToRegex, Malformed) {
  std::string regex, error;
  bool recursive;
  EXPECT_EQ(Input_BadGlob, Glob_ToRegex(regex, recursive, "log[0-9", error));
  EXPECT_EQ(Input_BadGlob, Glob_ToRegex(regex, recursive, "*.{csv", error));
  EXPECT_EQ(Input_BadGlob, Glob_ToRegex(regex, recursive, "abc\\", error));
  EXPECT_FALSE(error.empty());
}

TEST(ExpandGlob, MatchesFilesInOneDirectory) {
  TempDir dir;
  dir.Write("b.log", "b\n");
  dir.Write("a.log", "a\n");
  dir.Write("c.txt", "c\n");
  dir.Write("sub/d.log", "d\n");

  std::vector<std::string> paths;
  std::string error;
  auto root = dir.path.generic_string();
  ASSERT_EQ(Input_OK, Input_ExpandGlob(paths, root + "/*.log", error)) << error;

  ASSERT_EQ(2u, paths.size());
  EXPECT_EQ(root + "/a.log", paths[0]);
  EXPECT_EQ(root + "/b.log", paths[1]);
}

TEST(ExpandGlob, RecursiveWalk) {
  TempDir dir;
  dir.Write("a.log", "a\n");
  dir.Write("sub/deeper/b.log", "b\n");
  dir.Write("sub/c.txt", "c\n");

  std::vector<std::string> paths;
  std::string error;
  auto root = dir.path.generic_string();
  ASSERT_EQ(Input_OK, Input_ExpandGlob(paths, root + "/**/*.log", error))
      << error;

  ASSERT_EQ(2u, paths.size());
  EXPECT_EQ(root + "/a.log", paths[0]);
  EXPECT_EQ(root + "/sub/deeper/b.log", paths[1]);
}

TEST(ExpandGlob, TrailingDoubleStarSkipsHiddenEntries) {
  TempDir dir;
  dir.Write("logs/a.log", "a\n");
  dir.Write("logs/sub/b.log", "b\n");
  dir.Write("logs/sub/.git/config", "x\n");
  dir.Write("logs/sub/.hidden", "x\n");

  std::vector<std::string> paths;
  std::string error;
  auto root = dir.path.generic_string();
  ASSERT_EQ(Input_OK, Input_ExpandGlob(paths, root + "/logs/**", error))
      << error;

  ASSERT_EQ(2u, paths.size());
  EXPECT_EQ(root + "/logs/a.log", paths[0]);
  EXPECT_EQ(root + "/logs/sub/b.log", paths[1]);
}

TEST(ExpandGlob, NoMatches) {
  TempDir dir;
  dir.Write("a.txt", "a\n");

  std::vector<std::string> paths;
  std::string error;
  EXPECT_EQ(Input_NoMatches,
            Input_ExpandGlob(paths, dir.path.generic_string() + "/*.nomatch",
                             error));
  EXPECT_TRUE(paths.empty());
  EXPECT_NE(std::string::npos, error.find("no files matched"));
}

TEST(ExpandGlob, LiteralPath) {
  TempDir dir;
  auto path = dir.Write("exact.txt", "x\n");

  std::vector<std::string> paths;
  std::string error;
  ASSERT_EQ(Input_OK, Input_ExpandGlob(paths, path, error));
  ASSERT_EQ(1u, paths.size());
  EXPECT_EQ(path, paths[0]);

  paths.clear();
  EXPECT_EQ(Input_NoMatches, Input_ExpandGlob(paths, path + ".missing", error));
}

TEST(ExpandGlob, BadGlob) {
  TempDir dir;
  std::vector<std::string> paths;
  std::string error;
  EXPECT_EQ(Input_BadGlob,
            Input_ExpandGlob(paths, dir.path.generic_string() + "/[ab", error));
}

TEST(ResolveFiles, GlobWinsOverFilename) {
  TempDir dir;
  dir.Write("one.csv", "1\n");

  Config config;
  config.filename = "ignored.txt";
  config.glob = dir.path.generic_string() + "/*.csv";

  std::vector<std::string> paths;
  std::string error;
  ASSERT_EQ(Input_OK, Input_ResolveFiles(paths, config, error)) << error;
  ASSERT_EQ(1u, paths.size());
  EXPECT_EQ(dir.path.generic_string() + "/one.csv", paths[0]);
}

TEST(ResolveFiles, FilenameOnly) {
  Config config;
  config.filename = "some.txt";

  std::vector<std::string> paths;
  std::string error;
  ASSERT_EQ(Input_OK, Input_ResolveFiles(paths, config, error));
  ASSERT_EQ(1u, paths.size());
  EXPECT_EQ("some.txt", paths[0]);
}
