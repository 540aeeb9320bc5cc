#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include "app.hpp"
#include "test_util.hpp"

// Temporary stream the batch output is written to and read back from
struct CapturedOutput {
  FILE *file = std::tmpfile();

  ~CapturedOutput() {
    if (file != nullptr) {
      std::fclose(file);
    }
  }

  std::string Read() {
    std::fflush(file);
    std::rewind(file);
    std::string ret;
    char buffer[256];
    size_t numRead;
    while ((numRead = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
      ret.append(buffer, numRead);
    }
    return ret;
  }
};

TEST(AppLoadInputs, GlobWithoutMatchesFails) {
  TempDir dir;
  dir.Write("a.txt", "a\n");

  Config config;
  config.glob = dir.path.generic_string() + "/*.nomatch";

  DocumentList documents;
  EXPECT_EQ(EXIT_FAILURE, App_LoadInputs(documents, config));
  EXPECT_TRUE(documents.empty());
}

TEST(AppLoadInputs, MissingFileFails) {
  TempDir dir;
  Config config;
  config.filename = (dir.path / "missing.txt").string();

  DocumentList documents;
  EXPECT_EQ(EXIT_FAILURE, App_LoadInputs(documents, config));
}

TEST(AppLoadInputs, UnwritableOutputFails) {
  TempDir dir;
  Config config;
  config.filename = dir.Write("in.txt", "a\n");
  config.output = "/nonexistent-dir/out.csv";

  DocumentList documents;
  EXPECT_EQ(EXIT_FAILURE, App_LoadInputs(documents, config));
}

TEST(AppLoadInputs, ReadsGlobMatchesInOrder) {
  TempDir dir;
  dir.Write("b.log", "two\n");
  dir.Write("a.log", "one\n");

  Config config;
  config.glob = dir.path.generic_string() + "/*.log";
  config.output = (dir.path / "out.csv").string();

  DocumentList documents;
  ASSERT_EQ(EXIT_SUCCESS, App_LoadInputs(documents, config));
  ASSERT_EQ(2u, documents.size());
  EXPECT_EQ("one", documents[0]->GetLine(0));
  EXPECT_EQ("two", documents[1]->GetLine(0));
  EXPECT_FALSE(std::filesystem::exists(*config.output));
}

TEST(AppRunBatch, PrintsMatchingLines) {
  Config config;
  Session session(MakeDocument("1-2\nabc\n10-20\n"), std::nullopt);
  session.Push(SessionEvent::SetPattern(R"(^(\d+)-(\d+)$)"));
  session.ProcessEvents();

  CapturedOutput output;
  ASSERT_NE(nullptr, output.file);
  EXPECT_EQ(EXIT_SUCCESS, App_RunBatch(session, config, output.file));
  EXPECT_EQ("1: 1-2\n3: 10-20\n", output.Read());
  EXPECT_EQ(Session_Terminated, session.GetState());
}

TEST(AppRunBatch, PrefixesSourceForSeveralFiles) {
  Config config;
  Session session(MakeDocuments({{"a.txt", "x\n"}, {"b.txt", "y\nx\n"}}),
                  std::nullopt);
  session.Push(SessionEvent::SetPattern("x"));
  session.ProcessEvents();

  CapturedOutput output;
  ASSERT_NE(nullptr, output.file);
  EXPECT_EQ(EXIT_SUCCESS, App_RunBatch(session, config, output.file));
  EXPECT_EQ("a.txt:1: x\nb.txt:2: x\n", output.Read());
}

TEST(AppRunBatch, BadPatternExitsWithItsOwnCode) {
  Config config;
  Session session(MakeDocument("a\n"), std::nullopt);
  session.Push(SessionEvent::SetPattern("(a"));
  session.ProcessEvents();

  CapturedOutput output;
  ASSERT_NE(nullptr, output.file);
  EXPECT_EQ(EXIT_BAD_PATTERN, App_RunBatch(session, config, output.file));
  EXPECT_EQ("", output.Read());
}

TEST(AppRunBatch, ExportFailureFails) {
  Config config;
  config.output = "/nonexistent-dir/out.csv";
  Session session(MakeDocument("a\n"), config.output);
  session.Push(SessionEvent::SetPattern("(a)"));
  session.ProcessEvents();

  CapturedOutput output;
  ASSERT_NE(nullptr, output.file);
  EXPECT_EQ(EXIT_FAILURE, App_RunBatch(session, config, output.file));
}

TEST(AppRunBatch, ExportsWhenOutputIsSet) {
  TempDir dir;
  Config config;
  config.output = (dir.path / "out.csv").string();
  Session session(MakeDocument("k=v\n"), config.output);
  session.Push(SessionEvent::SetPattern(R"((\w)=(\w))"));
  session.ProcessEvents();

  CapturedOutput output;
  ASSERT_NE(nullptr, output.file);
  EXPECT_EQ(EXIT_SUCCESS, App_RunBatch(session, config, output.file));
  EXPECT_TRUE(std::filesystem::exists(*config.output));
}
