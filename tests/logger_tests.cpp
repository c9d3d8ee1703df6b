#include "gtest/gtest.h"
#include "test_utils.hpp"
#include "utils/ansi.hpp"
#include "utils/logger.hpp"
#include <type_traits>

using namespace tfb_toolset;
using tfb_toolset::test_support::TempDirTest;

static_assert(!std::is_copy_constructible_v<Logger>);
static_assert(std::is_move_constructible_v<Logger>);

class LoggerTest : public TempDirTest {
protected:
    // Logger rooted at the temp dir, scoped to test and bound to benchmark.txt
    Logger boundLogger(const std::string& test = "gemini") {
        Logger logger = Logger::inDir(root());
        EXPECT_EQ(logger.scopeToTest(test), ScopeStatus::Applied);
        EXPECT_EQ(logger.bindFile("benchmark.txt"), ScopeStatus::Applied);
        return logger;
    }

    std::filesystem::path transcript(const std::string& test = "gemini") const {
        return root() / test / "benchmark.txt";
    }
};

TEST_F(LoggerTest, DefaultLoggerPrintsToConsoleOnly) {
    Logger logger;
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("hello", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "hello\n");

    EXPECT_FALSE(logger.prefix());
    EXPECT_FALSE(logger.logDir());
    EXPECT_FALSE(logger.logFile());
    EXPECT_FALSE(logger.isQuiet());
}

TEST_F(LoggerTest, PrefixIsBoldAndFollowedByColon) {
    Logger logger = Logger::withPrefix("gemini");
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("starting", error));
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, stylize("gemini", style::kPrefix) + ": starting\n");
    EXPECT_NE(out.find("\x1b[1m"), std::string::npos);
    EXPECT_EQ(stripAnsi(out), "gemini: starting\n");
}

TEST_F(LoggerTest, BlankLinesAreDroppedAndTrailingWhitespaceTrimmed) {
    Logger logger = boundLogger();
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("first  \n\n   \n\tsecond\r\n", error));
    std::string out = ::testing::internal::GetCapturedStdout();

    std::string prefix = stylize("gemini", style::kPrefix) + ": ";
    EXPECT_EQ(out, prefix + "first\n" + prefix + "\tsecond\n");
    EXPECT_EQ(readFile(transcript()), "first\n\tsecond\n");
}

TEST_F(LoggerTest, WhitespaceOnlyTextWritesNothing) {
    Logger logger = boundLogger();
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine(" \n\t\n", error));
    EXPECT_TRUE(logger.writeLine("", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
    EXPECT_EQ(readFile(transcript()), "");
}

TEST_F(LoggerTest, TranscriptMatchesConsoleWithoutStyling) {
    Logger logger = Logger::inDir(root());
    ASSERT_EQ(logger.bindFile("benchmark.txt"), ScopeStatus::Applied);
    ToolsetError error;

    std::string text = stylize("Verification", style::kStructure) + " " +
                       stylize("failed", style::kError) + "\nplain line\n" +
                       stylize("ok", style::kPass);

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine(text, error));
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("\x1b[31m"), std::string::npos);
    std::string file = readFile(root() / "benchmark.txt");
    EXPECT_EQ(file, "Verification failed\nplain line\nok\n");
    EXPECT_EQ(stripAnsi(out), file);
}

TEST_F(LoggerTest, WriteErrorColorsConsoleButNotTranscript) {
    Logger logger = boundLogger();
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeError("container exited\nsee log", error));
    std::string out = ::testing::internal::GetCapturedStdout();

    std::string prefix = stylize("gemini", style::kPrefix) + ": ";
    EXPECT_EQ(out, prefix + stylize("container exited", style::kError) + "\n" +
                   prefix + stylize("see log", style::kError) + "\n");
    EXPECT_EQ(readFile(transcript()), "container exited\nsee log\n");
}

TEST_F(LoggerTest, QuietSuppressesConsoleButKeepsTranscript) {
    Logger logger = boundLogger();
    logger.setQuiet(true);
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("only in file", error));
    EXPECT_TRUE(logger.writeError("also in file", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
    EXPECT_EQ(readFile(transcript()), "only in file\nalso in file\n");
}

TEST_F(LoggerTest, RepeatedLinesAreNotDeduplicated) {
    Logger logger = boundLogger();
    ToolsetError error;

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("same", error));
    EXPECT_TRUE(logger.writeLine("same", error));
    std::string out = ::testing::internal::GetCapturedStdout();

    std::string line = stylize("gemini", style::kPrefix) + ": same\n";
    EXPECT_EQ(out, line + line);
    EXPECT_EQ(readFile(transcript()), "same\nsame\n");
}

TEST_F(LoggerTest, ScopeToTestMovesIntoTestDirectory) {
    Logger logger = Logger::inDir(root());

    EXPECT_EQ(logger.scopeToTest("gemini"), ScopeStatus::Applied);
    EXPECT_TRUE(std::filesystem::is_directory(root() / "gemini"));
    ASSERT_TRUE(logger.logDir());
    EXPECT_EQ(*logger.logDir(), root() / "gemini");
    ASSERT_TRUE(logger.prefix());
    EXPECT_EQ(*logger.prefix(), "gemini");
    EXPECT_FALSE(logger.logFile());
}

TEST_F(LoggerTest, ScopeToTestReusesExistingDirectory) {
    std::filesystem::create_directories(root() / "gemini");
    Logger logger = Logger::inDir(root());

    EXPECT_EQ(logger.scopeToTest("gemini"), ScopeStatus::Applied);
    EXPECT_EQ(*logger.logDir(), root() / "gemini");
}

TEST_F(LoggerTest, ScopeAndBindWithoutLogDirAreSkipped) {
    Logger logger;
    ToolsetError error;

    EXPECT_EQ(logger.scopeToTest("gemini"), ScopeStatus::SkippedNoLogDir);
    EXPECT_EQ(logger.bindFile("benchmark.txt"), ScopeStatus::SkippedNoLogDir);

    EXPECT_FALSE(logger.logDir());
    EXPECT_FALSE(logger.logFile());
    ASSERT_TRUE(logger.prefix());
    EXPECT_EQ(*logger.prefix(), "gemini");

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("console only", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(),
              stylize("gemini", style::kPrefix) + ": console only\n");
}

TEST_F(LoggerTest, ScopeFailureKeepsPreviousLogDir) {
    // A regular file where the log directory should be
    const auto blocker = root() / "blocker";
    writeFile(blocker, "");
    Logger logger = Logger::inDir(blocker);

    EXPECT_EQ(logger.scopeToTest("gemini"), ScopeStatus::SkippedCreateFailed);
    ASSERT_TRUE(logger.logDir());
    EXPECT_EQ(*logger.logDir(), blocker);
    ASSERT_TRUE(logger.prefix());
    EXPECT_EQ(*logger.prefix(), "gemini");
}

TEST_F(LoggerTest, BindFileFailureLeavesConsoleOnly) {
    Logger logger = Logger::inDir(root() / "missing");
    ToolsetError error;

    EXPECT_EQ(logger.bindFile("benchmark.txt"), ScopeStatus::SkippedCreateFailed);
    EXPECT_FALSE(logger.logFile());

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("still printed", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "still printed\n");
}

TEST_F(LoggerTest, BindFileToDirectoryIsSkipped) {
    std::filesystem::create_directories(root() / "benchmark.txt");
    Logger logger = Logger::inDir(root());
    ToolsetError error;

    EXPECT_EQ(logger.bindFile("benchmark.txt"), ScopeStatus::SkippedCreateFailed);
    EXPECT_FALSE(logger.logFile());

    ::testing::internal::CaptureStdout();
    EXPECT_TRUE(logger.writeLine("hello", error));
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "hello\n");
}

TEST_F(LoggerTest, BindFileKeepsExistingContent) {
    std::filesystem::create_directories(root() / "gemini");
    writeFile(transcript(), "earlier run\n");

    Logger logger = boundLogger();
    logger.setQuiet(true);
    ToolsetError error;
    EXPECT_TRUE(logger.writeLine("this run", error));

    EXPECT_EQ(readFile(transcript()), "earlier run\nthis run\n");
}

TEST_F(LoggerTest, BindFileCreatesEmptyFile) {
    Logger logger = boundLogger();

    ASSERT_TRUE(logger.logFile());
    EXPECT_EQ(*logger.logFile(), transcript());
    EXPECT_TRUE(std::filesystem::is_regular_file(transcript()));
    EXPECT_EQ(std::filesystem::file_size(transcript()), 0u);
}

TEST_F(LoggerTest, WriteFailureOnBoundFileIsReported) {
    Logger logger = boundLogger();
    logger.setQuiet(true);
    std::filesystem::remove_all(root() / "gemini");

    ToolsetError error;
    EXPECT_FALSE(logger.writeLine("lost", error));
    EXPECT_EQ(error.kind, ToolsetErrorKind::Io);
    EXPECT_NE(error.message.find("benchmark.txt"), std::string::npos);
}

TEST_F(LoggerTest, DeriveCopiesSettingsButNotTranscript) {
    Logger logger = boundLogger();
    logger.setQuiet(true);

    Logger child = logger.derive();
    EXPECT_EQ(child.prefix(), logger.prefix());
    EXPECT_EQ(child.logDir(), logger.logDir());
    EXPECT_TRUE(child.isQuiet());
    EXPECT_FALSE(child.logFile());

    EXPECT_EQ(child.bindFile("child.txt"), ScopeStatus::Applied);
    ToolsetError error;
    EXPECT_TRUE(child.writeLine("from child", error));
    EXPECT_EQ(readFile(root() / "gemini" / "child.txt"), "from child\n");
    EXPECT_EQ(readFile(transcript()), "");
}

TEST_F(LoggerTest, ScopeStatusHasReadableNames) {
    EXPECT_STREQ(toString(ScopeStatus::Applied), "applied");
    EXPECT_STREQ(toString(ScopeStatus::SkippedNoLogDir), "skipped: no log directory");
    EXPECT_STREQ(toString(ScopeStatus::SkippedCreateFailed), "skipped: create failed");
}
