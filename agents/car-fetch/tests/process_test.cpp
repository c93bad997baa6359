#include "../include/process.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace testing_support;

TEST(PosixProcessRunnerTest, CapturesOutputAndExitCode)
{
    PosixProcessRunner runner;
    auto r = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, {});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.output.find("out\n"), std::string::npos);
    EXPECT_NE(r.output.find("err\n"), std::string::npos);
}

TEST(PosixProcessRunnerTest, RunsInWorkingDirectory)
{
    TempDir dir;
    PosixProcessRunner runner;
    auto r = runner.run({"sh", "-c", "pwd -P; touch made_here"}, dir.path());
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(fs::exists(dir / "made_here"));
}

TEST(PosixProcessRunnerTest, MissingProgramExitsWith127)
{
    PosixProcessRunner runner;
    auto r = runner.run({"definitely-not-a-real-program-xyz"}, {});
    EXPECT_EQ(r.exit_code, 127);
}

TEST(FindExecutableTest, SearchesPath)
{
    EXPECT_TRUE(have_executable("sh"));
    EXPECT_TRUE(find_executable("/bin/sh").has_value());
    EXPECT_FALSE(have_executable("definitely-not-a-real-program-xyz"));
}
