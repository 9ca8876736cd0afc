/**
 * @file process_utils_test.cpp
 * @brief Child process execution tests.
 */

#include <gtest/gtest.h>

#include "capabilities/archive/ArchiveAdaptor.hpp"
#include "support/TestCapability.hpp"
#include <processUtils.hpp>

#include <stdexcept>
#include <string>

using namespace CortexWorker;

TEST(ProcessUtilsTest, CapturesBothStreamsAndExitCode) {
    auto result = ProcessUtils::run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(ProcessUtilsTest, DrainsLargeOutputWithoutBlocking) {
    auto result = ProcessUtils::run_process(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo abcdefghij >&2; i=$((i+1)); done"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text.size(), 20000u * 11u);
    EXPECT_EQ(result.stderr_text.size(), 20000u * 11u);
}

TEST(ProcessUtilsTest, RunsInWorkingDirectory) {
    auto dir = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_proc_");
    auto result = ProcessUtils::run_process({"/bin/sh", "-c", "pwd -P"}, dir.path());
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_text, std::filesystem::canonical(dir.path()).string() + "\n");
}

TEST(ProcessUtilsTest, MissingProgramExitsWith127) {
    auto result = ProcessUtils::run_process({"cortex-worker-no-such-program"});
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_FALSE(result.stderr_text.empty());
}

TEST(ProcessUtilsTest, RejectsEmptyCommandLine) {
    EXPECT_THROW(ProcessUtils::run_process({}), std::invalid_argument);
}

TEST(ProcessUtilsTest, HostNameIsNeverEmpty) {
    EXPECT_FALSE(ProcessUtils::get_host_name().empty());
}
