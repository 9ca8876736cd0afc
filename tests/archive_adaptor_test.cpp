/**
 * @file archive_adaptor_test.cpp
 * @brief Zip archive adaptor tests; skipped where Info-ZIP is not installed.
 */

#include <gtest/gtest.h>

#include "capabilities/archive/ArchiveAdaptor.hpp"
#include "support/TestCapability.hpp"
#include <processUtils.hpp>

#include <stdexcept>

using namespace CortexWorker;
using cortex_test::read_file;
using cortex_test::write_file;

namespace {
bool have_tool(const std::string& tool) {
    return ProcessUtils::run_process({"/bin/sh", "-c", "command -v " + tool}).succeeded();
}
}

class ArchiveAdaptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!have_tool("zip") || !have_tool("unzip")) GTEST_SKIP() << "zip/unzip not installed";
        root_ = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_archive_");
    }

    Archive::ScopedDirectory root_;
};

TEST_F(ArchiveAdaptorTest, PackThenUnpackKeepsRelativeLayout) {
    const auto source = root_.path() / "source";
    std::filesystem::create_directories(source / "figures");
    write_file(source / "main.tex", "\\documentclass{article}");
    write_file(source / "figures" / "plot.eps", "%!PS");

    const auto archive = Archive::pack(source, root_.path() / "paper.zip");
    ASSERT_TRUE(std::filesystem::exists(archive));

    auto unpacked = Archive::unpack(archive, root_.path(), "unpacked_");
    EXPECT_EQ(read_file(unpacked.path() / "main.tex"), "\\documentclass{article}");
    EXPECT_EQ(read_file(unpacked.path() / "figures" / "plot.eps"), "%!PS");

    const auto unpacked_path = unpacked.path();
    { auto gone = std::move(unpacked); }
    EXPECT_FALSE(std::filesystem::exists(unpacked_path));
}

TEST_F(ArchiveAdaptorTest, UnpackRejectsCorruptArchive) {
    const auto bogus = root_.path() / "bogus.zip";
    write_file(bogus, "not a zip");
    EXPECT_THROW(Archive::unpack(bogus, root_.path(), "bogus_"), std::runtime_error);
}

TEST(ScopedDirectoryTest, ReleaseKeepsDirectory) {
    std::filesystem::path kept;
    {
        auto dir = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_release_");
        kept = dir.release();
    }
    EXPECT_TRUE(std::filesystem::is_directory(kept));
    std::filesystem::remove_all(kept);
}
