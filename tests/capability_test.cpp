/**
 * @file capability_test.cpp
 * @brief Capability registry and built-in capability tests.
 */

#include <gtest/gtest.h>

#include "support/TestCapability.hpp"

#include "capabilities/archive/ArchiveAdaptor.hpp"
#include "capabilities/builtins/EchoCapability.hpp"
#include "capabilities/builtins/EngrafoCapability.hpp"
#include "capabilities/builtins/TexToHtmlCapability.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "worker/WorkerOptions.hpp"

#include <algorithm>
#include <stdexcept>

using namespace CortexWorker;
using namespace CortexWorker::Capabilities;
using namespace cortex_test;

TEST(CapabilityRegistryTest, BuiltinsRegisterThemselves) {
    auto& registry = CapabilityRegistry::instance();
    EXPECT_TRUE(registry.has_capability("echo"));
    EXPECT_TRUE(registry.has_capability("tex_to_html"));
    EXPECT_TRUE(registry.has_capability("engrafo"));
    EXPECT_EQ(registry.default_service("echo").value_or(""), "echo_service");
    EXPECT_EQ(registry.default_service("tex_to_html").value_or(""), "tex_to_html");

    auto names = registry.names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

TEST(CapabilityRegistryTest, CreatesByName) {
    WorkerConfiguration config;
    auto capability = CapabilityRegistry::instance().create("echo", config, nullptr);
    ASSERT_NE(capability, nullptr);
    EXPECT_STREQ(capability->name(), "echo");
    EXPECT_EQ(CapabilityRegistry::instance().create("pdf_to_text", config, nullptr), nullptr);
    EXPECT_FALSE(CapabilityRegistry::instance().default_service("pdf_to_text").has_value());
}

TEST(CapabilityRegistryTest, LocalRegistryReplacesByName) {
    CapabilityRegistry registry;
    auto factory = [](const WorkerConfiguration&, std::shared_ptr<Logger>) -> std::unique_ptr<IConversionCapability> {
        return std::make_unique<EchoCapability>();
    };
    registry.register_capability(CapabilityDescriptor::create("copy", "first", "copy_v1", factory));
    registry.register_capability(CapabilityDescriptor::create("copy", "second", "copy_v2", factory));
    EXPECT_EQ(registry.capability_count(), 1u);
    EXPECT_EQ(registry.default_service("copy").value_or(""), "copy_v2");
    registry.clear();
    EXPECT_EQ(registry.capability_count(), 0u);
}

TEST(CapabilityRegistryTest, TexToHtmlRejectsNonNumericTimeout) {
    WorkerConfiguration config;
    config.capability_params["latexml_timeout"] = "soon";
    EXPECT_THROW((void)CapabilityRegistry::instance().create("tex_to_html", config, nullptr), std::invalid_argument);
}

TEST(EchoCapabilityTest, ReturnsInputAsBorrowedOutput) {
    auto dir = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_echo_");
    const auto input = dir.path() / "input.zip";
    write_file(input, "PK");

    EchoCapability echo;
    auto result = echo.convert(input);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.output(), input);
    EXPECT_FALSE(result.owns_output());
}

TEST(EchoCapabilityTest, MissingInputFails) {
    EchoCapability echo;
    auto result = echo.convert("/nonexistent/cortex/input.zip");
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.message().empty());
}

TEST(TexToHtmlCapabilityTest, CommandLineAndDestination) {
    TexToHtmlCapability capability("/var/tmp/out", 120, nullptr);
    const auto destination = capability.destination_for("/var/tmp/stage/cortex_T1.zip");
    EXPECT_EQ(destination, std::filesystem::path("/var/tmp/out/cortex_T1.html.zip"));

    auto argv = capability.command_line("/var/tmp/stage/cortex_T1.zip", destination);
    ASSERT_FALSE(argv.empty());
    EXPECT_EQ(argv.front(), "latexmlc");
    EXPECT_EQ(argv.back(), "/var/tmp/stage/cortex_T1.zip");
    auto it = std::find(argv.begin(), argv.end(), "--timeout");
    ASSERT_NE(it, argv.end());
    EXPECT_EQ(*(it + 1), "120");
    it = std::find(argv.begin(), argv.end(), "--destination");
    ASSERT_NE(it, argv.end());
    EXPECT_EQ(*(it + 1), destination.string());
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--whatsin"), argv.end());
}

TEST(EngrafoCapabilityTest, MapsHostPathsIntoContainer) {
    EngrafoCapability capability("/srv/cortex", "arxivvanity/engrafo:2.0.0", "4g", nullptr);
    EXPECT_EQ(capability.container_path("/srv/cortex/engrafo_input_abc"), "/workdir/engrafo_input_abc");
    EXPECT_THROW((void)capability.container_path("/etc/passwd"), std::invalid_argument);

    auto argv = capability.command_line("/srv/cortex/in", "/srv/cortex/out");
    const std::vector<std::string> expected{
        "docker", "run", "--rm", "-m", "4g", "-v", "/srv/cortex:/workdir", "-w", "/workdir",
        "arxivvanity/engrafo:2.0.0", "engrafo", "/workdir/in", "/workdir/out"};
    EXPECT_EQ(argv, expected);
}

TEST(EngrafoCapabilityTest, CorruptArchiveIsAFailure) {
    auto dir = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_engrafo_");
    const auto input = dir.path() / "broken.zip";
    write_file(input, "this is not a zip archive");

    EngrafoCapability capability(dir.path(), "arxivvanity/engrafo:2.0.0", "4g", nullptr);
    auto result = capability.convert(input);
    EXPECT_FALSE(result.ok());
}
