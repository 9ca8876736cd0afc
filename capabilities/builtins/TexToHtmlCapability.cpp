/**
 * @file capabilities/builtins/TexToHtmlCapability.cpp
 * @brief latexmlc capability with auto-registration.
 */
#include "TexToHtmlCapability.hpp"
#include "capabilities/registry/CapabilityRegistration.hpp"
#include "worker/WorkerOptions.hpp"
#include "logger.hpp"
#include <processUtils.hpp>

#include <stdexcept>
#include <system_error>

namespace CortexWorker::Capabilities {

namespace {

// Keep diagnostics readable in a single log line.
std::string tail(const std::string& text, std::size_t max_chars = 2000) {
    if (text.size() <= max_chars) return text;
    return "..." + text.substr(text.size() - max_chars);
}

} // namespace

TexToHtmlCapability::TexToHtmlCapability(std::filesystem::path output_dir, int timeout_seconds,
                                         std::shared_ptr<Logger> logger)
    : output_dir_(std::move(output_dir))
    , timeout_seconds_(timeout_seconds)
    , logger_(std::move(logger)) {}

std::filesystem::path TexToHtmlCapability::destination_for(const std::filesystem::path& input) const {
    return output_dir_ / (input.stem().string() + ".html.zip");
}

std::vector<std::string> TexToHtmlCapability::command_line(const std::filesystem::path& input,
                                                           const std::filesystem::path& destination) const {
    return {
        "latexmlc",
        "--whatsin", "archive",
        "--whatsout", "archive",
        "--format", "html5",
        "--pmml",
        "--cmml",
        "--mathtex",
        "--preload", "[ids]latexml.sty",
        "--nodefaultresources",
        "--inputencoding", "iso-8859-1",
        "--timeout", std::to_string(timeout_seconds_),
        "--log", "cortex.log",
        "--destination", destination.string(),
        input.string(),
    };
}

ConversionResult TexToHtmlCapability::convert(const std::filesystem::path& input) const {
    const auto destination = destination_for(input);
    std::error_code ec;
    std::filesystem::remove(destination, ec);

    ProcessResult result;
    try {
        result = ProcessUtils::run_process(command_line(input, destination));
    } catch (const std::system_error& e) {
        return ConversionResult::failure(std::string{"tex_to_html: cannot run latexmlc: "} + e.what());
    }

    // latexmlc reports conversion errors through its exit code but still
    // writes a usable archive (with the errors in cortex.log) in most cases.
    if (!std::filesystem::exists(destination, ec)) {
        return ConversionResult::failure("tex_to_html: latexmlc exited with code " +
                                         std::to_string(result.exit_code) + " and produced no archive: " +
                                         tail(result.stderr_text));
    }
    if (!result.succeeded() && logger_) {
        logger_->debug("latexmlc exited with code " + std::to_string(result.exit_code) + " for " + input.string());
    }
    return ConversionResult::success(destination, ConversionResult::Ownership::Owned);
}

namespace {

REGISTER_CAPABILITY(
    "tex_to_html",
    "Converts a TeX archive to an HTML5 archive with latexmlc",
    "tex_to_html",
    [](const WorkerConfiguration& config, std::shared_ptr<Logger> logger) -> std::unique_ptr<IConversionCapability> {
        int timeout = 300;
        try {
            timeout = std::stoi(config.capability_param("latexml_timeout", "300"));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("tex_to_html: latexml_timeout is not a number");
        }
        return std::make_unique<TexToHtmlCapability>(config.staging_directory(), timeout, std::move(logger));
    }
);

} // namespace
} // namespace CortexWorker::Capabilities
