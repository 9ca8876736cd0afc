/**
 * @file capabilities/builtins/TexToHtmlCapability.hpp
 * @brief TeX-to-HTML5 conversion through LaTeXML's latexmlc.
 */
#pragma once

#include "capabilities/IConversionCapability.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class Logger;

namespace CortexWorker::Capabilities {

/**
 * @brief Runs `latexmlc` archive-to-archive on the staged input.
 *
 * latexmlc writes its log as "cortex.log" into the output archive, which is
 * the layout the CorTeX sink expects. latexmlc enforces its own --timeout.
 */
class TexToHtmlCapability : public IConversionCapability {
public:
    /**
     * @param output_dir Directory receiving the converted archives.
     * @param timeout_seconds Value passed to latexmlc --timeout.
     */
    TexToHtmlCapability(std::filesystem::path output_dir, int timeout_seconds,
                        std::shared_ptr<Logger> logger = nullptr);

    [[nodiscard]] const char* name() const noexcept override { return "tex_to_html"; }

    [[nodiscard]] ConversionResult convert(const std::filesystem::path& input) const override;

    /** @brief Full latexmlc command line for one conversion. */
    [[nodiscard]] std::vector<std::string> command_line(const std::filesystem::path& input,
                                                        const std::filesystem::path& destination) const;

    /** @brief Where the archive converted from `input` is written. */
    [[nodiscard]] std::filesystem::path destination_for(const std::filesystem::path& input) const;

private:
    std::filesystem::path output_dir_;
    int timeout_seconds_;
    std::shared_ptr<Logger> logger_;
};

} // namespace CortexWorker::Capabilities
