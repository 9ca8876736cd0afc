/**
 * @file capabilities/builtins/EngrafoCapability.hpp
 * @brief LaTeX-to-HTML conversion with Engrafo running in a docker container.
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
 * @brief Unpacks the input archive, runs Engrafo on it via `docker run`, and
 *        packs the result together with a "cortex.log" of the tool's output.
 *
 * The work root is mounted into the container as /workdir, so the unpacked
 * input and the output directory must both live under it.
 */
class EngrafoCapability : public IConversionCapability {
public:
    /**
     * @param work_root Host directory mounted as /workdir.
     * @param image Docker image providing the `engrafo` command.
     * @param memory Container memory limit (docker -m).
     */
    EngrafoCapability(std::filesystem::path work_root, std::string image, std::string memory,
                      std::shared_ptr<Logger> logger = nullptr);

    [[nodiscard]] const char* name() const noexcept override { return "engrafo"; }

    [[nodiscard]] ConversionResult convert(const std::filesystem::path& input) const override;

    /** @brief docker command line converting `input_dir` into `output_dir` (host paths). */
    [[nodiscard]] std::vector<std::string> command_line(const std::filesystem::path& input_dir,
                                                        const std::filesystem::path& output_dir) const;

    /** @brief Path of a host directory under the work root as seen inside the container. */
    [[nodiscard]] std::string container_path(const std::filesystem::path& host_path) const;

private:
    std::filesystem::path work_root_;
    std::string image_;
    std::string memory_;
    std::shared_ptr<Logger> logger_;
};

} // namespace CortexWorker::Capabilities
