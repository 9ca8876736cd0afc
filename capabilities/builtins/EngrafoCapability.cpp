/**
 * @file capabilities/builtins/EngrafoCapability.cpp
 * @brief Dockerised Engrafo capability with auto-registration.
 */
#include "EngrafoCapability.hpp"
#include "capabilities/archive/ArchiveAdaptor.hpp"
#include "capabilities/registry/CapabilityRegistration.hpp"
#include "worker/WorkerOptions.hpp"
#include "logger.hpp"
#include <processUtils.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace CortexWorker::Capabilities {

EngrafoCapability::EngrafoCapability(std::filesystem::path work_root, std::string image, std::string memory,
                                     std::shared_ptr<Logger> logger)
    : work_root_(std::filesystem::absolute(work_root))
    , image_(std::move(image))
    , memory_(std::move(memory))
    , logger_(std::move(logger)) {}

std::string EngrafoCapability::container_path(const std::filesystem::path& host_path) const {
    const auto relative = std::filesystem::absolute(host_path).lexically_relative(work_root_);
    if (relative.empty() || *relative.begin() == "..") {
        throw std::invalid_argument("engrafo: " + host_path.string() + " is outside " + work_root_.string());
    }
    return (std::filesystem::path("/workdir") / relative).generic_string();
}

std::vector<std::string> EngrafoCapability::command_line(const std::filesystem::path& input_dir,
                                                         const std::filesystem::path& output_dir) const {
    return {
        "docker", "run",
        "--rm",
        "-m", memory_,
        "-v", work_root_.string() + ":/workdir",
        "-w", "/workdir",
        image_,
        "engrafo",
        container_path(input_dir),
        container_path(output_dir),
    };
}

ConversionResult EngrafoCapability::convert(const std::filesystem::path& input) const {
    try {
        auto input_dir = Archive::unpack(input, work_root_, "engrafo_input_");
        auto output_dir = Archive::ScopedDirectory::create(work_root_, "engrafo_output_");

        const auto result = ProcessUtils::run_process(command_line(input_dir.path(), output_dir.path()));
        if (!result.succeeded() && logger_) {
            logger_->debug("engrafo exited with code " + std::to_string(result.exit_code) + " for " + input.string());
        }

        // CorTeX expects every returned archive to carry its diagnostics in cortex.log.
        {
            std::ofstream log_file(output_dir.path() / "cortex.log", std::ios::binary | std::ios::trunc);
            if (!log_file) {
                return ConversionResult::failure("engrafo: cannot write cortex.log in " + output_dir.path().string());
            }
            log_file << result.stderr_text << result.stdout_text;
        }

        const auto archive = Archive::pack(output_dir.path(),
                                           work_root_ / (input.stem().string() + ".engrafo.zip"));
        return ConversionResult::success(archive, ConversionResult::Ownership::Owned);
    } catch (const std::exception& e) {
        return ConversionResult::failure(std::string{"engrafo: "} + e.what());
    }
}

namespace {

REGISTER_CAPABILITY(
    "engrafo",
    "Converts a LaTeX archive to HTML with Engrafo in docker",
    "engrafo",
    [](const WorkerConfiguration& config, std::shared_ptr<Logger> logger) -> std::unique_ptr<IConversionCapability> {
        return std::make_unique<EngrafoCapability>(config.staging_directory(),
                                                   config.capability_param("image", "arxivvanity/engrafo:2.0.0"),
                                                   config.capability_param("memory", "4g"),
                                                   std::move(logger));
    }
);

} // namespace
} // namespace CortexWorker::Capabilities
