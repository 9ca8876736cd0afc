/**
 * @file capabilities/ConversionResult.hpp
 * @brief Outcome of one conversion: an output artifact or a diagnostic.
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

namespace CortexWorker::Capabilities {

/**
 * @brief Result of IConversionCapability::convert.
 *
 * Either names a readable output file or carries the failure diagnostic.
 * An owned output is a file the capability created for this task; the task
 * engine deletes it once it has been delivered. A borrowed output belongs to
 * someone else (e.g. the staged input itself) and is left alone.
 */
class ConversionResult {
public:
    enum class Ownership { Owned, Borrowed };

    [[nodiscard]] static ConversionResult success(std::filesystem::path output,
                                                  Ownership ownership = Ownership::Owned) {
        ConversionResult r;
        r.ok_ = true;
        r.output_ = std::move(output);
        r.ownership_ = ownership;
        return r;
    }

    [[nodiscard]] static ConversionResult failure(std::string message) {
        ConversionResult r;
        r.message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] const std::filesystem::path& output() const noexcept { return output_; }
    [[nodiscard]] Ownership ownership() const noexcept { return ownership_; }
    [[nodiscard]] bool owns_output() const noexcept { return ok_ && ownership_ == Ownership::Owned; }
    /// Failure diagnostic; empty on success.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ConversionResult() = default;

    bool ok_{false};
    std::filesystem::path output_;
    Ownership ownership_{Ownership::Owned};
    std::string message_;
};

} // namespace CortexWorker::Capabilities
