/**
 * @file capabilities/archive/ArchiveAdaptor.cpp
 * @brief Zip/unzip adaptors built on the Info-ZIP command-line tools.
 */
#include "ArchiveAdaptor.hpp"
#include <processUtils.hpp>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace CortexWorker::Archive {

ScopedDirectory ScopedDirectory::create(const std::filesystem::path& parent, const std::string& prefix) {
    std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "cannot create directory " + pattern);
    }
    return ScopedDirectory(std::filesystem::path(buffer.data()));
}

ScopedDirectory::~ScopedDirectory() {
    remove();
}

ScopedDirectory& ScopedDirectory::operator=(ScopedDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::filesystem::path ScopedDirectory::release() noexcept {
    auto released = std::move(path_);
    path_.clear();
    return released;
}

void ScopedDirectory::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

ScopedDirectory unpack(const std::filesystem::path& archive,
                       const std::filesystem::path& parent,
                       const std::string& prefix) {
    auto target = ScopedDirectory::create(parent, prefix);
    const auto result = ProcessUtils::run_process(
        {"unzip", "-q", "-o", archive.string(), "-d", target.path().string()});
    if (!result.succeeded()) {
        throw std::runtime_error("unpack " + archive.string() + ": unzip exited with code " +
                                 std::to_string(result.exit_code) + ": " + result.stderr_text);
    }
    return target;
}

std::filesystem::path pack(const std::filesystem::path& directory,
                           const std::filesystem::path& destination) {
    const auto absolute_destination = std::filesystem::absolute(destination);
    std::error_code ec;
    std::filesystem::remove(absolute_destination, ec);
    // Run inside the directory so entry names are relative to it.
    const auto result = ProcessUtils::run_process(
        {"zip", "-q", "-r", "-X", absolute_destination.string(), "."}, directory);
    if (!result.succeeded()) {
        throw std::runtime_error("pack " + directory.string() + ": zip exited with code " +
                                 std::to_string(result.exit_code) + ": " + result.stderr_text);
    }
    return absolute_destination;
}

} // namespace CortexWorker::Archive
