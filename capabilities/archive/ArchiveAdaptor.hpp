/**
 * @file capabilities/archive/ArchiveAdaptor.hpp
 * @brief Zip archive <-> directory adaptors for directory-oriented converters.
 *
 * CorTeX hands every task over as a single zip archive and expects one zip
 * back, with diagnostics in a "cortex.log" entry at its root. Tools that work
 * on plain directories (e.g. Engrafo) get their input unpacked into a scoped
 * working directory and their output directory packed again. Archiving is
 * delegated to the Info-ZIP `zip`/`unzip` command-line tools.
 */
#pragma once

#include <filesystem>
#include <string>

namespace CortexWorker::Archive {

/**
 * @brief Uniquely named directory that is removed, with its contents, on destruction.
 */
class ScopedDirectory {
public:
    /**
     * @brief Create `parent/<prefix>XXXXXX` with a unique suffix.
     * @throws std::system_error if the directory cannot be created.
     */
    static ScopedDirectory create(const std::filesystem::path& parent, const std::string& prefix);

    ScopedDirectory() = default;
    explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedDirectory();

    ScopedDirectory(ScopedDirectory&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    ScopedDirectory& operator=(ScopedDirectory&& other) noexcept;
    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Give up ownership; the directory is no longer removed.
    std::filesystem::path release() noexcept;

private:
    void remove() noexcept;

    std::filesystem::path path_;
};

/**
 * @brief Unpack a zip archive into a fresh scoped directory under `parent`.
 * @throws std::runtime_error if the archive cannot be extracted.
 */
ScopedDirectory unpack(const std::filesystem::path& archive,
                       const std::filesystem::path& parent,
                       const std::string& prefix);

/**
 * @brief Pack the contents of `directory` (paths relative to it) into the zip `destination`.
 * @return `destination`, replaced if it already existed.
 * @throws std::runtime_error if the archive cannot be written.
 */
std::filesystem::path pack(const std::filesystem::path& directory,
                           const std::filesystem::path& destination);

} // namespace CortexWorker::Archive
