/**
 * \file worker/engine/StagingFile.hpp
 * \brief Scoped temporary file holding one task's input.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace CortexWorker {

/**
 * \brief Temporary file that input frames are appended to as they arrive.
 *
 * Keeps memory use bounded by one frame regardless of input size. The file
 * is deleted when the object is destroyed, on every exit path of a task.
 */
class StagingFile {
public:
    /** \brief Create (or truncate) `path`. \throws std::system_error if it cannot be opened. */
    explicit StagingFile(std::filesystem::path path);
    ~StagingFile();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    /** \brief Append one frame. \throws std::system_error on a failed write. */
    void append(std::string_view bytes);

    /** \brief Flush pending writes and position the stream at offset 0 for reading. */
    void rewind();

    std::uint64_t size() const noexcept { return size_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    std::istream& stream() noexcept { return stream_; }

private:
    std::filesystem::path path_;
    std::fstream stream_;
    std::uint64_t size_{0};
};

} // namespace CortexWorker
