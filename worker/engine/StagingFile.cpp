/**
 * \file worker/engine/StagingFile.cpp
 * \brief Scoped temporary input file.
 */
#include "StagingFile.hpp"

#include <system_error>

namespace CortexWorker {

StagingFile::StagingFile(std::filesystem::path path)
    : path_(std::move(path))
    , stream_(path_, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc) {
    if (!stream_) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "cannot create staging file " + path_.string());
    }
}

StagingFile::~StagingFile() {
    stream_.close();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

void StagingFile::append(std::string_view bytes) {
    if (bytes.empty()) return;
    stream_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "write to staging file " + path_.string() + " failed");
    }
    size_ += bytes.size();
}

void StagingFile::rewind() {
    stream_.flush();
    stream_.clear();
    stream_.seekg(0, std::ios::beg);
    if (!stream_) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "cannot rewind staging file " + path_.string());
    }
}

} // namespace CortexWorker
