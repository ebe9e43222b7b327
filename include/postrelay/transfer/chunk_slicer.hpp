#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>

namespace postrelay::transfer {

class ChunkIoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChunkFile {
    std::filesystem::path path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

// Copies byte ranges of a source file into standalone temp files
// ("chunk-<hex>.bin") that a background transfer can upload.
class ChunkSlicer {
public:
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 512 * 1024; // 512KB

    explicit ChunkSlicer(std::filesystem::path temp_dir, uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Reads min(chunk_size, total - offset) bytes starting at `offset`.
    // Throws ChunkIoError when the source cannot be read or the temp file written.
    ChunkFile slice(const std::filesystem::path& source, uint64_t offset, uint64_t total_bytes) const;

    uint64_t chunk_size() const { return chunk_size_; }
    const std::filesystem::path& temp_dir() const { return temp_dir_; }

    static uint64_t chunk_count(uint64_t total_bytes, uint64_t chunk_size);

private:
    std::filesystem::path temp_dir_;
    uint64_t chunk_size_;

    std::filesystem::path make_chunk_path() const;
};

}
