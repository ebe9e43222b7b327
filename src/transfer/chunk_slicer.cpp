#include "postrelay/transfer/chunk_slicer.hpp"
#include "postrelay/crypto/random.hpp"
#include "postrelay/core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <vector>

namespace postrelay::transfer {

ChunkSlicer::ChunkSlicer(std::filesystem::path temp_dir, uint64_t chunk_size)
    : temp_dir_(std::move(temp_dir))
    , chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {
}

ChunkFile ChunkSlicer::slice(const std::filesystem::path& source, uint64_t offset, uint64_t total_bytes) const {
    if (offset >= total_bytes) {
        throw ChunkIoError("Chunk offset " + std::to_string(offset) + " is past the end of the file.");
    }

    uint64_t length = std::min(chunk_size_, total_bytes - offset);

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        throw ChunkIoError("Cannot open " + source.string());
    }

    input.seekg(static_cast<std::streamoff>(offset));
    std::vector<char> buffer(length);
    input.read(buffer.data(), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(input.gcount()) != length) {
        throw ChunkIoError("Short read from " + source.string() + " at offset " + std::to_string(offset));
    }

    std::error_code ec;
    std::filesystem::create_directories(temp_dir_, ec);

    ChunkFile chunk;
    chunk.path = make_chunk_path();
    chunk.offset = offset;
    chunk.length = length;

    std::ofstream output(chunk.path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw ChunkIoError("Cannot create chunk file " + chunk.path.string());
    }
    output.write(buffer.data(), static_cast<std::streamsize>(length));
    output.close();
    if (!output) {
        std::filesystem::remove(chunk.path, ec);
        throw ChunkIoError("Failed to write chunk file " + chunk.path.string());
    }

    LOG_TRACE("Sliced {} bytes at offset {} into {}", length, offset, chunk.path.string());
    return chunk;
}

uint64_t ChunkSlicer::chunk_count(uint64_t total_bytes, uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return (total_bytes + chunk_size - 1) / chunk_size;
}

std::filesystem::path ChunkSlicer::make_chunk_path() const {
    return temp_dir_ / ("chunk-" + crypto::SecureRandom::generate_hex(16) + ".bin");
}

}
