#include "postrelay/crypto/random.hpp"
#include "postrelay/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace postrelay::crypto {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

void append_hex(std::string& out, std::span<const std::uint8_t> bytes) {
    for (auto byte : bytes) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
}

}

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_ = true;
    LOG_DEBUG("Secure random generator initialized");
    return true;
}

void SecureRandom::ensure_initialized() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
}

void SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    ensure_initialized();
    if (output.empty()) {
        return;
    }
    randombytes_buf(output.data(), output.size());
}

std::string SecureRandom::generate_uuid() {
    std::array<std::uint8_t, 16> bytes{};
    generate_bytes(bytes);

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string uuid;
    uuid.reserve(36);
    std::span<const std::uint8_t> view(bytes);
    append_hex(uuid, view.subspan(0, 4));
    uuid.push_back('-');
    append_hex(uuid, view.subspan(4, 2));
    uuid.push_back('-');
    append_hex(uuid, view.subspan(6, 2));
    uuid.push_back('-');
    append_hex(uuid, view.subspan(8, 2));
    uuid.push_back('-');
    append_hex(uuid, view.subspan(10, 6));
    return uuid;
}

std::string SecureRandom::generate_hex(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    generate_bytes(bytes);

    std::string out;
    out.reserve(byte_count * 2);
    append_hex(out, bytes);
    return out;
}

}
