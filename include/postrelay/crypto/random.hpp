#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace postrelay::crypto {

class SecureRandom {
public:
    static bool initialize();
    static bool is_initialized() { return initialized_; }

    // Throws std::runtime_error if libsodium cannot be initialized.
    static void generate_bytes(std::span<std::uint8_t> output);

    // RFC 4122 version 4 text form, lowercase: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    static std::string generate_uuid();

    static std::string generate_hex(size_t byte_count);

private:
    static bool initialized_;

    static void ensure_initialized();
};

}
