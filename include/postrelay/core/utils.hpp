#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace postrelay::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(size_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static std::filesystem::path get_temp_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();

    // ISO-8601 UTC, e.g. 2024-05-01T12:30:00Z. Fractional seconds are dropped when parsing.
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::optional<std::chrono::system_clock::time_point> from_iso_string(const std::string& str);

    static int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(int64_t millis);
};

}
