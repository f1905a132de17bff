#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace lcars::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string to_hex(const uint8_t* data, size_t size);
    static bool is_hex(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::optional<std::string> read_text(const std::filesystem::path& path);
    static bool write_text(const std::filesystem::path& path, const std::string& content);
    static std::optional<uint64_t> available_space(const std::filesystem::path& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);

    // "250ms", "30s", "5m", "48h"; a bare number is seconds. Values that
    // overflow milliseconds are rejected.
    static std::optional<std::chrono::milliseconds> parse_duration(const std::string& str);
};

} // namespace lcars::core::utils
