#include "lcars/core/utils.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace lcars::core::utils {

// A trailing delimiter does not produce an empty last field
std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;

    size_t start = 0;
    while (start < str.size()) {
        auto end = str.find(delimiter, start);
        if (end == std::string::npos) {
            fields.push_back(str.substr(start));
            break;
        }
        fields.push_back(str.substr(start, end - start));
        start = end + 1;
    }

    return fields;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    return fmt::format("{}", fmt::join(parts, delimiter));
}

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    return start < end ? std::string(start, end) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    static constexpr size_t LAST_UNIT = sizeof(UNITS) / sizeof(UNITS[0]) - 1;

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    for (; size >= 1024.0 && unit < LAST_UNIT; ++unit) {
        size /= 1024.0;
    }

    return fmt::format("{:.2f} {}", size, UNITS[unit]);
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string StringUtils::to_hex(const uint8_t* data, size_t size) {
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", data[i]);
    }
    return hex;
}

bool StringUtils::is_hex(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(),
        [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::optional<std::string> FileUtils::read_text(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return content.str();
}

bool FileUtils::write_text(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) return false;

    file << content;
    file.flush();
    return file.good();
}

std::optional<uint64_t> FileUtils::available_space(const std::filesystem::path& path) {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) return std::nullopt;
    return info.available;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::milliseconds> TimeUtils::parse_duration(const std::string& str) {
    auto text = StringUtils::to_lower(StringUtils::trim(str));
    if (text.empty()) return std::nullopt;

    size_t digits_end = 0;
    while (digits_end < text.size() && std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
        digits_end++;
    }
    if (digits_end == 0) return std::nullopt;

    uint64_t value = 0;
    try {
        value = std::stoull(text.substr(0, digits_end));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    auto unit = StringUtils::trim(text.substr(digits_end));
    uint64_t scale = 0;
    if (unit.empty() || unit == "s") scale = 1000;
    else if (unit == "ms") scale = 1;
    else if (unit == "m") scale = 60 * 1000;
    else if (unit == "h") scale = 60 * 60 * 1000;
    else return std::nullopt;

    // Must fit in signed milliseconds
    constexpr auto max_ms = static_cast<uint64_t>(std::chrono::milliseconds::max().count());
    if (value > max_ms / scale) return std::nullopt;

    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value * scale));
}

}
