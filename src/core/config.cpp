#include "lcars/core/config.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <utility>

namespace lcars::core {

using utils::StringUtils;

namespace {

const std::pair<const char*, const char*> DEFAULTS[] = {
    {"download_directory", "./downloads"},
    {"bind_interface", ""},
    {"max_connections", "100"},
    {"port_range", "6881-6889"},
    {"seeding.enabled", "true"},
    {"seeding.ratio_limit", "1.0"},
    {"seeding.time_limit", "48h"},
    {"transfer.tick_interval", "1s"},
    {"transfer.max_retries", "5"},
    {"tunnel.enabled", "false"},
    {"tunnel.auto_reconnect", "true"},
    {"tunnel.dns_leak_protection", "true"},
    {"tunnel.health_check_interval", "30s"},
    {"tunnel.reconnect_min_delay", "1s"},
    {"tunnel.reconnect_max_delay", "300s"},
    {"tunnel.handshake_stale_after", "180s"},
    {"log.level", "info"},
    {"log.file", "lcars.log"},
};

// Quoted values are taken verbatim; otherwise a trailing " # comment" is dropped
std::string clean_value(const std::string& raw) {
    auto value = StringUtils::trim(raw);

    if (value.size() >= 2 && value.front() == '"') {
        auto closing = value.find('"', 1);
        if (closing != std::string::npos) {
            return value.substr(1, closing - 1);
        }
    }

    auto comment = value.find(" #");
    if (comment != std::string::npos) {
        value = StringUtils::trim(value.substr(0, comment));
    }
    return value;
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // [tunnel] prefixes the keys below it with "tunnel."
        if (line.front() == '[' && line.back() == ']') {
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("{}:{}: ignoring line without '='", filename, line_number);
            continue;
        }

        auto key = StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring entry without a key", filename, line_number);
            continue;
        }

        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = clean_value(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# LCARS transport core configuration\n";

    // Keys with a dot are written under their section header
    std::string current_section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }

    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            continue;
        }

        auto section = key.substr(0, dot);
        if (section != current_section) {
            file << "\n[" << section << "]\n";
            current_section = section;
        }
        file << key.substr(dot + 1) << " = " << value << "\n";
    }

    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

double Config::get_double(const std::string& key, double default_value) const {
    return get_as<double>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

}
