#pragma once

#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>

namespace lcars::core {

// key=value settings store. "[section]" headers prefix the keys that follow
// them, so "[tunnel]\nenabled = true" is read as tunnel.enabled.
class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const { return values_.count(key) > 0; }

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        iss >> result;
        if (iss.fail() || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    const std::map<std::string, std::string>& values() const { return values_; }

    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace lcars::core
