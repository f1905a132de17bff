#include "lcars/core/settings.hpp"
#include "lcars/core/utils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace lcars::core {

namespace {

class SettingsReader {
public:
    explicit SettingsReader(const Config& config) : config_(config) {}

    void read_bool(const std::string& key, bool& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto lower = utils::StringUtils::to_lower(*value);
        if (lower == "true" || lower == "1" || lower == "yes") {
            out = true;
        } else if (lower == "false" || lower == "0" || lower == "no") {
            out = false;
        } else {
            fail(key, *value, "expected a boolean");
        }
    }

    void read_uint(const std::string& key, uint32_t& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto parsed = config_.get_as<uint64_t>(key);
        if (!parsed || *parsed > std::numeric_limits<uint32_t>::max()) {
            fail(key, *value, "expected a non-negative integer");
            return;
        }
        out = static_cast<uint32_t>(*parsed);
    }

    // Decimal, 0x-prefixed hex or 0-prefixed octal, as ip-rule(8) accepts them
    void read_mark(const std::string& key, uint32_t& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto text = utils::StringUtils::trim(*value);
        if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
            fail(key, *value, "expected a decimal or 0x-prefixed integer");
            return;
        }

        unsigned long long parsed = 0;
        size_t consumed = 0;
        try {
            parsed = std::stoull(text, &consumed, 0);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != text.size() || parsed > std::numeric_limits<uint32_t>::max()) {
            fail(key, *value, "expected a decimal or 0x-prefixed 32-bit integer");
            return;
        }
        out = static_cast<uint32_t>(parsed);
    }

    void read_double(const std::string& key, double& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto parsed = config_.get_as<double>(key);
        if (!parsed) {
            fail(key, *value, "expected a number");
            return;
        }
        out = *parsed;
    }

    void read_duration(const std::string& key, std::chrono::milliseconds& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto parsed = utils::TimeUtils::parse_duration(*value);
        if (!parsed) {
            fail(key, *value, "expected a duration such as 30s, 5m or 48h");
            return;
        }
        out = *parsed;
    }

    // Empty or "none" disables an optional limit
    template<typename T, typename Parse>
    void read_optional(const std::string& key, std::optional<T>& out, Parse parse) {
        auto value = config_.get(key);
        if (!value) return;

        auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(*value));
        if (lower.empty() || lower == "none") {
            out.reset();
            return;
        }

        auto parsed = parse(*value);
        if (!parsed) {
            fail(key, *value, "invalid value");
            return;
        }
        out = *parsed;
    }

    void read_port_range(const std::string& key, std::pair<uint16_t, uint16_t>& out) {
        auto value = config_.get(key);
        if (!value) return;

        auto separator = value->find_first_of("-:,");
        if (separator == std::string::npos) {
            fail(key, *value, "expected <start>-<end>");
            return;
        }

        try {
            auto start = std::stoul(utils::StringUtils::trim(value->substr(0, separator)));
            auto end = std::stoul(utils::StringUtils::trim(value->substr(separator + 1)));
            if (start > 65535 || end > 65535) {
                fail(key, *value, "port out of range");
                return;
            }
            out = {static_cast<uint16_t>(start), static_cast<uint16_t>(end)};
        } catch (const std::exception&) {
            fail(key, *value, "expected <start>-<end>");
        }
    }

    const Result& result() const { return result_; }

private:
    void fail(const std::string& key, const std::string& value, const std::string& reason) {
        if (result_.success()) {
            result_ = Result(ErrorCode::INVALID_INPUT,
                             "Invalid value '" + value + "' for " + key + ": " + reason);
        }
    }

    const Config& config_;
    Result result_;
};

} // namespace

bool TransferSettings::has_sufficient_space(uint64_t required_bytes) const {
    auto available = utils::FileUtils::available_space(download_directory);
    if (!available) {
        return false;
    }
    return *available > required_bytes + SPACE_SAFETY_MARGIN;
}

ValueResult<Settings> Settings::from_config(const Config& config) {
    Settings settings;
    SettingsReader reader(config);

    settings.transfer.download_directory =
        config.get_string("download_directory", settings.transfer.download_directory.string());
    reader.read_uint("max_connections", settings.transfer.max_connections);
    reader.read_port_range("port_range", settings.transfer.port_range);
    reader.read_duration("transfer.tick_interval", settings.transfer.tick_interval);
    reader.read_uint("transfer.max_retries", settings.transfer.max_retries);
    reader.read_duration("transfer.retry_min_delay", settings.transfer.retry_min_delay);
    reader.read_duration("transfer.retry_max_delay", settings.transfer.retry_max_delay);

    reader.read_bool("seeding.enabled", settings.transfer.seeding.enabled);
    reader.read_optional("seeding.ratio_limit", settings.transfer.seeding.ratio_limit,
        [&config](const std::string&) { return config.get_as<double>("seeding.ratio_limit"); });
    reader.read_optional("seeding.time_limit", settings.transfer.seeding.time_limit,
        [](const std::string& value) { return utils::TimeUtils::parse_duration(value); });

    settings.tunnel.interface_name = utils::StringUtils::trim(config.get_string("bind_interface"));
    settings.tunnel.config_file = config.get_string("tunnel.config_file");
    reader.read_bool("tunnel.enabled", settings.tunnel.enabled);
    if (config.has("tunnel.kill_switch")) {
        reader.read_bool("tunnel.kill_switch", settings.tunnel.kill_switch);
        settings.tunnel.kill_switch_explicit = true;
    }
    reader.read_bool("tunnel.auto_reconnect", settings.tunnel.auto_reconnect);
    reader.read_bool("tunnel.dns_leak_protection", settings.tunnel.dns_leak_protection);
    reader.read_duration("tunnel.health_check_interval", settings.tunnel.health_check_interval);
    reader.read_duration("tunnel.reconnect_min_delay", settings.tunnel.reconnect_min_delay);
    reader.read_duration("tunnel.reconnect_max_delay", settings.tunnel.reconnect_max_delay);
    reader.read_double("tunnel.reconnect_backoff_factor", settings.tunnel.reconnect_backoff_factor);
    reader.read_uint("tunnel.max_reconnect_attempts", settings.tunnel.max_reconnect_attempts);
    reader.read_duration("tunnel.handshake_stale_after", settings.tunnel.handshake_stale_after);
    reader.read_duration("tunnel.handshake_timeout", settings.tunnel.handshake_timeout);

    reader.read_mark("binding.fwmark", settings.binding.fwmark);
    reader.read_mark("binding.table", settings.binding.table);
    reader.read_uint("binding.rule_priority", settings.binding.rule_priority);

    uint32_t capacity = static_cast<uint32_t>(settings.event_capacity);
    reader.read_uint("events.capacity", capacity);
    settings.event_capacity = capacity;

    settings.log_level = config.get_string("log.level", settings.log_level);
    settings.log_file = config.get_string("log.file", settings.log_file);

    if (!reader.result().success()) {
        return reader.result();
    }

    auto validation = settings.validate();
    if (!validation.success()) {
        return validation;
    }

    return settings;
}

Result Settings::validate() const {
    if (transfer.download_directory.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "download_directory must not be empty");
    }

    if (transfer.port_range.first == 0 || transfer.port_range.first >= transfer.port_range.second) {
        return Result(ErrorCode::INVALID_INPUT, "Invalid port range: start must be less than end");
    }

    if (transfer.max_connections == 0) {
        return Result(ErrorCode::INVALID_INPUT, "max_connections must be positive");
    }

    if (transfer.tick_interval.count() <= 0) {
        return Result(ErrorCode::INVALID_INPUT, "transfer.tick_interval must be positive");
    }

    if (transfer.retry_min_delay > transfer.retry_max_delay) {
        return Result(ErrorCode::INVALID_INPUT, "transfer.retry_min_delay exceeds transfer.retry_max_delay");
    }

    if (transfer.seeding.ratio_limit && *transfer.seeding.ratio_limit < 0.0) {
        return Result(ErrorCode::INVALID_INPUT, "Seeding ratio limit cannot be negative");
    }

    if (tunnel.enabled && tunnel.interface_name.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "tunnel.enabled requires bind_interface to name the tunnel interface");
    }

    if (!tunnel.enabled && tunnel.kill_switch && tunnel.kill_switch_explicit) {
        return Result(ErrorCode::INVALID_INPUT,
                      "tunnel.kill_switch=true requires tunnel.enabled=true; "
                      "set tunnel.kill_switch=false to run without a tunnel");
    }

    if (tunnel.health_check_interval.count() <= 0) {
        return Result(ErrorCode::INVALID_INPUT, "tunnel.health_check_interval must be positive");
    }

    if (tunnel.reconnect_min_delay.count() <= 0 || tunnel.reconnect_min_delay > tunnel.reconnect_max_delay) {
        return Result(ErrorCode::INVALID_INPUT, "tunnel.reconnect_min_delay must be positive and not exceed tunnel.reconnect_max_delay");
    }

    if (tunnel.reconnect_backoff_factor < 1.0) {
        return Result(ErrorCode::INVALID_INPUT, "tunnel.reconnect_backoff_factor must be at least 1.0");
    }

    if (binding.fwmark == 0 || binding.table == 0) {
        return Result(ErrorCode::INVALID_INPUT, "binding.fwmark and binding.table must be non-zero");
    }

    if (event_capacity == 0) {
        return Result(ErrorCode::INVALID_INPUT, "events.capacity must be positive");
    }

    return Result();
}

}
