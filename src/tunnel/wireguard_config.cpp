#include "lcars/tunnel/wireguard_config.hpp"
#include "lcars/core/utils.hpp"
#include "lcars/crypto/keys.hpp"
#include <sodium.h>
#include <fstream>
#include <limits>
#include <sstream>

namespace lcars::tunnel {

using core::ErrorCode;
using core::Result;
using core::utils::StringUtils;

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    for (const auto& item : StringUtils::split(value, ',')) {
        auto trimmed = StringUtils::trim(item);
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    return items;
}

template<typename T>
std::optional<T> parse_number(const std::string& value) {
    std::istringstream iss(value);
    uint64_t number = 0;
    iss >> number;
    if (iss.fail() || !iss.eof() || number > std::numeric_limits<T>::max()) {
        return std::nullopt;
    }
    return static_cast<T>(number);
}

void wipe(std::string& secret) {
    if (!secret.empty()) {
        sodium_memzero(secret.data(), secret.size());
    }
}

} // namespace

WireGuardConfig::~WireGuardConfig() {
    wipe(private_key);
    if (peer.preshared_key) {
        wipe(*peer.preshared_key);
    }
}

core::ValueResult<WireGuardConfig> WireGuardConfig::parse(const std::string& text) {
    WireGuardConfig config;
    std::string section;
    std::istringstream stream(text);
    std::string raw;
    int line_number = 0;

    while (std::getline(stream, raw)) {
        line_number++;
        auto line = StringUtils::trim(raw);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return Result(ErrorCode::INVALID_INPUT,
                          "Line " + std::to_string(line_number) + ": expected Key = Value");
        }

        auto key = StringUtils::trim(line.substr(0, eq));
        auto value = StringUtils::trim(line.substr(eq + 1));

        if (section == "Interface") {
            if (key == "PrivateKey") {
                config.private_key = value;
            } else if (key == "Address") {
                auto items = split_list(value);
                config.addresses.insert(config.addresses.end(), items.begin(), items.end());
            } else if (key == "ListenPort") {
                config.listen_port = parse_number<uint16_t>(value);
                if (!config.listen_port) {
                    return Result(ErrorCode::INVALID_INPUT, "Invalid ListenPort: " + value);
                }
            } else if (key == "DNS") {
                auto items = split_list(value);
                config.dns.insert(config.dns.end(), items.begin(), items.end());
            } else if (key == "MTU") {
                config.mtu = parse_number<uint32_t>(value);
                if (!config.mtu) {
                    return Result(ErrorCode::INVALID_INPUT, "Invalid MTU: " + value);
                }
            }
        } else if (section == "Peer") {
            if (key == "PublicKey") {
                config.peer.public_key = value;
            } else if (key == "PresharedKey") {
                config.peer.preshared_key = value;
            } else if (key == "Endpoint") {
                config.peer.endpoint = value;
            } else if (key == "AllowedIPs") {
                auto items = split_list(value);
                config.peer.allowed_ips.insert(config.peer.allowed_ips.end(), items.begin(), items.end());
            } else if (key == "PersistentKeepalive") {
                config.peer.persistent_keepalive = parse_number<uint16_t>(value).value_or(25);
            }
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return valid;
    }
    return config;
}

core::ValueResult<WireGuardConfig> WireGuardConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result(ErrorCode::NOT_FOUND, "Cannot open WireGuard config: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

Result WireGuardConfig::validate() const {
    if (private_key.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Missing PrivateKey in config");
    }
    if (peer.public_key.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Missing PublicKey in config");
    }
    if (peer.endpoint.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Missing Endpoint in config");
    }
    if (addresses.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Missing Address in config");
    }
    if (peer.allowed_ips.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Missing AllowedIPs in config");
    }

    auto check_key = [](const std::string& name, const std::string& key) {
        auto decoded = crypto::decode_key(key);
        if (!decoded) {
            return Result(ErrorCode::INVALID_INPUT, "Invalid " + name + ": " + decoded.status.message);
        }
        return Result();
    };

    if (auto r = check_key("PrivateKey", private_key); !r) return r;
    if (auto r = check_key("PublicKey", peer.public_key); !r) return r;
    if (peer.preshared_key) {
        if (auto r = check_key("PresharedKey", *peer.preshared_key); !r) return r;
    }

    return Result();
}

}
