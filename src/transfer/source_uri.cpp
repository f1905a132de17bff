#include "lcars/transfer/transfer.hpp"
#include "lcars/core/utils.hpp"
#include "lcars/crypto/keys.hpp"
#include <array>
#include <cctype>

namespace lcars::transfer {

using core::utils::StringUtils;

namespace {

constexpr size_t INFO_HASH_HEX_LENGTH = 40;
constexpr size_t INFO_HASH_BASE32_LENGTH = 32;

std::optional<std::string> base32_to_hex(const std::string& encoded) {
    std::array<uint8_t, 20> bytes{};
    uint64_t buffer = 0;
    int bits = 0;
    size_t out = 0;

    for (char c : encoded) {
        int value;
        if (c >= 'A' && c <= 'Z') {
            value = c - 'A';
        } else if (c >= 'a' && c <= 'z') {
            value = c - 'a';
        } else if (c >= '2' && c <= '7') {
            value = c - '2' + 26;
        } else {
            return std::nullopt;
        }

        buffer = (buffer << 5) | static_cast<uint64_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            bytes[out++] = static_cast<uint8_t>((buffer >> bits) & 0xff);
        }
    }

    return StringUtils::to_hex(bytes.data(), bytes.size());
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '+') {
            result += ' ';
        } else if (value[i] == '%' && i + 2 < value.size() &&
                   StringUtils::is_hex(value.substr(i + 1, 2))) {
            result += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += value[i];
        }
    }
    return result;
}

core::ValueResult<SourceUri> parse_magnet(const std::string& uri) {
    auto query_start = uri.find('?');
    if (query_start == std::string::npos) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Magnet URI has no parameters");
    }

    SourceUri parsed;
    for (const auto& param : StringUtils::split(uri.substr(query_start + 1), '&')) {
        auto eq = param.find('=');
        if (eq == std::string::npos) continue;

        auto key = param.substr(0, eq);
        auto value = param.substr(eq + 1);

        if (key == "xt" && parsed.source_id.empty()) {
            const std::string prefix = "urn:btih:";
            if (!StringUtils::starts_with(StringUtils::to_lower(value), prefix)) {
                continue;
            }
            auto hash = value.substr(prefix.size());
            if (hash.size() == INFO_HASH_HEX_LENGTH && StringUtils::is_hex(hash)) {
                parsed.source_id = StringUtils::to_lower(hash);
            } else if (hash.size() == INFO_HASH_BASE32_LENGTH) {
                auto hex = base32_to_hex(hash);
                if (!hex) {
                    return core::Result(core::ErrorCode::INVALID_INPUT, "Invalid base32 info-hash");
                }
                parsed.source_id = *hex;
            } else {
                return core::Result(core::ErrorCode::INVALID_INPUT,
                                    "Info-hash must be 40 hex or 32 base32 characters");
            }
        } else if (key == "dn") {
            parsed.display_name = url_decode(value);
        }
    }

    if (parsed.source_id.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Magnet URI has no urn:btih info-hash");
    }
    return parsed;
}

} // namespace

core::ValueResult<SourceUri> SourceUri::parse(const std::string& uri) {
    auto trimmed = StringUtils::trim(uri);
    if (trimmed.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Source URI is empty");
    }

    if (StringUtils::starts_with(StringUtils::to_lower(trimmed), "magnet:")) {
        return parse_magnet(trimmed);
    }

    auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0 || scheme_end + 3 >= trimmed.size()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Unsupported source URI: " + trimmed);
    }

    auto scheme = StringUtils::to_lower(trimmed.substr(0, scheme_end));
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return core::Result(core::ErrorCode::INVALID_INPUT, "Invalid URI scheme: " + scheme);
        }
    }

    // Scheme is case-insensitive, the provider path is not
    auto normalized = scheme + trimmed.substr(scheme_end);

    SourceUri parsed;
    parsed.source_id = scheme + ":" + crypto::source_digest_hex(normalized);
    parsed.display_name = trimmed.substr(scheme_end + 3);
    return parsed;
}

const char* transfer_status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::QUEUED: return "Queued";
        case TransferStatus::DOWNLOADING: return "Downloading";
        case TransferStatus::SEEDING: return "Seeding";
        case TransferStatus::PROCESSING: return "Processing";
        case TransferStatus::COMPLETED: return "Completed";
        case TransferStatus::FAILED: return "Failed";
        case TransferStatus::PAUSED: return "Paused";
    }
    return "Unknown";
}

const char* pause_reason_to_string(PauseReason reason) {
    switch (reason) {
        case PauseReason::USER_REQUESTED: return "UserRequested";
        case PauseReason::KILL_SWITCH: return "KillSwitch";
    }
    return "Unknown";
}

}
