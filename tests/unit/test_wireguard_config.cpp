#include <gtest/gtest.h>
#include "lcars/crypto/keys.hpp"
#include "lcars/tunnel/wireguard_config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace lcars;
using tunnel::WireGuardConfig;

namespace {

const std::string PRIVATE_KEY = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=";
const std::string PEER_KEY = "BwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwc=";
const std::string PRESHARED_KEY = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";

std::string full_config() {
    return "\n"
           "[Interface]\n"
           "PrivateKey = " + PRIVATE_KEY + "\n"
           "Address = 10.0.0.2/32, fd00::2/128\n"
           "ListenPort = 51820\n"
           "DNS = 10.0.0.1\n"
           "MTU = 1420\n"
           "\n"
           "[Peer]\n"
           "PublicKey = " + PEER_KEY + "\n"
           "PresharedKey = " + PRESHARED_KEY + "\n"
           "Endpoint = vpn.example.com:51820\n"
           "AllowedIPs = 0.0.0.0/0, ::/0\n"
           "PersistentKeepalive = 25\n";
}

std::string minimal_config() {
    return "[Interface]\n"
           "PrivateKey = " + PRIVATE_KEY + "\n"
           "Address = 10.0.0.2/32\n"
           "\n"
           "[Peer]\n"
           "PublicKey = " + PEER_KEY + "\n"
           "Endpoint = 192.168.1.1:51820\n"
           "AllowedIPs = 0.0.0.0/0\n";
}

std::string without_line(const std::string& text, const std::string& key) {
    std::string result;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(key, 0) != 0) {
            result += line + "\n";
        }
    }
    return result;
}

}

class WireGuardConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::initialize());
        config_path = std::filesystem::temp_directory_path() / "lcars_wg_test.conf";
        std::filesystem::remove(config_path);
    }

    void TearDown() override {
        std::filesystem::remove(config_path);
    }

    std::filesystem::path config_path;
};

TEST_F(WireGuardConfigTest, ParsesFullConfig) {
    {
        std::ofstream file(config_path);
        file << full_config();
    }

    auto config = WireGuardConfig::load(config_path);
    ASSERT_TRUE(config.success()) << config.status.message;

    EXPECT_EQ(config->private_key, PRIVATE_KEY);
    EXPECT_EQ(config->addresses, (std::vector<std::string>{"10.0.0.2/32", "fd00::2/128"}));
    EXPECT_EQ(config->listen_port.value_or(0), 51820);
    EXPECT_EQ(config->dns, std::vector<std::string>{"10.0.0.1"});
    EXPECT_EQ(config->mtu.value_or(0), 1420u);

    EXPECT_EQ(config->peer.public_key, PEER_KEY);
    EXPECT_EQ(config->peer.preshared_key.value_or(""), PRESHARED_KEY);
    EXPECT_EQ(config->peer.endpoint, "vpn.example.com:51820");
    EXPECT_EQ(config->peer.allowed_ips, (std::vector<std::string>{"0.0.0.0/0", "::/0"}));
    EXPECT_EQ(config->peer.persistent_keepalive, 25);
}

TEST_F(WireGuardConfigTest, ParsesMinimalConfig) {
    auto config = WireGuardConfig::parse(minimal_config());
    ASSERT_TRUE(config.success()) << config.status.message;

    EXPECT_EQ(config->addresses.size(), 1);
    EXPECT_TRUE(config->dns.empty());
    EXPECT_FALSE(config->mtu.has_value());
    EXPECT_FALSE(config->listen_port.has_value());
    EXPECT_FALSE(config->peer.preshared_key.has_value());
    EXPECT_EQ(config->peer.persistent_keepalive, 25);
}

TEST_F(WireGuardConfigTest, IgnoresCommentsAndUnknownKeys) {
    auto text = "# provider export\n; generated\n" + minimal_config() +
                "PostUp = iptables -A FORWARD\n[Unknown]\nFoo = bar\n";

    auto config = WireGuardConfig::parse(text);
    ASSERT_TRUE(config.success()) << config.status.message;
    EXPECT_EQ(config->peer.endpoint, "192.168.1.1:51820");
}

TEST_F(WireGuardConfigTest, ReportsMissingFields) {
    struct Case {
        std::string key;
        std::string message;
    };
    const Case cases[] = {
        {"PrivateKey", "Missing PrivateKey in config"},
        {"PublicKey", "Missing PublicKey in config"},
        {"Endpoint", "Missing Endpoint in config"},
        {"Address", "Missing Address in config"},
        {"AllowedIPs", "Missing AllowedIPs in config"},
    };

    for (const auto& c : cases) {
        auto config = WireGuardConfig::parse(without_line(minimal_config(), c.key));
        ASSERT_FALSE(config.success()) << c.key;
        EXPECT_EQ(config.status.error, core::ErrorCode::INVALID_INPUT);
        EXPECT_EQ(config.status.message, c.message);
    }
}

TEST_F(WireGuardConfigTest, RejectsBadKeys) {
    auto text = minimal_config();
    auto pos = text.find(PEER_KEY);
    text.replace(pos, PEER_KEY.size(), "AAAAAAAAAAAAAAAAAAAAAA==");

    auto config = WireGuardConfig::parse(text);
    ASSERT_FALSE(config.success());
    EXPECT_NE(config.status.message.find("Invalid PublicKey"), std::string::npos);

    auto with_psk = minimal_config() + "PresharedKey = not-base64\n";
    config = WireGuardConfig::parse(with_psk);
    ASSERT_FALSE(config.success());
    EXPECT_NE(config.status.message.find("Invalid PresharedKey"), std::string::npos);
}

TEST_F(WireGuardConfigTest, RejectsMalformedLines) {
    EXPECT_FALSE(WireGuardConfig::parse(minimal_config() + "garbage line\n").success());

    auto bad_port = WireGuardConfig::parse(minimal_config() + "[Interface]\nListenPort = 70000\n");
    EXPECT_FALSE(bad_port.success());
    EXPECT_NE(bad_port.status.message.find("ListenPort"), std::string::npos);

    auto bad_mtu = WireGuardConfig::parse(minimal_config() + "[Interface]\nMTU = big\n");
    EXPECT_FALSE(bad_mtu.success());
}

TEST_F(WireGuardConfigTest, LoadMissingFile) {
    auto config = WireGuardConfig::load(config_path);
    EXPECT_FALSE(config.success());
    EXPECT_EQ(config.status.error, core::ErrorCode::NOT_FOUND);
}
