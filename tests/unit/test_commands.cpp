#include <gtest/gtest.h>
#include "lcars/core/command_registry.hpp"
#include "lcars/core/config.hpp"
#include "lcars/crypto/keys.hpp"
#include <filesystem>
#include <fstream>

using namespace lcars::core;

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(lcars::crypto::initialize());

        work_dir = std::filesystem::temp_directory_path() / "lcars_commands_test";
        std::filesystem::create_directories(work_dir);

        auto& config = Config::instance();
        config.clear();
        config.set_defaults();
        config.set("download_directory", work_dir.string());
    }

    void TearDown() override {
        Config::instance().clear();
        std::filesystem::remove_all(work_dir);
    }

    std::string write_tunnel_config() {
        auto path = work_dir / "wg0.conf";
        std::ofstream file(path);
        file << "[Interface]\n"
             << "PrivateKey = dwdtCnMYpX08FsFyUbJmRd9ML4frwJkqsXf7pR25LCo=\n"
             << "Address = 10.0.0.2/32\n"
             << "DNS = 10.0.0.1\n"
             << "\n"
             << "[Peer]\n"
             << "PublicKey = BwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwcHBwc=\n"
             << "Endpoint = 192.168.1.1:51820\n"
             << "AllowedIPs = 0.0.0.0/0\n";
        return path.string();
    }

    std::filesystem::path work_dir;
    CommandRegistry registry;
};

TEST_F(CommandRegistryTest, KnowsBuiltInCommands) {
    EXPECT_TRUE(registry.has_command("check-config"));
    EXPECT_TRUE(registry.has_command("wg-show"));
    EXPECT_TRUE(registry.has_command("binding-plan"));
    EXPECT_TRUE(registry.has_command("tunnel-up"));
    EXPECT_TRUE(registry.has_command("fetch"));
    EXPECT_FALSE(registry.has_command("seed"));
}

TEST_F(CommandRegistryTest, UnknownCommandFails) {
    auto result = registry.execute_command("seed", {"seed"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.message, "Unknown command: seed");
}

TEST_F(CommandRegistryTest, CheckConfigWithoutTunnel) {
    ::testing::internal::CaptureStdout();
    auto result = registry.execute_command("check-config", {"check-config"});
    auto output = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(output.find("Configuration OK"), std::string::npos);
    EXPECT_NE(output.find("Ports: 6881-6889"), std::string::npos);
    EXPECT_NE(output.find("Disabled"), std::string::npos);
}

TEST_F(CommandRegistryTest, CheckConfigReportsInvalidSettings) {
    Config::instance().set("tunnel.kill_switch", "true");

    auto result = registry.execute_command("check-config", {"check-config"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("tunnel.kill_switch"), std::string::npos);
}

TEST_F(CommandRegistryTest, CheckConfigLoadsTunnelConfig) {
    auto& config = Config::instance();
    config.set("tunnel.enabled", "true");
    config.set("bind_interface", "wg0");
    config.set("tunnel.config_file", write_tunnel_config());

    ::testing::internal::CaptureStdout();
    auto result = registry.execute_command("check-config", {"check-config"});
    auto output = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(output.find("Kill switch: armed"), std::string::npos);
    EXPECT_NE(output.find("Peer: 192.168.1.1:51820"), std::string::npos);
}

TEST_F(CommandRegistryTest, WireGuardShowDerivesPublicKey) {
    auto path = write_tunnel_config();

    ::testing::internal::CaptureStdout();
    auto result = registry.execute_command("wg-show", {"wg-show", path});
    auto output = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(output.find("hSDwCYkwp1R0i33ctD73Wg2/Og0mOBr066SpjqqbTmo="), std::string::npos);
    EXPECT_EQ(output.find("dwdtCnMYpX08FsFyUbJmRd9ML4frwJkqsXf7pR25LCo="), std::string::npos);
    EXPECT_NE(output.find("DNS: 10.0.0.1"), std::string::npos);
}

TEST_F(CommandRegistryTest, WireGuardShowRequiresFile) {
    auto result = registry.execute_command("wg-show", {"wg-show"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Usage: wg-show <config-file>");

    result = registry.execute_command("wg-show", {"wg-show", (work_dir / "missing.conf").string()});
    EXPECT_FALSE(result.success);
}

TEST_F(CommandRegistryTest, BindingPlanPrintsRoutingSteps) {
    ::testing::internal::CaptureStdout();
    auto result = registry.execute_command("binding-plan", {"binding-plan", "wg-media"});
    auto output = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(output.find("ip -4 route replace default dev wg-media table 51820"), std::string::npos);
    EXPECT_NE(output.find("ip -4 rule add fwmark 0x4c43 table 51820 priority 10000"), std::string::npos);
    EXPECT_NE(output.find("ip -6 route replace unreachable default table 51820"), std::string::npos);
    EXPECT_NE(output.find("ip -6 route flush table 51820"), std::string::npos);
}

TEST_F(CommandRegistryTest, TunnelUpRequiresEnabledTunnel) {
    auto result = registry.execute_command("tunnel-up", {"tunnel-up"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "tunnel.enabled is false; nothing to bring up");
}

TEST_F(CommandRegistryTest, FetchRequiresUri) {
    auto result = registry.execute_command("fetch", {"fetch"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Usage: fetch <magnet-uri>...");
}

TEST_F(CommandRegistryTest, FetchRejectsMalformedUriBeforeStarting) {
    auto result = registry.execute_command(
        "fetch", {"fetch", "magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a", "magnet:no-query"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Magnet URI has no parameters"), std::string::npos);
}
