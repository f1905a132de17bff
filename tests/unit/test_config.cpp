#include <gtest/gtest.h>
#include "lcars/core/config.hpp"
#include <filesystem>
#include <fstream>

using namespace lcars::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_file = (std::filesystem::temp_directory_path() / "test_lcars.conf").string();
        std::filesystem::remove(config_file);
    }

    void TearDown() override {
        std::filesystem::remove(config_file);
    }

    std::string config_file;
};

TEST_F(ConfigTest, SetAndGet) {
    Config config;

    config.set("bind_interface", "wg0");
    config.set("max_connections", "200");
    config.set("tunnel.enabled", "true");
    config.set("seeding.ratio_limit", "1.5");

    EXPECT_EQ(config.get_string("bind_interface"), "wg0");
    EXPECT_EQ(config.get_int("max_connections"), 200);
    EXPECT_TRUE(config.get_bool("tunnel.enabled"));
    EXPECT_DOUBLE_EQ(config.get_double("seeding.ratio_limit"), 1.5);
    EXPECT_TRUE(config.has("bind_interface"));
    EXPECT_FALSE(config.has("missing"));
}

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
    EXPECT_EQ(config.get_int("nonexistent", 42), 42);
    EXPECT_FALSE(config.get_bool("nonexistent"));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_DOUBLE_EQ(config.get_double("nonexistent", 2.5), 2.5);
}

TEST_F(ConfigTest, GetAsRejectsTrailingGarbage) {
    Config config;
    config.set("max_connections", "100");
    config.set("transfer.max_retries", "5x");

    ASSERT_TRUE(config.get_as<int>("max_connections").has_value());
    EXPECT_EQ(*config.get_as<int>("max_connections"), 100);
    EXPECT_FALSE(config.get_as<int>("transfer.max_retries").has_value());
    EXPECT_EQ(config.get_int("transfer.max_retries", 3), 3);
}

TEST_F(ConfigTest, LoadFromFile) {
    {
        std::ofstream file(config_file);
        file << "# comment line\n";
        file << "download_directory = /srv/media\n";
        file << "bind_interface=wg0\n";
        file << "\n";
        file << "not a key value line\n";
        file << "tunnel.kill_switch = false  \n";
    }

    Config config;
    EXPECT_TRUE(config.load_from_file(config_file));

    EXPECT_EQ(config.get_string("download_directory"), "/srv/media");
    EXPECT_EQ(config.get_string("bind_interface"), "wg0");
    EXPECT_FALSE(config.get_bool("tunnel.kill_switch", true));
    EXPECT_EQ(config.values().size(), 3u);
}

TEST_F(ConfigTest, SectionsPrefixKeys) {
    {
        std::ofstream file(config_file);
        file << "download_directory = \"/srv/media library\"\n";
        file << "\n";
        file << "[tunnel]\n";
        file << "enabled = true   # route through wg0\n";
        file << "config_file = /etc/wireguard/wg0.conf\n";
        file << "\n";
        file << "[ seeding ]\n";
        file << "; semicolon comment\n";
        file << "ratio_limit = 2.0\n";
    }

    Config config;
    ASSERT_TRUE(config.load_from_file(config_file));

    EXPECT_EQ(config.get_string("download_directory"), "/srv/media library");
    EXPECT_TRUE(config.get_bool("tunnel.enabled"));
    EXPECT_EQ(config.get_string("tunnel.config_file"), "/etc/wireguard/wg0.conf");
    EXPECT_DOUBLE_EQ(config.get_double("seeding.ratio_limit"), 2.0);
    EXPECT_FALSE(config.has("enabled"));
}

TEST_F(ConfigTest, LoadMissingFile) {
    Config config;
    EXPECT_FALSE(config.load_from_file(config_file));
}

TEST_F(ConfigTest, SaveAndReload) {
    Config config;
    config.set("bind_interface", "wg1");
    config.set("port_range", "7000-7010");
    config.set("tunnel.enabled", "true");
    config.set("tunnel.auto_reconnect", "false");
    config.set("binding.table", "100");

    EXPECT_TRUE(config.save_to_file(config_file));

    Config reloaded;
    EXPECT_TRUE(reloaded.load_from_file(config_file));
    EXPECT_EQ(reloaded.values(), config.values());
    EXPECT_EQ(reloaded.get_string("bind_interface"), "wg1");
    EXPECT_EQ(reloaded.get_string("tunnel.auto_reconnect"), "false");
}

TEST_F(ConfigTest, SetDefaults) {
    Config config;
    config.set_defaults();

    EXPECT_EQ(config.get_string("download_directory"), "./downloads");
    EXPECT_EQ(config.get_string("port_range"), "6881-6889");
    EXPECT_FALSE(config.get_bool("tunnel.enabled", true));
    EXPECT_TRUE(config.get_bool("tunnel.auto_reconnect"));
    EXPECT_FALSE(config.has("tunnel.kill_switch"));

    config.clear();
    EXPECT_TRUE(config.values().empty());
}

TEST_F(ConfigTest, Singleton) {
    Config& a = Config::instance();
    Config& b = Config::instance();
    EXPECT_EQ(&a, &b);
}
