#include <gtest/gtest.h>
#include "lcars/network/kill_switch.hpp"
#include "support/fakes.hpp"
#include <algorithm>
#include <filesystem>

using namespace lcars;
using lcars::testing::FakeTransferBackend;
using lcars::testing::FakeTunnelBackend;
using lcars::testing::drain;
using lcars::testing::events_of;
using lcars::testing::wait_until;
using transfer::PauseReason;
using transfer::TransferStatus;
using tunnel::TunnelStatus;
using namespace std::chrono_literals;

namespace {

transfer::BackendStats downloading_stats() {
    transfer::BackendStats stats;
    stats.active = true;
    stats.progress = 0.4;
    stats.download_rate = 8192;
    stats.bytes_downloaded = 400;
    stats.size_bytes = 1000;
    stats.peer_count = 5;
    return stats;
}

core::Result bring_up_failure() {
    return core::Result(core::ErrorCode::TUNNEL_SETUP, "Handshake not completed");
}

}

class KillSwitchIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        download_dir = std::filesystem::temp_directory_path() / "lcars_kill_switch_test";
        std::filesystem::create_directories(download_dir);
        transfer_settings.download_directory = download_dir;

        tunnel_settings.enabled = true;
        tunnel_settings.interface_name = "wg-test";
        tunnel_settings.auto_reconnect = true;
        tunnel_settings.reconnect_min_delay = 1h;
        tunnel_settings.reconnect_max_delay = 1h;
        tunnel_settings.handshake_stale_after = 1s;

        transfer_backend = std::make_shared<FakeTransferBackend>();
        tunnel_backend = std::make_shared<FakeTunnelBackend>();
        bus = std::make_shared<events::EventBus>(1024);
        observer = bus->subscribe();
    }

    void TearDown() override {
        kill_switch.reset();
        tunnel.reset();
        engine.reset();
        std::filesystem::remove_all(download_dir);
    }

    void build() {
        engine = std::make_shared<transfer::TransferEngine>(transfer_settings, transfer_backend, bus);
        tunnel = std::make_shared<tunnel::TunnelService>(tunnel_settings, tunnel_backend, bus);
        kill_switch = std::make_unique<network::KillSwitchCoordinator>(engine, tunnel, bus);
    }

    std::string add_downloading(char c) {
        auto id = engine->add("magnet:?xt=urn:btih:" + std::string(40, c), {"movie", c});
        EXPECT_TRUE(id.success()) << id.status.message;
        transfer_backend->set_stats(*id, downloading_stats());
        engine->tick();
        return *id;
    }

    bool all_transfers_stopped() {
        for (const auto& transfer : engine->list()) {
            if (transfer.status != TransferStatus::PAUSED && !transfer::is_terminal(transfer.status)) {
                return false;
            }
        }
        return !transfer_backend->any_running();
    }

    bool all_status(TransferStatus status) {
        auto transfers = engine->list();
        return !transfers.empty() && std::all_of(transfers.begin(), transfers.end(),
            [status](const transfer::Transfer& t) { return t.status == status; });
    }

    void make_handshake_stale() {
        tunnel::InterfaceStats stats;
        stats.last_handshake = std::chrono::system_clock::now() - 10s;
        tunnel_backend->set_stats(stats);
    }

    std::filesystem::path download_dir;
    core::TransferSettings transfer_settings;
    core::TunnelSettings tunnel_settings;

    std::shared_ptr<FakeTransferBackend> transfer_backend;
    std::shared_ptr<FakeTunnelBackend> tunnel_backend;
    std::shared_ptr<events::EventBus> bus;
    std::shared_ptr<events::Subscription> observer;

    std::shared_ptr<transfer::TransferEngine> engine;
    std::shared_ptr<tunnel::TunnelService> tunnel;
    std::unique_ptr<network::KillSwitchCoordinator> kill_switch;
};

TEST_F(KillSwitchIntegrationTest, ArmingWhileDisconnectedHoldsTransfers) {
    build();
    auto id = add_downloading('a');
    EXPECT_EQ(engine->get(id)->status, TransferStatus::DOWNLOADING);

    ASSERT_TRUE(kill_switch->start());
    EXPECT_TRUE(kill_switch->is_running());
    EXPECT_GE(kill_switch->resync_count(), 1u);

    EXPECT_TRUE(engine->is_held());
    EXPECT_EQ(engine->get(id)->pause_reason, PauseReason::KILL_SWITCH);
    EXPECT_TRUE(all_transfers_stopped());
}

TEST_F(KillSwitchIntegrationTest, ConnectResumesEveryHeldTransfer) {
    build();
    std::vector<std::string> ids = {add_downloading('a'), add_downloading('b'), add_downloading('c')};
    ASSERT_TRUE(kill_switch->start());
    ASSERT_TRUE(all_status(TransferStatus::PAUSED));
    drain(*observer);

    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([this] { return all_status(TransferStatus::DOWNLOADING); }));
    EXPECT_FALSE(engine->is_held());

    auto received = drain(*observer);
    EXPECT_EQ(events_of<events::TunnelConnected>(received).size(), 1u);

    auto changes = events_of<events::TransferStatusChanged>(received);
    ASSERT_EQ(changes.size(), 3u);
    for (const auto& change : changes) {
        EXPECT_EQ(change.old_status, TransferStatus::PAUSED);
        EXPECT_EQ(change.new_status, TransferStatus::DOWNLOADING);
        EXPECT_NE(std::find(ids.begin(), ids.end(), change.source_id), ids.end());
    }
}

TEST_F(KillSwitchIntegrationTest, PauseIsPublishedBeforeFirstReconnectAttempt) {
    build();
    ASSERT_TRUE(kill_switch->start());
    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([this] { return !engine->is_held(); }));

    add_downloading('1');
    add_downloading('2');
    ASSERT_TRUE(wait_until([this] { return all_status(TransferStatus::DOWNLOADING); }));
    drain(*observer);

    make_handshake_stale();
    tunnel->health_check();
    EXPECT_EQ(tunnel->get_status().status, TunnelStatus::RECONNECTING);

    auto received = drain(*observer);
    auto reconnecting = std::find_if(received.begin(), received.end(), [](const events::Event& e) {
        auto r = std::get_if<events::TunnelReconnecting>(&e);
        return r && r->attempt == 1;
    });
    ASSERT_NE(reconnecting, received.end());

    std::vector<events::Event> before(received.begin(), reconnecting);
    auto pauses = events_of<events::TransferStatusChanged>(before);
    ASSERT_EQ(pauses.size(), 2u);
    for (const auto& pause : pauses) {
        EXPECT_EQ(pause.new_status, TransferStatus::PAUSED);
        EXPECT_EQ(pause.pause_reason, PauseReason::KILL_SWITCH);
    }
    EXPECT_TRUE(all_transfers_stopped());
}

TEST_F(KillSwitchIntegrationTest, FailedConnectPausesBeforeRetry) {
    build();
    ASSERT_TRUE(kill_switch->start());
    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([this] { return !engine->is_held(); }));
    add_downloading('3');
    ASSERT_TRUE(wait_until([this] { return all_status(TransferStatus::DOWNLOADING); }));

    ASSERT_TRUE(tunnel->disconnect().success());
    EXPECT_TRUE(all_transfers_stopped());
    drain(*observer);

    tunnel_backend->queue_outcome(bring_up_failure());
    EXPECT_FALSE(tunnel->connect().success());
    EXPECT_EQ(tunnel->get_status().status, TunnelStatus::RECONNECTING);

    auto received = drain(*observer);
    ASSERT_FALSE(received.empty());
    EXPECT_TRUE(std::holds_alternative<events::TunnelReconnecting>(received.back()));
    EXPECT_TRUE(events_of<events::TransferStatusChanged>(received).empty());
    EXPECT_TRUE(all_transfers_stopped());
}

TEST_F(KillSwitchIntegrationTest, UserPausedTransfersStayPausedAcrossFlaps) {
    build();
    ASSERT_TRUE(kill_switch->start());
    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([this] { return !engine->is_held(); }));

    auto user_paused = add_downloading('4');
    auto running = add_downloading('5');
    ASSERT_TRUE(engine->pause(user_paused).success());

    for (int flap = 0; flap < 3; ++flap) {
        ASSERT_TRUE(tunnel->disconnect().success());
        EXPECT_EQ(engine->get(running)->pause_reason, PauseReason::KILL_SWITCH);

        ASSERT_TRUE(tunnel->connect().success());
        ASSERT_TRUE(wait_until([&] { return engine->get(running)->status == TransferStatus::DOWNLOADING; }));

        auto paused = engine->get(user_paused);
        EXPECT_EQ(paused->status, TransferStatus::PAUSED);
        EXPECT_EQ(paused->pause_reason, PauseReason::USER_REQUESTED);
        EXPECT_FALSE(transfer_backend->is_running(user_paused));
    }
}

TEST_F(KillSwitchIntegrationTest, NoTransferRunsWhileTunnelIsDown) {
    build();
    ASSERT_TRUE(kill_switch->start());
    add_downloading('6');
    add_downloading('7');
    add_downloading('8');

    auto check = [this](const std::string& step) {
        if (tunnel->get_status().status != TunnelStatus::CONNECTED) {
            EXPECT_TRUE(all_transfers_stopped()) << "after " << step;
        }
    };

    for (int round = 0; round < 10; ++round) {
        if (round % 3 == 1) {
            tunnel_backend->queue_outcome(bring_up_failure());
        }

        auto connected = tunnel->connect();
        check("connect");

        if (connected) {
            EXPECT_TRUE(wait_until([this] { return !engine->is_held(); }));

            // New work arrives while connected
            add_downloading(static_cast<char>('a' + round % 6));

            if (round % 2 == 0) {
                make_handshake_stale();
                tunnel->health_check();
                check("stale handshake");
            }
        }

        ASSERT_TRUE(tunnel->disconnect().success());
        check("disconnect");
    }

    EXPECT_EQ(tunnel->get_status().status, TunnelStatus::DISCONNECTED);
    EXPECT_TRUE(engine->is_held());
}

TEST_F(KillSwitchIntegrationTest, AddDuringOutageWaitsForTunnel) {
    build();
    ASSERT_TRUE(kill_switch->start());

    auto id = engine->add("magnet:?xt=urn:btih:" + std::string(40, '9'), {"album", 2});
    ASSERT_TRUE(id.success());
    EXPECT_EQ(engine->get(*id)->status, TransferStatus::PAUSED);
    EXPECT_TRUE(transfer_backend->calls().empty());

    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([&] { return engine->get(*id)->status == TransferStatus::QUEUED; }));
    EXPECT_EQ(transfer_backend->calls(), std::vector<std::string>{"start " + *id});
}

TEST_F(KillSwitchIntegrationTest, ReconnectTimerResumesTransfers) {
    tunnel_settings.reconnect_min_delay = 10ms;
    tunnel_settings.reconnect_max_delay = 20ms;
    build();
    ASSERT_TRUE(tunnel->start());
    ASSERT_TRUE(kill_switch->start());
    add_downloading('a');

    tunnel_backend->queue_outcome(bring_up_failure());
    tunnel_backend->queue_outcome(bring_up_failure());
    EXPECT_FALSE(tunnel->connect().success());
    EXPECT_TRUE(all_transfers_stopped());

    ASSERT_TRUE(wait_until([this] { return tunnel->get_status().is_connected(); }));
    ASSERT_TRUE(wait_until([this] {
        engine->tick();
        return all_status(TransferStatus::DOWNLOADING);
    }));
    EXPECT_EQ(tunnel_backend->bring_ups(), 3);
    tunnel->stop();
}

TEST_F(KillSwitchIntegrationTest, LaggingCoordinatorResyncs) {
    bus = std::make_shared<events::EventBus>(1);
    build();
    ASSERT_TRUE(kill_switch->start());
    auto initial = kill_switch->resync_count();

    for (int i = 0; i < 20000; ++i) {
        bus->publish(events::TunnelStatsUpdate{static_cast<uint64_t>(i), 0, std::nullopt});
    }

    EXPECT_TRUE(wait_until([&] { return kill_switch->resync_count() > initial; }));
    EXPECT_TRUE(engine->is_held());
}

TEST_F(KillSwitchIntegrationTest, StoppedCoordinatorNoLongerPauses) {
    build();
    ASSERT_TRUE(kill_switch->start());
    ASSERT_TRUE(tunnel->connect().success());
    ASSERT_TRUE(wait_until([this] { return !engine->is_held(); }));
    auto id = add_downloading('b');

    kill_switch->stop();
    EXPECT_FALSE(kill_switch->is_running());

    ASSERT_TRUE(tunnel->disconnect().success());
    EXPECT_EQ(engine->get(id)->status, TransferStatus::DOWNLOADING);
}
