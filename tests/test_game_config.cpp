#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "server/game_config.hpp"
#include <filesystem>
#include <fstream>

using Catch::Approx;
using namespace racesync::protocol;
using namespace racesync::server;

TEST_CASE("GameConfig loads the shipped data directory") {
    GameConfig config;
    REQUIRE(config.load(RACESYNC_TEST_DATA_DIR));

    REQUIRE(config.server().tick_rate == Approx(60.0f));
    REQUIRE(config.server().broadcast_rate == Approx(20.0f));
    REQUIRE(config.server().max_players_per_room == 8);
    REQUIRE(config.server().protocol_version == PROTOCOL_VERSION);

    REQUIRE(config.network().number_precision == 3);
    DeltaThresholds thresholds = config.network().delta_thresholds();
    REQUIRE(thresholds.max_ratio == Approx(0.6));
    REQUIRE(thresholds.min_changes == 64u);

    REQUIRE(config.gameplay().item_pickup_radius == Approx(2.5));
    REQUIRE(config.gameplay().radio_station_count == 5);

    REQUIRE(config.track().id == "oval-1");
    REQUIRE(config.track().seed == 1337u);
    REQUIRE(config.track().centerline.size() == 24);
    REQUIRE(config.item_spawns().size() == 6);
    REQUIRE(config.item_spawns()[0].type == ItemType::Nitro);
    REQUIRE(config.item_spawns()[1].type == ItemType::Shoot);
}

TEST_CASE("GameConfig keeps defaults for missing files and keys") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "racesync_config_test";
    fs::create_directories(dir);
    {
        std::ofstream server(dir / "server.json");
        server << R"({"tick_rate": 30, "server_version": "9.9.9"})";
        std::ofstream network(dir / "network.json");
        network << "{ broken";
    }

    GameConfig config;
    REQUIRE_FALSE(config.load(dir.string()));
    REQUIRE(config.server().tick_rate == Approx(30.0f));
    REQUIRE(config.server().broadcast_rate == Approx(20.0f));
    REQUIRE(config.server().server_version == "9.9.9");
    REQUIRE(config.network().spatial_hash_cell_size == Approx(10.0));
    REQUIRE(config.track().centerline.empty());
    REQUIRE(config.item_spawns().empty());

    fs::remove_all(dir);
}

TEST_CASE("GameConfig clamps negative delta change counts") {
    GameConfig config;
    config.mutable_network().delta_min_changes = -5;
    REQUIRE(config.network().delta_thresholds().min_changes == 0u);
}
