/// @file test_config.cpp
/// @brief Tests for engine configuration overlays and logger setup

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "config/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace tapeboard;
using nlohmann::json;

TEST_CASE("Defaults match the engine defaults", "[config]") {
    EngineConfig config;
    CHECK(config.placement.iterations == 500);
    CHECK(config.placement.cooling_rate == Catch::Approx(0.95));
    CHECK(config.router.route_width == Catch::Approx(5.0));
    CHECK(config.router.grid_pitch == Catch::Approx(2.5));
    CHECK(config.log_level == "info");
}

TEST_CASE("Present keys override, absent keys keep defaults", "[config]") {
    EngineConfig config;
    apply_config(json::parse(R"({
        "placement": {"iterations": 50, "seed": 7, "unknownKnob": true},
        "router": {"routeWidth": 3.5, "maxAstarIterations": 2000},
        "logLevel": "debug",
        "comment": "ignored"
    })"),
                 config);

    CHECK(config.placement.iterations == 50);
    CHECK(config.placement.seed == 7);
    CHECK(config.placement.initial_temperature == Catch::Approx(100.0));
    CHECK(config.router.route_width == Catch::Approx(3.5));
    CHECK(config.router.max_astar_iterations == 2000);
    CHECK(config.router.route_spacing == Catch::Approx(3.0));
    CHECK(config.log_level == "debug");
}

TEST_CASE("Wrongly typed config values are rejected", "[config]") {
    EngineConfig config;
    CHECK_THROWS_AS(apply_config(json::parse(R"({"placement": {"coolingRate": "slow"}})"), config),
                    std::runtime_error);
    CHECK_THROWS_AS(apply_config(json::parse(R"({"router": 5})"), config), std::runtime_error);
    CHECK_THROWS_AS(apply_config(json::array(), config), std::runtime_error);
}

TEST_CASE("Config file errors name the file", "[config]") {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "tapeboard_bad_config.json";
    std::ofstream(path) << R"({"router": {"gridPitch": [2.5]}})";

    try {
        (void)load_engine_config(path.string());
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find(path.string()) != std::string::npos);
        CHECK(std::string(e.what()).find("gridPitch") != std::string::npos);
    }
    std::filesystem::remove(path);

    CHECK_THROWS_AS(load_engine_config(path.string()), std::runtime_error);
}

TEST_CASE("Log levels are validated", "[config]") {
    CHECK_NOTHROW(configure_logging("off"));
    CHECK(spdlog::get_level() == spdlog::level::off);
    CHECK_NOTHROW(configure_logging("debug"));
    CHECK(spdlog::get_level() == spdlog::level::debug);
    CHECK_THROWS_AS(configure_logging("chatty"), std::invalid_argument);

    configure_logging("warn");
}
