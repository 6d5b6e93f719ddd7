/// @file test_project_json.cpp
/// @brief Tests for JSON encoding and the file helpers

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "io/project_json.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace tapeboard;
using nlohmann::json;

namespace {

/// Scratch directory removed when the test ends
class ScratchDir {
  public:
    explicit ScratchDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("tapeboard_" + name)) {
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }

    [[nodiscard]] std::string write(const std::string& name, const std::string& text) const {
        std::string p = file(name);
        std::ofstream(p) << text;
        return p;
    }

  private:
    std::filesystem::path path_;
};

bool message_mentions(const std::runtime_error& e, const std::string& text) {
    return std::string(e.what()).find(text) != std::string::npos;
}

} // namespace

TEST_CASE("Points encode as two-element arrays", "[json]") {
    json j = Vec2{1.5, -2.0};
    CHECK(j == json::array({1.5, -2.0}));
    CHECK(json::array({3.0, 4.0}).get<Vec2>() == Vec2{3.0, 4.0});
    CHECK_THROWS_AS(json::array({1.0}).get<Vec2>(), std::invalid_argument);
}

TEST_CASE("Pads only carry the size fields they use", "[json]") {
    Pad pad{"p0", {1.0, 2.0}, 1.5};
    json j = pad;
    CHECK(j.at("dia") == 1.5);
    CHECK_FALSE(j.contains("width"));
    CHECK_FALSE(j.contains("height"));
}

TEST_CASE("Projects survive a save and load", "[json]") {
    ScratchDir dir("project");
    Project project;
    project.name = "Synth panel";
    project.board.features.push_back({{5.0, 5.0}, 3.2});
    Component pot;
    pot.id = "pot_9mm_0";
    pot.type = "pot_9mm";
    pot.pos = {40.0, 30.0};
    pot.rotation = 90.0;
    pot.pads.push_back({"pot_9mm_0_pad0", {0.0, 0.0}, 1.5});
    pot.holes.push_back({{2.5, 5.0}, 1.0});
    project.components.push_back(pot);
    Route route;
    route.net = "VCC";
    route.connection_id = "auto_vcc_1";
    route.layer = Layer::BOTTOM;
    route.profile = ChannelProfile::V;
    route.polyline = {{10.0, 10.0}, {40.0, 10.0}};
    project.routes.push_back(route);
    project.vias.push_back({{40.0, 10.0}, 2.5, 0.3});
    project.rules.min_spacing = 2.5;

    save_project(dir.file("project.json"), project);
    Project loaded = load_project(dir.file("project.json"));

    CHECK(loaded.name == "Synth panel");
    CHECK(loaded.board.boundary.size() == 4);
    REQUIRE(loaded.board.features.size() == 1);
    CHECK(loaded.board.features[0].dia == Catch::Approx(3.2));
    REQUIRE(loaded.components.size() == 1);
    CHECK(loaded.components[0].rotation == Catch::Approx(90.0));
    CHECK(loaded.components[0].pads[0].dia == Catch::Approx(1.5));
    CHECK(loaded.components[0].holes[0].pos == Vec2{2.5, 5.0});
    REQUIRE(loaded.routes.size() == 1);
    CHECK(loaded.routes[0].connection_id == "auto_vcc_1");
    CHECK(loaded.routes[0].layer == Layer::BOTTOM);
    CHECK(loaded.routes[0].profile == ChannelProfile::V);
    CHECK(loaded.vias[0].chamfer == Catch::Approx(0.3));
    CHECK(loaded.rules.min_spacing == Catch::Approx(2.5));
    CHECK(loaded.rules.min_wall == Catch::Approx(0.8));
}

TEST_CASE("Missing project fields take defaults", "[json]") {
    Project p = json{{"name", "Bare"}}.get<Project>();
    CHECK(p.name == "Bare");
    CHECK(p.board.bounds().width() == Catch::Approx(100.0));
    CHECK(p.board.bounds().height() == Catch::Approx(60.0));
    CHECK(p.components.empty());
    CHECK(p.rules.min_bend_radius == Catch::Approx(2.0));
}

TEST_CASE("Assembly requests decode roles and locks", "[json]") {
    json j = json::parse(R"({
        "type": "jack_trs_35mm", "quantity": 2, "role": "connector",
        "constraint": {"locked": true, "lockedPos": [10, 20], "lockedRotation": 180}
    })");
    AssemblyComponent request = j.get<AssemblyComponent>();
    CHECK(request.quantity == 2);
    REQUIRE(request.role);
    CHECK(*request.role == ComponentRole::CONNECTOR);
    REQUIRE(request.constraint);
    CHECK(request.constraint->locked);
    CHECK(request.constraint->locked_pos == Vec2{10.0, 20.0});
    CHECK(request.constraint->locked_rotation == Catch::Approx(180.0));

    CHECK_THROWS_AS((json{{"type", "x"}, {"role", "bogus"}}.get<AssemblyComponent>()),
                    std::invalid_argument);
}

TEST_CASE("Connection endpoints resolve ids or indices", "[json]") {
    json j = json::parse(R"([
        {"id": "c1", "from": {"component": "pot_9mm_0", "padIndex": 1},
                     "to": {"componentIndex": 1, "padIndex": 18}, "netName": "Wiper_A0"},
        {"id": "c2", "from": {"componentIndex": 7, "padIndex": 0},
                     "to": {"componentIndex": 0, "padIndex": 2}, "isGround": true}
    ])");
    auto connections = connections_from_json(j, {"pot_9mm_0", "mcu_arduino_nano_0"});
    REQUIRE(connections.size() == 2);
    CHECK(connections[0].from.component_id == "pot_9mm_0");
    CHECK(connections[0].to.component_id == "mcu_arduino_nano_0");
    CHECK(connections[0].to.pad_index == 18);
    CHECK(connections[0].net_name == "Wiper_A0");
    CHECK(connections[1].from.component_id.empty());
    CHECK(connections[1].is_ground);

    CHECK_THROWS_AS(connections_from_json(json::object(), {}), std::invalid_argument);
}

TEST_CASE("Arrangement sets keep seed, metrics and connections", "[json]") {
    ScratchDir dir("arrangements");
    ArrangementSet set;
    set.seed = 99;
    Arrangement a;
    a.id = "arr_grid";
    a.name = "Grid";
    a.score = 71;
    a.metrics.route_crossings = 2;
    a.metrics.symmetry_score = 0.45;
    a.skipped.push_back({"c9", "unknown component 'x'"});
    set.arrangements.push_back(a);
    set.connections.push_back({"c1", {"a", 0}, {"b", 1}, "VCC", true});

    save_arrangements(dir.file("arr.json"), set);
    ArrangementSet loaded = load_arrangements(dir.file("arr.json"));
    CHECK(loaded.seed == 99);
    REQUIRE(loaded.arrangements.size() == 1);
    CHECK(loaded.arrangements[0].score == 71);
    CHECK(loaded.arrangements[0].metrics.route_crossings == 2);
    CHECK(loaded.arrangements[0].metrics.symmetry_score == Catch::Approx(0.45));
    REQUIRE(loaded.arrangements[0].skipped.size() == 1);
    CHECK(loaded.arrangements[0].skipped[0].connection_id == "c9");
    REQUIRE(loaded.connections.size() == 1);
    CHECK(loaded.connections[0].to.component_id == "b");
    CHECK(loaded.connections[0].is_power);
}

TEST_CASE("Rules load from a bare object or a project", "[json]") {
    ScratchDir dir("rules");
    CHECK(load_rules(dir.write("bare.json", R"({"minWall": 1.2})")).min_wall == Catch::Approx(1.2));
    CHECK(load_rules(dir.write("proj.json", R"({"rules": {"minSpacing": 4}})")).min_spacing ==
          Catch::Approx(4.0));
}

TEST_CASE("Violations are written as a report", "[json]") {
    ScratchDir dir("violations");
    save_violations(dir.file("drc.json"),
                    {{ViolationType::OVERHANG, "Route extends beyond board boundary", {105.0, 10.0},
                      Severity::ERROR}});
    json report = read_json_file(dir.file("drc.json"));
    REQUIRE(report.size() == 1);
    CHECK(report[0].at("type") == "overhang");
    CHECK(report[0].at("severity") == "error");
    CHECK(report[0].at("position") == json::array({105.0, 10.0}));
}

TEST_CASE("File errors name the file", "[json]") {
    ScratchDir dir("errors");

    SECTION("missing file") {
        std::string path = dir.file("absent.json");
        try {
            (void)load_project(path);
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            CHECK(message_mentions(e, path));
        }
    }
    SECTION("malformed JSON") {
        std::string path = dir.write("broken.json", "{ \"name\": ");
        try {
            (void)load_project(path);
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            CHECK(message_mentions(e, path));
        }
    }
    SECTION("wrong document shape") {
        std::string path = dir.write("assembly.json", R"({"type": "pot_9mm"})");
        CHECK_THROWS_AS(load_assembly(path), std::runtime_error);
        std::string bad_point = dir.write("point.json", R"({"components": [
            {"id": "a", "type": "pot_9mm", "pos": [1, 2, 3]}]})");
        CHECK_THROWS_AS(load_project(bad_point), std::runtime_error);
    }
}
