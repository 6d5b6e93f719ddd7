/// @file main.cpp
/// @brief tapeboard command-line entry point
///
/// Subcommands:
///   place  generate ranked arrangements for an assembly on a project's board
///   route  route one arrangement and write the routed project
///   check  run design-rule checks on a project
///   run    place, route the best arrangement, then check it

#include "assembly/connection_inference.hpp"
#include "config/engine_config.hpp"
#include "drc/drc_engine.hpp"
#include "io/project_json.hpp"
#include "placement/placement_engine.hpp"
#include "routing/auto_router.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int EXIT_DRC_ERRORS = 2;
constexpr const char* DEFAULT_ARRANGEMENTS_FILE = "arrangements.json";
constexpr const char* DEFAULT_ROUTED_FILE = "routed.json";

using namespace tapeboard;

struct CliArgs {
    std::string command;
    std::string project;
    std::string assembly;
    std::string connections;
    std::string arrangements;
    std::string rules;
    std::string out;
    int pick = 0;
    EngineConfig config;
};

std::string option_or(const cxxopts::ParseResult& result, const char* key,
                      const std::string& fallback = {}) {
    return result.count(key) ? result[key].as<std::string>() : fallback;
}

void require(const std::string& value, const char* flag, const std::string& command) {
    if (value.empty()) {
        throw std::invalid_argument(command + " requires --" + flag);
    }
}

/// Component ids in expanded request order, for connection files that use componentIndex
std::vector<std::string> instance_ids(const std::vector<ComponentInstance>& instances) {
    std::vector<std::string> ids;
    ids.reserve(instances.size());
    for (const ComponentInstance& instance : instances) {
        ids.push_back(instance.id);
    }
    return ids;
}

std::vector<ComponentInstance> instances_of(const std::vector<Component>& components) {
    std::vector<ComponentInstance> instances;
    instances.reserve(components.size());
    for (const Component& c : components) {
        ComponentInstance instance;
        instance.id = c.id;
        instance.type = c.type;
        instances.push_back(std::move(instance));
    }
    return instances;
}

/// Connections from `args.connections` when given, otherwise auto-detected
std::vector<Connection> gather_connections(const CliArgs& args,
                                           const std::vector<ComponentInstance>& instances) {
    if (!args.connections.empty()) {
        return load_connections(args.connections, instance_ids(instances));
    }
    DetectionResult detected = auto_detect_connections(instances);
    spdlog::info("[assembly] auto-detected {} power, {} ground, {} signal connection(s)",
                 detected.stats.power, detected.stats.ground, detected.stats.signal);
    for (const std::string& type : detected.stats.unknown_types) {
        spdlog::warn("[assembly] no pinout for '{}', its pins were not connected", type);
    }
    return detected.connections;
}

ArrangementSet place(const CliArgs& args, const Project& project) {
    std::vector<ComponentInstance> instances = expand_components(load_assembly(args.assembly));
    ArrangementSet set;
    set.seed = args.config.placement.seed;
    set.connections = gather_connections(args, instances);
    set.arrangements = generate_placements(instances, project.board, set.connections,
                                           args.config.placement);
    if (!set.arrangements.empty()) {
        spdlog::info("[place] best arrangement: {} ({})", set.arrangements.front().name,
                     set.arrangements.front().score);
    }
    return set;
}

Project route(const CliArgs& args, Project project, const ArrangementSet& set) {
    if (set.arrangements.empty()) {
        throw std::runtime_error("no arrangements to route");
    }
    if (args.pick < 0 || args.pick >= static_cast<int>(set.arrangements.size())) {
        throw std::out_of_range("--pick " + std::to_string(args.pick) + " out of range (" +
                                std::to_string(set.arrangements.size()) + " arrangements)");
    }
    const Arrangement& chosen = set.arrangements[static_cast<size_t>(args.pick)];

    std::vector<Connection> connections = set.connections;
    if (!args.connections.empty()) {
        connections = gather_connections(args, instances_of(chosen.components));
    }

    Arrangement routed = route_arrangement(chosen, connections, project.board, args.config.router);
    if (routed.unresolved_conflicts > 0) {
        spdlog::warn("[route] {} crossing pair(s) left after conflict resolution",
                     routed.unresolved_conflicts);
    }
    project.components = std::move(routed.components);
    project.routes = std::move(routed.routes);
    return project;
}

/// Runs DRC, prints or writes the violations and returns the exit status
int check(const CliArgs& args, Project project) {
    if (!args.rules.empty()) {
        project.rules = load_rules(args.rules);
    }
    std::vector<Violation> violations = run_drc(project);
    if (!args.out.empty() && args.command == "check") {
        save_violations(args.out, violations);
    } else {
        for (const Violation& v : violations) {
            std::cout << severity_name(v.severity) << " [" << violation_type_name(v.type) << "] "
                      << v.message << " at (" << v.position.x << ", " << v.position.y << ")\n";
        }
    }
    DrcSummary summary = summarize(violations);
    std::cout << summary.errors << " error(s), " << summary.warnings << " warning(s)\n";
    return summary.has_errors() ? EXIT_DRC_ERRORS : 0;
}

int dispatch(const CliArgs& args) {
    const std::string& command = args.command;
    require(args.project, "project", command);
    Project project = load_project(args.project);

    if (command == "place") {
        require(args.assembly, "assembly", command);
        save_arrangements(args.out.empty() ? DEFAULT_ARRANGEMENTS_FILE : args.out,
                          place(args, project));
        return 0;
    }
    if (command == "route") {
        require(args.arrangements, "arrangements", command);
        save_project(args.out.empty() ? DEFAULT_ROUTED_FILE : args.out,
                     route(args, project, load_arrangements(args.arrangements)));
        return 0;
    }
    if (command == "check") {
        return check(args, project);
    }
    if (command == "run") {
        require(args.assembly, "assembly", command);
        CliArgs best = args;
        best.pick = 0;
        best.connections.clear();
        Project routed = route(best, project, place(args, project));
        save_project(args.out.empty() ? DEFAULT_ROUTED_FILE : args.out, routed);
        return check(args, routed);
    }
    throw std::invalid_argument("unknown command '" + command + "' (place, route, check, run)");
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("tapeboard", "Copper-tape board placement, routing and DRC");
    options.positional_help("<place|route|check|run>");
    // clang-format off
    options.add_options()
        ("command", "Subcommand", cxxopts::value<std::string>())
        ("p,project", "Project JSON (board, rules, components)", cxxopts::value<std::string>())
        ("a,assembly", "Assembly request JSON", cxxopts::value<std::string>())
        ("c,connections", "Connection list JSON", cxxopts::value<std::string>())
        ("arrangements", "Arrangements JSON written by place", cxxopts::value<std::string>())
        ("pick", "Arrangement index to route", cxxopts::value<int>()->default_value("0"))
        ("rules", "DRC rules JSON (bare rules or a project)", cxxopts::value<std::string>())
        ("o,out", "Output file", cxxopts::value<std::string>())
        ("config", "Engine config JSON", cxxopts::value<std::string>())
        ("seed", "Placement random seed", cxxopts::value<std::uint32_t>())
        ("iterations", "Annealing iterations per strategy", cxxopts::value<int>())
        ("log-level", "trace, debug, info, warn, error, critical or off",
         cxxopts::value<std::string>())
        ("h,help", "Print usage");
    // clang-format on
    options.parse_positional({"command"});

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << '\n';
            return result.count("help") ? 0 : 1;
        }

        CliArgs args;
        args.command = result["command"].as<std::string>();
        args.project = option_or(result, "project");
        args.assembly = option_or(result, "assembly");
        args.connections = option_or(result, "connections");
        args.arrangements = option_or(result, "arrangements");
        args.rules = option_or(result, "rules");
        args.out = option_or(result, "out");
        args.pick = result["pick"].as<int>();

        if (result.count("config")) {
            args.config = load_engine_config(result["config"].as<std::string>());
        }
        if (result.count("seed")) {
            args.config.placement.seed = result["seed"].as<std::uint32_t>();
        }
        if (result.count("iterations")) {
            args.config.placement.iterations = result["iterations"].as<int>();
        }
        if (result.count("log-level")) {
            args.config.log_level = result["log-level"].as<std::string>();
        }
        configure_logging(args.config.log_level);

        return dispatch(args);
    } catch (const cxxopts::exceptions::exception& e) {
        spdlog::error("{}", e.what());
        std::cerr << options.help() << '\n';
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
