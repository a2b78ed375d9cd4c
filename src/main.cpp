#include "alert_config.hpp"
#include "errors.hpp"
#include "materializer.hpp"
#include "output_sink.hpp"
#include "settings.hpp"
#include "topology.hpp"
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <memory>

namespace {

int run(const cxxopts::Options& options, const cxxopts::ParseResult& result);

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("monitoring_mirror",
        "Mirror a monitoring topology into per-container alert configs");

    options.add_options()
        ("s,settings", "Path to YAML settings file", cxxopts::value<std::string>())
        ("t,topology", "Topology JSON document (overrides settings)", cxxopts::value<std::string>())
        ("c,thresholds", "Global threshold YAML document (overrides settings)", cxxopts::value<std::string>())
        ("o,output", "Output base directory (overrides settings)", cxxopts::value<std::string>())
        ("config-name", "File name written in each container directory", cxxopts::value<std::string>())
        ("max-depth", "Maximum container nesting depth", cxxopts::value<std::size_t>())
        ("n,dry-run", "Log what would be written without touching the filesystem")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    try {
        auto result = options.parse(argc, argv);
        return run(options, result);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }
}

namespace {

int run(const cxxopts::Options& options, const cxxopts::ParseResult& result) {
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("mirror");

    // Load settings
    mirror::settings cfg;
    try {
        if (result.count("settings")) {
            cfg = mirror::load_settings(result["settings"].as<std::string>());
        }

        // CLI overrides
        if (result.count("topology"))    cfg.topology_path = result["topology"].as<std::string>();
        if (result.count("thresholds"))  cfg.thresholds_path = result["thresholds"].as<std::string>();
        if (result.count("output"))      cfg.output_dir = result["output"].as<std::string>();
        if (result.count("config-name")) cfg.config_filename = result["config-name"].as<std::string>();
        if (result.count("max-depth"))   cfg.max_depth = result["max-depth"].as<std::size_t>();
        if (result.count("dry-run"))     cfg.dry_run = true;
        if (result.count("verbose"))     cfg.level = mirror::log_level::debug;

        mirror::validate_settings(cfg);
    } catch (const std::exception& e) {
        console->error("Failed to load settings: {}", e.what());
        return 1;
    }

    // Set log level
    switch (cfg.level) {
        case mirror::log_level::debug: spdlog::set_level(spdlog::level::debug); break;
        case mirror::log_level::info:  spdlog::set_level(spdlog::level::info); break;
        case mirror::log_level::warn:  spdlog::set_level(spdlog::level::warn); break;
        case mirror::log_level::error: spdlog::set_level(spdlog::level::err); break;
    }

    console->info("monitoring_mirror starting");
    console->info("  topology:   {}", cfg.topology_path);
    console->info("  thresholds: {}", cfg.thresholds_path);
    console->info("  output:     {}/<container>/{}", cfg.output_dir, cfg.config_filename);
    if (cfg.dry_run) console->info("  dry run: nothing will be written");

    try {
        auto topology = mirror::load_topology(cfg.topology_path);
        if (topology.status != 0 && topology.status != 200) {
            console->warn("Topology document reports status {} ('{}')",
                          topology.status, topology.message);
        }
        console->debug("Topology: {} container(s) in total",
                       mirror::count_containers(topology.containers));

        auto global = mirror::load_alert_config(cfg.thresholds_path);
        console->debug("Global config: {} metric threshold(s)",
                       global.source.scope.metric_thresholds.size());

        std::unique_ptr<mirror::output_sink> sink;
        if (cfg.dry_run) {
            sink = std::make_unique<mirror::dry_run_sink>(console);
        } else {
            sink = std::make_unique<mirror::filesystem_sink>(console);
        }

        mirror::materialize_options opts;
        opts.config_filename = cfg.config_filename;
        opts.max_depth = cfg.max_depth;

        std::filesystem::path base(cfg.output_dir);
        sink->create_directories(base);

        mirror::materializer engine(*sink, opts, console);
        auto summary = engine.materialize(base, topology.containers, global);

        console->info("Folder structure and YAML files created successfully!");
        console->info("summary: containers={} thresholds={} depth={}",
                      summary.containers, summary.thresholds, summary.deepest);
    } catch (const mirror::error& e) {
        console->error("{}: {}", mirror::to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        console->error("Error: {}", e.what());
        return 1;
    }

    return 0;
}

} // namespace
