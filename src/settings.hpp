#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mirror {

enum class log_level {
    debug,
    info,
    warn,
    error
};

struct settings {
    // Inputs, relative to the working directory by default
    std::string topology_path = "test-1.json";
    std::string thresholds_path = "test-2.yaml";

    // Output tree
    std::string output_dir = "monitoring_structure";
    std::string config_filename = "config.yaml";

    // Cycle guard for the container walk
    std::size_t max_depth = 64;

    // Operational
    log_level level = log_level::info;
    bool dry_run = false;
};

// Parse settings from a YAML file; keys missing from the file keep their
// defaults. Throws mirror::error (input_read, parse or settings).
settings load_settings(const std::string& path);

// Reject values the run cannot work with. Throws mirror::error (settings).
void validate_settings(const settings& s);

// Parse log_level from string. Returns nullopt if invalid.
std::optional<log_level> parse_log_level(const std::string& s);

} // namespace mirror
