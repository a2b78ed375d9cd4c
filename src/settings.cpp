#include "settings.hpp"
#include "errors.hpp"
#include "sanitize.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace mirror {

std::optional<log_level> parse_log_level(const std::string& s) {
    if (s == "debug")                  return log_level::debug;
    if (s == "info")                   return log_level::info;
    if (s == "warn" || s == "warning") return log_level::warn;
    if (s == "error" || s == "err")    return log_level::error;
    return std::nullopt;
}

settings load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw error(error_kind::input_read, path, "settings file not found: " + path);
    }

    settings s;
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (root.IsNull()) return s;
        if (!root.IsMap()) {
            throw error(error_kind::parse, path, path + ": settings root must be a mapping");
        }

        // Inputs
        if (auto n = root["topology_path"])   s.topology_path   = n.as<std::string>();
        if (auto n = root["thresholds_path"]) s.thresholds_path = n.as<std::string>();

        // Output
        if (auto n = root["output_dir"])      s.output_dir      = n.as<std::string>();
        if (auto n = root["config_filename"]) s.config_filename = n.as<std::string>();

        if (auto n = root["max_depth"]) s.max_depth = n.as<std::size_t>();

        // Operational
        if (auto n = root["log_level"]) {
            auto level = parse_log_level(n.as<std::string>());
            if (!level) {
                throw error(error_kind::settings, path,
                            "settings: invalid 'log_level': " + n.as<std::string>());
            }
            s.level = *level;
        }
        if (auto n = root["dry_run"]) s.dry_run = n.as<bool>();
    } catch (const YAML::BadFile& e) {
        throw error(error_kind::input_read, path, path + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw error(error_kind::parse, path, path + ": " + e.what());
    }

    validate_settings(s);
    return s;
}

void validate_settings(const settings& s) {
    if (s.topology_path.empty()) {
        throw error(error_kind::settings, {}, "settings: 'topology_path' must not be empty");
    }
    if (s.thresholds_path.empty()) {
        throw error(error_kind::settings, {}, "settings: 'thresholds_path' must not be empty");
    }
    if (s.output_dir.empty()) {
        throw error(error_kind::settings, {}, "settings: 'output_dir' must not be empty");
    }
    if (s.config_filename.empty() || has_reserved_chars(s.config_filename) ||
        s.config_filename == "." || s.config_filename == "..") {
        throw error(error_kind::settings, {},
                    "settings: invalid 'config_filename': '" + s.config_filename + "'");
    }
    if (s.max_depth == 0) {
        throw error(error_kind::settings, {}, "settings: 'max_depth' must be at least 1");
    }
}

} // namespace mirror
