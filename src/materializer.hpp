#pragma once

#include "alert_config.hpp"
#include "output_sink.hpp"
#include "topology.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mirror {

struct materialize_options {
    // File written inside every container directory
    std::string config_filename = "config.yaml";

    // Nesting deeper than this is treated as a cyclic topology and rejected
    std::size_t max_depth = 64;
};

struct materialize_summary {
    std::size_t containers = 0;
    std::size_t thresholds = 0;
    std::size_t deepest = 0;
};

// Build the configuration for one container: the global defaults and entity
// fields copied as-is, plus the global thresholds whose (entity_id, metric_id)
// matches a graph metric directly under `c`. One threshold per key; the first
// match wins and results keep first-match order.
alert_config derive_config(const alert_config& global, const container& c);

// Mirrors a container tree onto an output_sink, one directory and one
// derived config file per container, depth-first pre-order.
// Stops at the first failure; already written nodes are left in place.
class materializer {
public:
    materializer(output_sink& sink, materialize_options opts,
                 std::shared_ptr<spdlog::logger> log);

    // Throws mirror::error (directory_creation, serialization, write, depth_limit).
    // A name that sanitizes to "", "." or ".." is a directory_creation error.
    materialize_summary materialize(const std::filesystem::path& root,
                                    const std::vector<container>& containers,
                                    const alert_config& global);

private:
    void walk(const std::filesystem::path& root,
              const std::vector<container>& containers,
              const alert_config& global,
              std::size_t depth,
              materialize_summary& summary);

    output_sink& m_sink;
    materialize_options m_opts;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace mirror
