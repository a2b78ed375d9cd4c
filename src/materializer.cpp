#include "materializer.hpp"
#include "errors.hpp"
#include "sanitize.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace mirror {

alert_config derive_config(const alert_config& global, const container& c) {
    alert_config derived;
    derived.source.defaults = global.source.defaults;
    derived.source.scope.name = global.source.scope.name;
    derived.source.scope.id = global.source.scope.id;
    derived.source.scope.ignore = global.source.scope.ignore;
    derived.source.scope.whitelist = global.source.scope.whitelist;

    const auto& thresholds = global.source.scope.metric_thresholds;
    std::set<std::pair<std::string, std::string>> seen;

    for (const auto& g : c.graphs) {
        for (const auto& meta : g.graph_metadata) {
            for (const auto& t : thresholds) {
                if (t.entity_id != meta.entity_id || t.metric_id != meta.metric_id) continue;

                // Later thresholds for an already-seen key are dropped
                if (seen.emplace(t.entity_id, t.metric_id).second) {
                    derived.source.scope.metric_thresholds.push_back(t);
                }
            }
        }
    }
    return derived;
}

materializer::materializer(output_sink& sink, materialize_options opts,
                           std::shared_ptr<spdlog::logger> log)
    : m_sink(sink), m_opts(std::move(opts)), m_log(std::move(log))
{}

materialize_summary materializer::materialize(const std::filesystem::path& root,
                                              const std::vector<container>& containers,
                                              const alert_config& global) {
    materialize_summary summary;
    walk(root, containers, global, 1, summary);
    return summary;
}

void materializer::walk(const std::filesystem::path& root,
                        const std::vector<container>& containers,
                        const alert_config& global,
                        std::size_t depth,
                        materialize_summary& summary) {
    for (const auto& c : containers) {
        auto segment = sanitize_name(c.container_name);
        auto path = root / segment;

        // These would resolve to the parent (or grandparent) directory
        if (segment.empty() || segment == "." || segment == "..") {
            throw error(error_kind::directory_creation, path.string(),
                        "error creating directory for container '" + c.container_name +
                        "' under " + root.string() + ": name does not form a path segment");
        }

        if (depth > m_opts.max_depth) {
            throw error(error_kind::depth_limit, path.string(),
                        "container '" + c.container_name + "' at " + path.string() +
                        " is nested deeper than " + std::to_string(m_opts.max_depth) +
                        " levels (cyclic topology?)");
        }

        m_sink.create_directories(path);

        auto scoped = derive_config(global, c);

        auto file = path / m_opts.config_filename;
        std::string text;
        try {
            text = emit_alert_config(scoped);
        } catch (const error& e) {
            throw error(error_kind::serialization, file.string(),
                        "error marshaling config for '" + c.container_name + "': " + e.what());
        }
        m_sink.write_file(file, text);

        summary.containers++;
        summary.thresholds += scoped.source.scope.metric_thresholds.size();
        summary.deepest = std::max(summary.deepest, depth);
        m_log->debug("{}: {} threshold(s) -> {}", c.container_name,
                     scoped.source.scope.metric_thresholds.size(), file.string());

        for (const auto& g : c.graphs) {
            for (const auto& meta : g.graph_metadata) {
                if (!meta.layout.containers.empty()) {
                    walk(path, meta.layout.containers, global, depth + 1, summary);
                }
            }
        }
    }
}

} // namespace mirror
