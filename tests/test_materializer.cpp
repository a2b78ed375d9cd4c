#include "materializer.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Records every sink call in order; can be told to fail a directory or a file.
class recording_sink : public mirror::output_sink {
public:
    struct op {
        bool is_dir;
        std::string path;
        std::string contents;
    };

    void create_directories(const std::filesystem::path& dir) override {
        if (dir.generic_string() == fail_dir) {
            throw mirror::error(mirror::error_kind::directory_creation, dir.string(),
                                "error creating directory " + dir.string() + ": permission denied");
        }
        ops.push_back({true, dir.generic_string(), {}});
    }

    void write_file(const std::filesystem::path& file, std::string_view contents) override {
        if (file.generic_string() == fail_file) {
            throw mirror::error(mirror::error_kind::write, file.string(),
                                "error writing file " + file.string() + ": no space left on device");
        }
        ops.push_back({false, file.generic_string(), std::string(contents)});
    }

    bool touched(const std::string& path) const {
        return std::any_of(ops.begin(), ops.end(),
                           [&](const op& o) { return o.path.rfind(path, 0) == 0; });
    }

    mirror::alert_config config_at(const std::string& path) const {
        for (const auto& o : ops) {
            if (!o.is_dir && o.path == path) return mirror::parse_alert_config(o.contents, path);
        }
        throw std::runtime_error("no file written at " + path);
    }

    std::vector<std::string> paths() const {
        std::vector<std::string> out;
        for (const auto& o : ops) out.push_back(o.path);
        return out;
    }

    std::vector<op> ops;
    std::string fail_dir;
    std::string fail_file;
};

mirror::graph_meta meta(const std::string& entity, const std::string& metric,
                        std::vector<mirror::container> children = {}) {
    mirror::graph_meta m;
    m.legend_name = entity + "/" + metric;
    m.entity_id = entity;
    m.metric_id = metric;
    m.layout.containers = std::move(children);
    return m;
}

mirror::container make_container(const std::string& name, std::vector<mirror::graph_meta> metas) {
    mirror::container c;
    c.container_name = name;
    c.parent_entity_id = "parent-of-" + name;
    mirror::graph g;
    g.graph_name = name + "-graph";
    g.graph_metadata = std::move(metas);
    c.graphs.push_back(std::move(g));
    return c;
}

mirror::metric_threshold threshold(const std::string& entity, const std::string& metric,
                                   std::optional<double> min = std::nullopt) {
    mirror::metric_threshold t;
    t.entity_id = entity;
    t.metric_id = metric;
    t.legend_name = entity + "-" + metric;
    t.min = min;
    return t;
}

mirror::alert_config sample_global() {
    mirror::alert_config cfg;
    auto& d = cfg.source.defaults;
    d.email_config_name = "email";
    d.slack_config_name = "slack";
    d.incident_sev_two_config_name = "sev2";
    d.incident_sev_three_config_name = "sev3";
    d.incident_sev_four_config_name = "sev4";
    d.incident = {"SEV3", true};

    auto& e = cfg.source.scope;
    e.name = "svc";
    e.id = "ENT-1";
    e.ignore.entity_ids = {"I1"};
    e.whitelist.entity_ids = {"W1", "W2"};
    e.metric_thresholds = {
        threshold("E1", "M1", 1.0),
        threshold("E2", "M2", 2.0),
        threshold("E3", "M3"),
    };
    return cfg;
}

} // namespace

TEST(derive_config, keeps_first_threshold_per_key) {
    auto global = sample_global();
    global.source.scope.metric_thresholds = {
        threshold("E1", "M1", 0.0),
        threshold("E1", "M1", 5.0),
    };
    auto c = make_container("A", {meta("E1", "M1"), meta("E1", "M1")});

    auto derived = mirror::derive_config(global, c);
    const auto& ts = derived.source.scope.metric_thresholds;
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0].entity_id, "E1");
    ASSERT_TRUE(ts[0].min.has_value());
    EXPECT_EQ(*ts[0].min, 0.0);
}

TEST(derive_config, dedups_across_graphs) {
    auto global = sample_global();
    auto c = make_container("A", {meta("E1", "M1")});
    mirror::graph second;
    second.graph_metadata.push_back(meta("E1", "M1"));
    second.graph_metadata.push_back(meta("E2", "M2"));
    c.graphs.push_back(second);

    auto derived = mirror::derive_config(global, c);
    ASSERT_EQ(derived.source.scope.metric_thresholds.size(), 2u);
}

TEST(derive_config, orders_by_first_match) {
    auto global = sample_global();
    auto c = make_container("A", {meta("E3", "M3"), meta("E1", "M1")});

    auto derived = mirror::derive_config(global, c);
    const auto& ts = derived.source.scope.metric_thresholds;
    ASSERT_EQ(ts.size(), 2u);
    EXPECT_EQ(ts[0].entity_id, "E3");
    EXPECT_EQ(ts[1].entity_id, "E1");
}

TEST(derive_config, requires_both_ids_to_match) {
    auto global = sample_global();
    auto c = make_container("A", {meta("E1", "M2"), meta("E2", "M1")});

    auto derived = mirror::derive_config(global, c);
    EXPECT_TRUE(derived.source.scope.metric_thresholds.empty());
}

TEST(derive_config, keys_do_not_collide_on_separator) {
    auto global = sample_global();
    global.source.scope.metric_thresholds = {
        threshold("a-b", "c"),
        threshold("a", "b-c"),
    };
    auto c = make_container("A", {meta("a-b", "c"), meta("a", "b-c")});

    auto derived = mirror::derive_config(global, c);
    EXPECT_EQ(derived.source.scope.metric_thresholds.size(), 2u);
}

TEST(derive_config, only_looks_one_level_down) {
    auto global = sample_global();
    auto child = make_container("B", {meta("E2", "M2")});
    auto parent = make_container("A", {meta("E1", "M1", {child})});

    auto derived = mirror::derive_config(global, parent);
    ASSERT_EQ(derived.source.scope.metric_thresholds.size(), 1u);
    EXPECT_EQ(derived.source.scope.metric_thresholds[0].entity_id, "E1");
}

TEST(derive_config, copies_pass_through_fields) {
    auto global = sample_global();
    auto derived = mirror::derive_config(global, make_container("A", {}));

    EXPECT_EQ(derived.source.defaults, global.source.defaults);
    EXPECT_EQ(derived.source.scope.name, global.source.scope.name);
    EXPECT_EQ(derived.source.scope.id, global.source.scope.id);
    EXPECT_EQ(derived.source.scope.ignore, global.source.scope.ignore);
    EXPECT_EQ(derived.source.scope.whitelist, global.source.scope.whitelist);
    EXPECT_TRUE(derived.source.scope.metric_thresholds.empty());
}

TEST(derive_config, result_does_not_alias_global) {
    auto global = sample_global();
    auto derived = mirror::derive_config(global, make_container("A", {meta("E1", "M1")}));

    derived.source.scope.metric_thresholds[0].min = 99.0;
    derived.source.scope.whitelist.entity_ids.clear();

    EXPECT_EQ(global.source.scope.metric_thresholds[0].min, 1.0);
    EXPECT_EQ(global.source.scope.whitelist.entity_ids.size(), 2u);
}

TEST(materializer, mirrors_nested_containers) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    auto b = make_container("B", {meta("E2", "M2")});
    auto a = make_container("A", {meta("E1", "M1", {b})});

    auto summary = engine.materialize("base", {a}, sample_global());

    std::vector<std::string> expected = {
        "base/A", "base/A/config.yaml", "base/A/B", "base/A/B/config.yaml",
    };
    EXPECT_EQ(sink.paths(), expected);
    EXPECT_EQ(summary.containers, 2u);
    EXPECT_EQ(summary.thresholds, 2u);
    EXPECT_EQ(summary.deepest, 2u);
}

TEST(materializer, visits_siblings_in_order_depth_first) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    auto a1 = make_container("A1", {});
    auto a = make_container("A", {meta("E1", "M1", {a1})});
    auto b = make_container("B", {});

    engine.materialize("out", {a, b}, sample_global());

    std::vector<std::string> expected = {
        "out/A", "out/A/config.yaml",
        "out/A/A1", "out/A/A1/config.yaml",
        "out/B", "out/B/config.yaml",
    };
    EXPECT_EQ(sink.paths(), expected);
}

TEST(materializer, sanitizes_directory_names) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    engine.materialize("out", {make_container("CPU: host/1 <prod>", {})}, sample_global());

    ASSERT_FALSE(sink.ops.empty());
    EXPECT_EQ(sink.ops[0].path, "out/CPU_ host_1 _prod_");
}

TEST(materializer, scopes_thresholds_per_container) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    auto b = make_container("B", {meta("E2", "M2")});
    auto a = make_container("A", {meta("E1", "M1", {b})});
    engine.materialize("base", {a}, sample_global());

    auto at_a = sink.config_at("base/A/config.yaml").source.scope.metric_thresholds;
    auto at_b = sink.config_at("base/A/B/config.yaml").source.scope.metric_thresholds;

    ASSERT_EQ(at_a.size(), 1u);
    EXPECT_EQ(at_a[0].entity_id, "E1");
    ASSERT_EQ(at_b.size(), 1u);
    EXPECT_EQ(at_b[0].entity_id, "E2");
}

TEST(materializer, every_config_carries_global_pass_through) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());
    auto global = sample_global();

    auto c = make_container("C", {meta("E3", "M3")});
    auto b = make_container("B", {meta("E2", "M2", {c})});
    auto a = make_container("A", {meta("E1", "M1", {b})});
    engine.materialize("base", {a}, global);

    for (const auto& path : {"base/A/config.yaml", "base/A/B/config.yaml", "base/A/B/C/config.yaml"}) {
        auto cfg = sink.config_at(path);
        EXPECT_EQ(cfg.source.defaults, global.source.defaults) << path;
        EXPECT_EQ(cfg.source.scope.name, global.source.scope.name) << path;
        EXPECT_EQ(cfg.source.scope.id, global.source.scope.id) << path;
        EXPECT_EQ(cfg.source.scope.ignore, global.source.scope.ignore) << path;
        EXPECT_EQ(cfg.source.scope.whitelist, global.source.scope.whitelist) << path;
    }
}

TEST(materializer, leaves_inputs_untouched) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    auto global = sample_global();
    auto before = global;
    auto b = make_container("B", {meta("E2", "M2")});
    std::vector<mirror::container> tree = {make_container("A", {meta("E1", "M1", {b})})};

    engine.materialize("base", tree, global);

    EXPECT_EQ(global, before);
    EXPECT_EQ(tree[0].graphs[0].graph_metadata[0].layout.containers.size(), 1u);
}

TEST(materializer, stops_at_first_directory_failure) {
    recording_sink sink;
    sink.fail_dir = "base/X/C";
    mirror::materializer engine(sink, {}, make_log());

    auto d = make_container("D", {});
    auto c1 = make_container("C1", {});
    auto c = make_container("C", {meta("E1", "M1", {d})});
    auto c3 = make_container("C3", {});
    auto x = make_container("X", {meta("E1", "M1", {c1, c, c3})});
    auto y = make_container("Y", {});

    try {
        engine.materialize("base", {x, y}, sample_global());
        FAIL() << "expected mirror::error";
    } catch (const mirror::error& e) {
        EXPECT_EQ(e.kind(), mirror::error_kind::directory_creation);
        EXPECT_NE(std::string(e.what()).find("base"), std::string::npos);
    }

    EXPECT_TRUE(sink.touched("base/X/C1"));
    EXPECT_FALSE(sink.touched("base/X/C/"));
    EXPECT_FALSE(sink.touched("base/X/C3"));
    EXPECT_FALSE(sink.touched("base/Y"));
}

TEST(materializer, stops_at_first_write_failure) {
    recording_sink sink;
    sink.fail_file = "base/X/C/config.yaml";
    mirror::materializer engine(sink, {}, make_log());

    auto d = make_container("D", {});
    auto c1 = make_container("C1", {});
    auto c = make_container("C", {meta("E1", "M1", {d})});
    auto c3 = make_container("C3", {});
    auto x = make_container("X", {meta("E1", "M1", {c1, c, c3})});
    auto y = make_container("Y", {});

    try {
        engine.materialize("base", {x, y}, sample_global());
        FAIL() << "expected mirror::error";
    } catch (const mirror::error& e) {
        EXPECT_EQ(e.kind(), mirror::error_kind::write);
        EXPECT_EQ(e.path(), "base/X/C/config.yaml");
    }

    // The directory was created before the write failed; nothing after it was
    EXPECT_TRUE(sink.touched("base/X/C1/config.yaml"));
    auto paths = sink.paths();
    EXPECT_NE(std::find(paths.begin(), paths.end(), "base/X/C"), paths.end());
    EXPECT_FALSE(sink.touched("base/X/C/config.yaml"));
    EXPECT_FALSE(sink.touched("base/X/C/D"));
    EXPECT_FALSE(sink.touched("base/X/C3"));
    EXPECT_FALSE(sink.touched("base/Y"));
}

TEST(materializer, rejects_names_that_escape_their_directory) {
    for (const std::string name : {"..", ".", ""}) {
        recording_sink sink;
        mirror::materializer engine(sink, {}, make_log());

        auto bad = make_container(name, {});
        auto a = make_container("A", {meta("E1", "M1", {bad})});
        auto b = make_container("B", {});

        try {
            engine.materialize("base", {a, b}, sample_global());
            FAIL() << "expected mirror::error for '" << name << "'";
        } catch (const mirror::error& e) {
            EXPECT_EQ(e.kind(), mirror::error_kind::directory_creation) << name;
        }

        std::vector<std::string> expected = {"base/A", "base/A/config.yaml"};
        EXPECT_EQ(sink.paths(), expected) << name;
    }
}

TEST(materializer, dotted_names_are_ordinary_segments) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    engine.materialize("base", {make_container("...", {}), make_container(".hidden", {})},
                       sample_global());

    std::vector<std::string> expected = {
        "base/...", "base/.../config.yaml", "base/.hidden", "base/.hidden/config.yaml",
    };
    EXPECT_EQ(sink.paths(), expected);
}

TEST(materializer, rejects_runaway_nesting) {
    recording_sink sink;
    mirror::materialize_options opts;
    opts.max_depth = 3;
    mirror::materializer engine(sink, opts, make_log());

    auto level = make_container("L5", {});
    for (int i = 4; i >= 1; --i) {
        level = make_container("L" + std::to_string(i), {meta("E1", "M1", {level})});
    }

    try {
        engine.materialize("base", {level}, sample_global());
        FAIL() << "expected mirror::error";
    } catch (const mirror::error& e) {
        EXPECT_EQ(e.kind(), mirror::error_kind::depth_limit);
        EXPECT_EQ(e.path(), "base/L1/L2/L3/L4");
    }

    EXPECT_TRUE(sink.touched("base/L1/L2/L3/config.yaml"));
    EXPECT_FALSE(sink.touched("base/L1/L2/L3/L4"));
}

TEST(materializer, uses_configured_file_name) {
    recording_sink sink;
    mirror::materialize_options opts;
    opts.config_filename = "alerts.yml";
    mirror::materializer engine(sink, opts, make_log());

    engine.materialize("base", {make_container("A", {})}, sample_global());

    ASSERT_EQ(sink.ops.size(), 2u);
    EXPECT_EQ(sink.ops[1].path, "base/A/alerts.yml");
}

TEST(materializer, output_is_deterministic) {
    auto global = sample_global();
    auto b = make_container("B", {meta("E3", "M3"), meta("E2", "M2"), meta("E1", "M1")});
    std::vector<mirror::container> tree = {make_container("A", {meta("E2", "M2", {b})})};

    recording_sink first, second;
    mirror::materializer first_run(first, {}, make_log());
    mirror::materializer second_run(second, {}, make_log());
    first_run.materialize("base", tree, global);
    second_run.materialize("base", tree, global);

    ASSERT_EQ(first.ops.size(), second.ops.size());
    for (std::size_t i = 0; i < first.ops.size(); ++i) {
        EXPECT_EQ(first.ops[i].path, second.ops[i].path);
        EXPECT_EQ(first.ops[i].contents, second.ops[i].contents);
    }
}

TEST(materializer, empty_input_writes_nothing) {
    recording_sink sink;
    mirror::materializer engine(sink, {}, make_log());

    auto summary = engine.materialize("base", {}, sample_global());
    EXPECT_TRUE(sink.ops.empty());
    EXPECT_EQ(summary.containers, 0u);
}
