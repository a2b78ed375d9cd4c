#include "alert_config.hpp"
#include "errors.hpp"
#include <yaml-cpp/yaml.h>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace mirror {

namespace {

// Thrown by the readers below; parse_alert_config attaches the source name.
struct shape_error {
    std::string message;
};

YAML::Node child(const YAML::Node& parent, const char* key) {
    if (!parent || parent.IsNull()) return YAML::Node();
    if (!parent.IsMap()) {
        throw shape_error{std::string("expected a mapping containing '") + key + "'"};
    }
    return parent[key];
}

std::string read_string(const YAML::Node& parent, const char* key) {
    auto n = child(parent, key);
    if (!n || n.IsNull()) return {};
    if (!n.IsScalar()) throw shape_error{std::string("'") + key + "' must be a scalar"};
    return n.as<std::string>();
}

bool read_bool(const YAML::Node& parent, const char* key) {
    auto n = child(parent, key);
    if (!n || n.IsNull()) return false;
    return n.as<bool>();
}

std::optional<double> read_optional_double(const YAML::Node& parent, const char* key) {
    auto n = child(parent, key);
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<double>();
}

std::optional<std::string> read_optional_string(const YAML::Node& parent, const char* key) {
    auto n = child(parent, key);
    if (!n || n.IsNull()) return std::nullopt;
    if (!n.IsScalar()) throw shape_error{std::string("'") + key + "' must be a scalar"};
    return n.as<std::string>();
}

YAML::Node read_sequence(const YAML::Node& parent, const char* key) {
    auto n = child(parent, key);
    if (!n || n.IsNull()) return YAML::Node(YAML::NodeType::Sequence);
    if (!n.IsSequence()) throw shape_error{std::string("'") + key + "' must be a list"};
    return n;
}

entity_id_list read_entity_ids(const YAML::Node& parent, const char* key) {
    entity_id_list ids;
    for (const auto& item : read_sequence(child(parent, key), "entityIds")) {
        ids.entity_ids.push_back(item.as<std::string>());
    }
    return ids;
}

metric_threshold read_threshold(const YAML::Node& n) {
    if (!n.IsMap()) throw shape_error{"metricThresholds entries must be mappings"};

    metric_threshold t;
    t.entity_id        = read_string(n, "entityId");
    t.metric_id        = read_string(n, "metricId");
    t.parent_entity_id = read_string(n, "parentEntityId");
    t.container_name   = read_string(n, "containerName");
    t.graph_name       = read_string(n, "graphName");
    t.legend_name      = read_string(n, "legendName");
    t.min              = read_optional_double(n, "min");
    t.max              = read_optional_double(n, "max");
    t.incident         = read_optional_string(n, "incident");
    return t;
}

default_config read_defaults(const YAML::Node& n) {
    default_config d;
    d.email_config_name              = read_string(n, "emailConfigName");
    d.slack_config_name              = read_string(n, "slackConfigName");
    d.incident_sev_two_config_name   = read_string(n, "incidentSevTwoConfigName");
    d.incident_sev_three_config_name = read_string(n, "incidentSevThreeConfigName");
    d.incident_sev_four_config_name  = read_string(n, "incidentSevFourConfigName");

    auto incident = child(n, "incident");
    d.incident.severity = read_string(incident, "severity");
    d.incident.enabled  = read_bool(incident, "enabled");
    return d;
}

entity read_entity(const YAML::Node& n) {
    entity e;
    e.name      = read_string(n, "name");
    e.id        = read_string(n, "id");
    e.ignore    = read_entity_ids(n, "ignore");
    e.whitelist = read_entity_ids(n, "whitelist");
    for (const auto& item : read_sequence(n, "metricThresholds")) {
        e.metric_thresholds.push_back(read_threshold(item));
    }
    return e;
}

// Shortest text that parses back to the same double.
std::string format_double(double value) {
    if (std::isnan(value)) return ".nan";
    if (std::isinf(value)) return value > 0 ? ".inf" : "-.inf";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        throw error(error_kind::serialization, {}, "cannot format number");
    }
    return std::string(buf, ptr);
}

void emit_entity_ids(YAML::Emitter& out, const char* key, const entity_id_list& ids) {
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "entityIds" << YAML::Value;
    if (ids.entity_ids.empty()) {
        out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
    } else {
        out << YAML::BeginSeq;
        for (const auto& id : ids.entity_ids) out << id;
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

void emit_threshold(YAML::Emitter& out, const metric_threshold& t) {
    out << YAML::BeginMap;
    out << YAML::Key << "entityId"       << YAML::Value << t.entity_id;
    out << YAML::Key << "metricId"       << YAML::Value << t.metric_id;
    out << YAML::Key << "parentEntityId" << YAML::Value << t.parent_entity_id;
    out << YAML::Key << "containerName"  << YAML::Value << t.container_name;
    out << YAML::Key << "graphName"      << YAML::Value << t.graph_name;
    out << YAML::Key << "legendName"     << YAML::Value << t.legend_name;
    if (t.min) out << YAML::Key << "min" << YAML::Value << format_double(*t.min);
    if (t.max) out << YAML::Key << "max" << YAML::Value << format_double(*t.max);
    if (t.incident) out << YAML::Key << "incident" << YAML::Value << *t.incident;
    out << YAML::EndMap;
}

} // anonymous namespace

alert_config parse_alert_config(std::string_view text, const std::string& source) {
    try {
        YAML::Node root = YAML::Load(std::string(text));

        alert_config cfg;
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) throw shape_error{"document root must be a mapping"};

        auto src = child(root, "source");
        cfg.source.defaults = read_defaults(child(src, "defaultConfig"));
        cfg.source.scope = read_entity(child(src, "entity"));
        return cfg;
    } catch (const shape_error& e) {
        throw error(error_kind::parse, source, source + ": " + e.message);
    } catch (const YAML::Exception& e) {
        throw error(error_kind::parse, source, source + ": " + e.what());
    }
}

alert_config load_alert_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw error(error_kind::input_read, path, "cannot open file: " + path);
    }

    std::ostringstream buf;
    buf << file.rdbuf();
    if (file.bad()) {
        throw error(error_kind::input_read, path, "failed to read file: " + path);
    }

    return parse_alert_config(buf.str(), path);
}

std::string emit_alert_config(const alert_config& cfg) {
    const auto& d = cfg.source.defaults;
    const auto& e = cfg.source.scope;

    YAML::Emitter out;
    try {
        out << YAML::BeginMap;
        out << YAML::Key << "source" << YAML::Value << YAML::BeginMap;

        out << YAML::Key << "defaultConfig" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "emailConfigName"            << YAML::Value << d.email_config_name;
        out << YAML::Key << "slackConfigName"            << YAML::Value << d.slack_config_name;
        out << YAML::Key << "incidentSevTwoConfigName"   << YAML::Value << d.incident_sev_two_config_name;
        out << YAML::Key << "incidentSevThreeConfigName" << YAML::Value << d.incident_sev_three_config_name;
        out << YAML::Key << "incidentSevFourConfigName"  << YAML::Value << d.incident_sev_four_config_name;
        out << YAML::Key << "incident" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "severity" << YAML::Value << d.incident.severity;
        out << YAML::Key << "enabled"  << YAML::Value << d.incident.enabled;
        out << YAML::EndMap;
        out << YAML::EndMap;

        out << YAML::Key << "entity" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << e.name;
        out << YAML::Key << "id"   << YAML::Value << e.id;
        emit_entity_ids(out, "ignore", e.ignore);
        emit_entity_ids(out, "whitelist", e.whitelist);
        out << YAML::Key << "metricThresholds" << YAML::Value;
        if (e.metric_thresholds.empty()) {
            out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
        } else {
            out << YAML::BeginSeq;
            for (const auto& t : e.metric_thresholds) emit_threshold(out, t);
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;

        out << YAML::EndMap;
        out << YAML::EndMap;
    } catch (const YAML::Exception& ex) {
        throw error(error_kind::serialization, {}, ex.what());
    }

    if (!out.good()) {
        throw error(error_kind::serialization, {}, out.GetLastError());
    }

    std::string text = out.c_str();
    text += '\n';
    return text;
}

} // namespace mirror
