#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mirror {

struct incident_settings {
    std::string severity;
    bool enabled = false;

    bool operator==(const incident_settings&) const = default;
};

// Notification/severity settings. Never interpreted, only copied into
// every derived configuration.
struct default_config {
    std::string email_config_name;
    std::string slack_config_name;
    std::string incident_sev_two_config_name;
    std::string incident_sev_three_config_name;
    std::string incident_sev_four_config_name;
    incident_settings incident;

    bool operator==(const default_config&) const = default;
};

struct entity_id_list {
    std::vector<std::string> entity_ids;

    bool operator==(const entity_id_list&) const = default;
};

// Matched on (entity_id, metric_id). The remaining descriptive fields are
// carried through unchanged. min/max/incident are absent unless the source
// document sets them; absent is not the same as 0 or "".
struct metric_threshold {
    std::string entity_id;
    std::string metric_id;
    std::string parent_entity_id;
    std::string container_name;
    std::string graph_name;
    std::string legend_name;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<std::string> incident;

    bool operator==(const metric_threshold&) const = default;
};

struct entity {
    std::string name;
    std::string id;
    entity_id_list ignore;
    entity_id_list whitelist;
    std::vector<metric_threshold> metric_thresholds;

    bool operator==(const entity&) const = default;
};

struct alert_source {
    default_config defaults;
    entity scope;

    bool operator==(const alert_source&) const = default;
};

// The global threshold document and each per-container derivation share this shape.
struct alert_config {
    alert_source source;

    bool operator==(const alert_config&) const = default;
};

// Parse from YAML text. Throws mirror::error (parse).
alert_config parse_alert_config(std::string_view text, const std::string& source = "<memory>");

// Read and parse a YAML file. Throws mirror::error (input_read or parse).
alert_config load_alert_config(const std::string& path);

// Serialize to YAML using the same key layout as the input document.
// Throws mirror::error (serialization).
std::string emit_alert_config(const alert_config& cfg);

} // namespace mirror
