#include "topology.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace mirror {

namespace {

using json = nlohmann::json;

// Absent and null both read as "".
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::string>();
}

// Absent and null both read as an empty array.
const json& array_field(const json& j, const char* key) {
    static const json empty = json::array();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw error(error_kind::parse, {}, std::string("field '") + key + "' must be an array");
    }
    return *it;
}

void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw error(error_kind::parse, {}, std::string(what) + " entry must be an object");
    }
}

container read_container(const json& j);

graph_meta read_graph_meta(const json& j) {
    require_object(j, "graph_metadata");
    graph_meta meta;
    meta.legend_name = string_field(j, "legend_name");
    meta.entity_id = string_field(j, "entity_id");
    meta.metric_id = string_field(j, "metric_id");

    auto layout = j.find("metadata_layout");
    if (layout != j.end() && !layout->is_null()) {
        require_object(*layout, "metadata_layout");
        for (const auto& child : array_field(*layout, "containers")) {
            meta.layout.containers.push_back(read_container(child));
        }
    }
    return meta;
}

graph read_graph(const json& j) {
    require_object(j, "graph");
    graph g;
    g.graph_name = string_field(j, "graph_name");
    for (const auto& item : array_field(j, "graph_metadata")) {
        g.graph_metadata.push_back(read_graph_meta(item));
    }
    return g;
}

container read_container(const json& j) {
    require_object(j, "container");
    container c;
    c.parent_entity_id = string_field(j, "parent_entity_id");
    c.container_name = string_field(j, "container_name");
    for (const auto& item : array_field(j, "graphs")) {
        c.graphs.push_back(read_graph(item));
    }
    return c;
}

} // anonymous namespace

topology_response parse_topology(std::string_view text, const std::string& source) {
    try {
        auto root = json::parse(text);
        require_object(root, "topology root");

        topology_response response;
        if (auto it = root.find("status"); it != root.end() && !it->is_null()) {
            response.status = it->get<int>();
        }
        response.message = string_field(root, "message");

        auto data = root.find("data");
        if (data != root.end() && !data->is_null()) {
            require_object(*data, "data");
            for (const auto& item : array_field(*data, "containers")) {
                response.containers.push_back(read_container(item));
            }
        }
        return response;
    } catch (const json::exception& e) {
        throw error(error_kind::parse, source, source + ": " + e.what());
    } catch (const error& e) {
        if (!e.path().empty()) throw;
        throw error(error_kind::parse, source, source + ": " + e.what());
    }
}

topology_response load_topology(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw error(error_kind::input_read, path, "cannot open file: " + path);
    }

    std::ostringstream buf;
    buf << file.rdbuf();
    if (file.bad()) {
        throw error(error_kind::input_read, path, "failed to read file: " + path);
    }

    return parse_topology(buf.str(), path);
}

std::size_t count_containers(const std::vector<container>& containers) {
    std::size_t total = containers.size();
    for (const auto& c : containers) {
        for (const auto& g : c.graphs) {
            for (const auto& meta : g.graph_metadata) {
                total += count_containers(meta.layout.containers);
            }
        }
    }
    return total;
}

} // namespace mirror
