#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mirror {

struct container;

// Child containers hung below a graph metric. Empty when the JSON has no
// metadata_layout (or no containers inside it).
struct metadata_layout {
    std::vector<container> containers;
};

struct graph_meta {
    std::string legend_name;
    std::string entity_id;
    std::string metric_id;
    metadata_layout layout;
};

struct graph {
    std::string graph_name;
    std::vector<graph_meta> graph_metadata;
};

struct container {
    std::string parent_entity_id;
    std::string container_name;
    std::vector<graph> graphs;
};

// Top-level topology document: { status, message, data: { containers } }
struct topology_response {
    int status = 0;
    std::string message;
    std::vector<container> containers;
};

// Parse a topology JSON document. `source` is used in error messages.
// Throws mirror::error (parse) on malformed input.
topology_response parse_topology(std::string_view text, const std::string& source = "<memory>");

// Read and parse a topology JSON file.
// Throws mirror::error (input_read or parse).
topology_response load_topology(const std::string& path);

// Total number of containers in the tree, nested ones included.
std::size_t count_containers(const std::vector<container>& containers);

} // namespace mirror
