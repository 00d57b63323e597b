#pragma once

#include <model_graph/graph.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace graph_export {

inline constexpr const char* default_file_name = "main_diagram_with_edges.json";
inline constexpr const char* json_mime_type = "application/json";

struct DownloadArtifact {
    std::string file_name;
    std::string mime_type;
    std::string content;
};

// Diagram element lists are written inline: a member is replaced by the full
// record of its node, a reference member by {id, name, type, reference: true}.
// Within one record tree each element is written in full at most once.
nlohmann::ordered_json to_json(const model_graph::Graph& graph);

// Four-space indented, non-ASCII escaped.
std::string to_json_string(const model_graph::Graph& graph);

DownloadArtifact make_download_artifact(const model_graph::Graph& graph);

// Writes artifact.content to directory/artifact.file_name. Returns false on I/O failure.
bool write_artifact(const DownloadArtifact& artifact, const std::string& directory);

} // namespace graph_export
