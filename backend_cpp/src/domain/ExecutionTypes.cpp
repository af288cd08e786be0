#include "domain/ExecutionTypes.hpp"

namespace code_validation {

using json = nlohmann::json;

std::string node_type_to_string(NodeType type) {
    return type == NodeType::DIRECTORY ? "directory" : "file";
}

void to_json(json& j, const FileNode& node) {
    j = json{{"name", node.name}, {"type", node_type_to_string(node.type)}};
    if (node.is_directory()) {
        json children = json::array();
        for (const auto& child : node.children) children.push_back(child);
        j["children"] = children;
    } else {
        j["size"] = node.size;
        if (node.extension) j["extension"] = *node.extension;
    }
}

void from_json(const json& j, FileNode& node) {
    node.name = j.value("name", "");
    node.type = j.value("type", "file") == "directory" ? NodeType::DIRECTORY : NodeType::FILE;
    node.size = j.value("size", std::uintmax_t{0});
    node.extension.reset();
    if (j.contains("extension") && j["extension"].is_string()) {
        node.extension = j["extension"].get<std::string>();
    }
    node.children.clear();
    if (j.contains("children") && j["children"].is_array()) {
        for (const auto& child : j["children"]) node.children.push_back(child.get<FileNode>());
    }
}

void to_json(json& j, const ExecutionStats& stats) {
    j = json{
        {"total_files", stats.total_files},
        {"total_size", stats.total_size},
        {"execution_id", stats.execution_id},
        {"created_time", stats.created_time}
    };
}

void from_json(const json& j, ExecutionStats& stats) {
    stats.total_files = j.value("total_files", std::uintmax_t{0});
    stats.total_size = j.value("total_size", std::uintmax_t{0});
    stats.execution_id = j.value("execution_id", "");
    stats.created_time = j.value("created_time", 0.0);
}

void to_json(json& j, const ExecutionListing& listing) {
    j = json{{"structure", listing.structure}, {"stats", listing.stats}, {"directory", listing.directory}};
}

void from_json(const json& j, ExecutionListing& listing) {
    listing.structure = j.at("structure").get<FileNode>();
    listing.stats = j.value("stats", json::object()).get<ExecutionStats>();
    listing.directory = j.value("directory", "");
}

void to_json(json& j, const ExecutionHandle& handle) {
    j = json{
        {"execution_id", handle.execution_id},
        {"directory", handle.directory},
        {"saved_files", handle.saved_files}
    };
}

void from_json(const json& j, ExecutionHandle& handle) {
    handle.execution_id = j.at("execution_id").get<std::string>();
    handle.directory = j.value("directory", "");
    handle.saved_files = j.value("saved_files", std::vector<std::string>{});
}

void to_json(json& j, const ExecutionResult& result) {
    j = json{
        {"output", result.output},
        {"error", result.error},
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out}
    };
}

void from_json(const json& j, ExecutionResult& result) {
    // Older sandboxes send null for empty streams
    result.output = j.contains("output") && j["output"].is_string() ? j["output"].get<std::string>() : "";
    result.error = j.contains("error") && j["error"].is_string() ? j["error"].get<std::string>() : "";
    result.exit_code = j.value("exit_code", 0);
    result.timed_out = j.value("timed_out", false);
}

}
