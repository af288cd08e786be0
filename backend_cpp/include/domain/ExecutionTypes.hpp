#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace code_validation {

enum class NodeType { FILE, DIRECTORY };

// One node of a directory snapshot. Directories keep their children sorted by name.
struct FileNode {
    std::string name;
    NodeType type = NodeType::FILE;
    std::uintmax_t size = 0;
    std::optional<std::string> extension;
    std::vector<FileNode> children;

    bool is_directory() const { return type == NodeType::DIRECTORY; }
    bool is_file() const { return type == NodeType::FILE; }
};

struct ExecutionStats {
    std::uintmax_t total_files = 0;
    std::uintmax_t total_size = 0;
    std::string execution_id;
    double created_time = 0.0;
};

// Response of list_files: tree + aggregate stats + absolute directory on the sandbox host.
struct ExecutionListing {
    FileNode structure;
    ExecutionStats stats;
    std::string directory;
};

struct ExecutionHandle {
    std::string execution_id;
    std::string directory;
    std::vector<std::string> saved_files;
};

struct ExecutionResult {
    std::string output;
    std::string error;
    int exit_code = 0;
    bool timed_out = false;

    bool has_error() const { return !error.empty(); }
    bool has_output() const { return !output.empty(); }
};

struct LatexResult {
    std::string pdf_path;
    std::vector<std::string> warnings;
};

struct PdfDocument {
    std::string bytes;
    std::vector<std::string> warnings;
};

// A file uploaded to the sandbox: sanitized on arrival, stored verbatim.
struct UploadedFile {
    std::string filename;
    std::string content;
};

std::string node_type_to_string(NodeType type);

void to_json(nlohmann::json& j, const FileNode& node);
void from_json(const nlohmann::json& j, FileNode& node);

void to_json(nlohmann::json& j, const ExecutionStats& stats);
void from_json(const nlohmann::json& j, ExecutionStats& stats);

void to_json(nlohmann::json& j, const ExecutionListing& listing);
void from_json(const nlohmann::json& j, ExecutionListing& listing);

void to_json(nlohmann::json& j, const ExecutionHandle& handle);
void from_json(const nlohmann::json& j, ExecutionHandle& handle);

void to_json(nlohmann::json& j, const ExecutionResult& result);
void from_json(const nlohmann::json& j, ExecutionResult& result);

}
