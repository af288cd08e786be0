#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "domain/ExecutionTypes.hpp"

namespace code_validation {

// Owns <upload_root>/<execution_id> directories. Every path handed out or
// accepted is confined to one execution directory.
class SandboxWorkspace {
public:
    explicit SandboxWorkspace(std::filesystem::path upload_root);

    // Throws BadRequest when `files` is empty or no file survives sanitizing.
    ExecutionHandle create_execution(const std::vector<UploadedFile>& files);

    // Throws NotFound for unknown ids.
    ExecutionListing list_files(const std::string& execution_id) const;

    // Throws NotFound (unknown id / missing file) or Forbidden (path escapes the execution).
    std::string get_file(const std::string& execution_id, const std::string& relative_path) const;

    // Absolute directory of a known execution, or nullopt.
    std::optional<std::filesystem::path> resolve_execution(const std::string& execution_id) const;

    // Resolves `relative_path` under `root`, throwing Forbidden when it would escape.
    static std::filesystem::path resolve_inside(const std::filesystem::path& root, const std::string& relative_path);

    static bool is_safe_path(const std::filesystem::path& root, const std::filesystem::path& target);

    // Writes uploads under their sanitized names; returns the names actually written.
    static std::vector<std::string> save_files(const std::filesystem::path& dir, const std::vector<UploadedFile>& files);

    // Directory snapshot built with an explicit stack. Children sorted by name.
    static FileNode snapshot(const std::filesystem::path& dir, ExecutionStats* stats = nullptr);

    const std::filesystem::path& upload_root() const { return upload_root_; }

private:
    std::filesystem::path upload_root_;
};

}
