#include "sandbox/SandboxWorkspace.hpp"
#include "domain/Errors.hpp"
#include "utils/Ids.hpp"
#include "utils/Scrubber.hpp"
#include <stack>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <sys/stat.h>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;

SandboxWorkspace::SandboxWorkspace(fs::path upload_root) : upload_root_(std::move(upload_root)) {
    fs::create_directories(upload_root_);
    upload_root_ = fs::canonical(upload_root_);
}

ExecutionHandle SandboxWorkspace::create_execution(const std::vector<UploadedFile>& files) {
    if (files.empty()) throw BadRequest("No files provided");

    std::string execution_id = generate_uuid();
    fs::path execution_dir = upload_root_ / execution_id;
    fs::create_directories(execution_dir);
    spdlog::info("📂 Created execution directory: {}", execution_dir.string());

    ExecutionHandle handle;
    handle.execution_id = execution_id;
    handle.directory = execution_dir.string();
    handle.saved_files = save_files(execution_dir, files);

    if (handle.saved_files.empty()) {
        std::error_code ec;
        fs::remove_all(execution_dir, ec);
        throw BadRequest("No usable file names in upload");
    }
    return handle;
}

std::optional<fs::path> SandboxWorkspace::resolve_execution(const std::string& execution_id) const {
    if (!is_valid_execution_id(execution_id)) return std::nullopt;
    fs::path dir = upload_root_ / execution_id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;
    return dir;
}

ExecutionListing SandboxWorkspace::list_files(const std::string& execution_id) const {
    auto dir = resolve_execution(execution_id);
    if (!dir) throw NotFound("Execution directory not found: " + execution_id);

    ExecutionListing listing;
    listing.structure = snapshot(*dir, &listing.stats);
    listing.stats.execution_id = execution_id;
    listing.directory = dir->string();
    return listing;
}

std::string SandboxWorkspace::get_file(const std::string& execution_id, const std::string& relative_path) const {
    auto dir = resolve_execution(execution_id);
    if (!dir) throw NotFound("Execution directory not found: " + execution_id);

    fs::path target = resolve_inside(*dir, relative_path);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) throw NotFound("File not found: " + relative_path);

    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f.is_open()) throw NotFound("File not readable: " + relative_path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

fs::path SandboxWorkspace::resolve_inside(const fs::path& root, const std::string& relative_path) {
    fs::path rel(relative_path);
    if (relative_path.empty() || rel.is_absolute() || rel.has_root_name()) {
        throw Forbidden("Invalid path: " + relative_path);
    }
    for (const auto& part : rel) {
        if (part == "..") throw Forbidden("Path traversal blocked: " + relative_path);
    }

    fs::path target = root / rel;
    if (!is_safe_path(root, target)) throw Forbidden("Path escapes execution directory: " + relative_path);
    return target;
}

// 🛡️ Component-wise containment check after resolving symlinks that exist.
bool SandboxWorkspace::is_safe_path(const fs::path& root, const fs::path& target) {
    if (root.empty()) return false;

    std::error_code ec;
    fs::path root_abs = fs::weakly_canonical(root, ec);
    if (ec) return false;
    fs::path target_abs = fs::weakly_canonical(target, ec);
    if (ec) return false;

    auto it_t = target_abs.begin();
    for (auto it_r = root_abs.begin(); it_r != root_abs.end(); ++it_r) {
        if (it_r->empty()) continue; // trailing separator
        if (it_t == target_abs.end() || *it_t != *it_r) {
            spdlog::warn("🚨 SECURITY ALERT: Path escape blocked! Root: {} | Target: {}", root_abs.string(), target_abs.string());
            return false;
        }
        ++it_t;
    }
    return true;
}

std::vector<std::string> SandboxWorkspace::save_files(const fs::path& dir, const std::vector<UploadedFile>& files) {
    std::vector<std::string> saved;
    for (const auto& file : files) {
        std::string name = secure_filename(file.filename);
        if (name.empty()) {
            spdlog::warn("⚠️ Skipping upload with unusable name: '{}'", file.filename);
            continue;
        }

        fs::path path = dir / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Cannot write " + path.string());
        out.write(file.content.data(), (std::streamsize)file.content.size());
        out.close();

        spdlog::debug("💾 Saved file: {} ({} bytes)", path.string(), file.content.size());
        saved.push_back(name);
    }
    return saved;
}

FileNode SandboxWorkspace::snapshot(const fs::path& dir, ExecutionStats* stats) {
    FileNode root;
    root.name = dir.filename().string();
    root.type = NodeType::DIRECTORY;

    if (stats) {
        struct stat st{};
        if (::stat(dir.c_str(), &st) == 0) stats->created_time = (double)st.st_ctime;
    }

    // Each directory's children are filled completely before any of them is
    // pushed, so the pointers on the stack never see a reallocation.
    std::stack<std::pair<FileNode*, fs::path>> pending;
    pending.push({&root, dir});

    while (!pending.empty()) {
        auto [node, path] = pending.top();
        pending.pop();

        std::vector<fs::directory_entry> entries;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(path, fs::directory_options::skip_permission_denied, ec)) {
            entries.push_back(entry);
        }
        if (ec) spdlog::warn("⚠️ Cannot fully list {}: {}", path.string(), ec.message());

        std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename().string() < b.path().filename().string();
        });

        for (const auto& entry : entries) {
            FileNode child;
            child.name = entry.path().filename().string();

            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
                child.type = NodeType::DIRECTORY;
            } else {
                child.type = NodeType::FILE;
                std::error_code size_ec;
                child.size = entry.is_regular_file(type_ec) ? entry.file_size(size_ec) : 0;
                if (size_ec) child.size = 0;
                std::string ext = entry.path().extension().string();
                if (ext.size() > 1) child.extension = ext.substr(1);

                if (stats) {
                    stats->total_files++;
                    stats->total_size += child.size;
                }
            }
            node->children.push_back(std::move(child));
        }

        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            if (it->is_directory()) pending.push({&*it, path / it->name});
        }
    }
    return root;
}

}
