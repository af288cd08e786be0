#include "domain/TreeSearch.hpp"
#include <stack>

namespace code_validation {

const FileNode* find_directory(const FileNode& root, const std::string& name) {
    std::stack<const FileNode*> pending;
    pending.push(&root);

    while (!pending.empty()) {
        const FileNode* node = pending.top();
        pending.pop();

        if (!node->is_directory()) continue;
        if (node->name == name) return node;

        // Push in reverse so the first child is visited first (pre-order)
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            if (it->is_directory()) pending.push(&*it);
        }
    }
    return nullptr;
}

bool has_file_child(const FileNode& dir, const std::string& name) {
    for (const auto& child : dir.children) {
        if (child.is_file() && child.name == name) return true;
    }
    return false;
}

std::vector<const FileNode*> collect_files(const FileNode& dir, const std::string& extension) {
    std::vector<const FileNode*> out;
    for (const auto& child : dir.children) {
        if (child.is_file() && child.extension && *child.extension == extension) {
            out.push_back(&child);
        }
    }
    return out;
}

}
