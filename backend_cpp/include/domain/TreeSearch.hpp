#pragma once
#include <string>
#include <vector>
#include "domain/ExecutionTypes.hpp"

namespace code_validation {

// First directory named `name`, depth-first pre-order, or nullptr.
// The returned pointer aliases into `root` and is valid as long as `root` is.
const FileNode* find_directory(const FileNode& root, const std::string& name);

// True when `dir` has a direct child file called `name`.
bool has_file_child(const FileNode& dir, const std::string& name);

// Direct child files of `dir` whose extension equals `extension` (no dot), in tree order.
std::vector<const FileNode*> collect_files(const FileNode& dir, const std::string& extension);

}
