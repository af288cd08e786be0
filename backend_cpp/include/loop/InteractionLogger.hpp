#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace code_validation {

// One audit record. `files` maps a role (prompt, response, code, ...) to the
// content file written for it.
struct InteractionEntry {
    std::string timestamp;
    std::string interaction_id;
    std::string type;               // llm_interaction | execution | verification
    nlohmann::json files = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

// Append-only audit trail of one process. Every content blob lands in its own
// file `<UTC timestamp>_<8 hex>_<name>`; every entry is written as JSON too.
class InteractionLogger {
public:
    explicit InteractionLogger(std::filesystem::path log_dir, size_t max_recent = 100);

    // Returns the path written.
    std::string save_content(const std::string& content, const std::string& filename);

    void log_llm_interaction(const std::string& interaction_id,
                             const std::string& prompt,
                             const std::optional<std::string>& response,
                             const std::optional<std::string>& extracted_code,
                             const nlohmann::json& metadata = nlohmann::json::object());

    void log_execution(const std::string& interaction_id,
                       const std::string& code,
                       const std::string& output,
                       const std::string& error,
                       const nlohmann::json& metadata = nlohmann::json::object());

    void log_verification(const std::string& interaction_id,
                          bool success,
                          const std::string& detail,
                          const nlohmann::json& metadata = nlohmann::json::object());

    // Newest first.
    nlohmann::json recent_json() const;

    const std::filesystem::path& log_dir() const { return log_dir_; }

private:
    std::filesystem::path log_dir_;
    size_t max_recent_;
    std::deque<InteractionEntry> recent_;
    mutable std::mutex mtx_;

    std::string save_content_unlocked(const std::string& content, const std::string& filename);
    void record(InteractionEntry entry, const std::string& json_name);
};

void to_json(nlohmann::json& j, const InteractionEntry& entry);

}
