#include "loop/InteractionLogger.hpp"
#include "utils/Ids.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string utc_now(const char* format) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

}

void to_json(json& j, const InteractionEntry& entry) {
    j = json{
        {"timestamp", entry.timestamp},
        {"interaction_id", entry.interaction_id},
        {"type", entry.type},
        {"files", entry.files},
        {"metadata", entry.metadata}
    };
}

InteractionLogger::InteractionLogger(fs::path log_dir, size_t max_recent)
    : log_dir_(std::move(log_dir)), max_recent_(max_recent) {
    fs::create_directories(log_dir_);
}

std::string InteractionLogger::save_content(const std::string& content, const std::string& filename) {
    std::lock_guard<std::mutex> lock(mtx_);
    return save_content_unlocked(content, filename);
}

std::string InteractionLogger::save_content_unlocked(const std::string& content, const std::string& filename) {
    fs::path path = log_dir_ / (utc_now("%Y%m%d_%H%M%S") + "_" + short_hex_id() + "_" + filename);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        spdlog::error("❌ Interaction log: cannot write {}", path.string());
        return "";
    }
    out << content;
    return path.string();
}

void InteractionLogger::record(InteractionEntry entry, const std::string& json_name) {
    save_content_unlocked(json(entry).dump(2), json_name);
    recent_.push_back(std::move(entry));
    if (recent_.size() > max_recent_) recent_.pop_front();
}

void InteractionLogger::log_llm_interaction(const std::string& interaction_id,
                                            const std::string& prompt,
                                            const std::optional<std::string>& response,
                                            const std::optional<std::string>& extracted_code,
                                            const json& metadata) {
    std::lock_guard<std::mutex> lock(mtx_);

    InteractionEntry entry;
    entry.timestamp = utc_now("%Y-%m-%dT%H:%M:%SZ");
    entry.interaction_id = interaction_id;
    entry.type = "llm_interaction";
    entry.metadata = metadata;

    entry.files["prompt_file"] = save_content_unlocked(prompt, "prompt.txt");
    entry.files["response_file"] = (response && !response->empty())
        ? json(save_content_unlocked(*response, "response.txt")) : json(nullptr);
    entry.files["extracted_code_file"] = (extracted_code && !extracted_code->empty())
        ? json(save_content_unlocked(*extracted_code, "code.py")) : json(nullptr);

    spdlog::debug("📝 LLM interaction {} logged (prompt: {})", interaction_id, entry.files["prompt_file"].get<std::string>());
    record(std::move(entry), "interaction_" + interaction_id + ".json");
}

void InteractionLogger::log_execution(const std::string& interaction_id,
                                      const std::string& code,
                                      const std::string& output,
                                      const std::string& error,
                                      const json& metadata) {
    std::lock_guard<std::mutex> lock(mtx_);

    InteractionEntry entry;
    entry.timestamp = utc_now("%Y-%m-%dT%H:%M:%SZ");
    entry.interaction_id = interaction_id;
    entry.type = "execution";
    entry.metadata = metadata;

    entry.files["code_file"] = save_content_unlocked(code, "executed_code.py");
    entry.files["output_file"] = output.empty() ? json(nullptr) : json(save_content_unlocked(output, "execution_output.txt"));
    entry.files["error_file"] = error.empty() ? json(nullptr) : json(save_content_unlocked(error, "execution_error.txt"));

    if (!error.empty()) {
        spdlog::warn("📝 Execution {} logged with error ({} bytes)", interaction_id, error.size());
    } else {
        spdlog::debug("📝 Execution {} logged", interaction_id);
    }
    record(std::move(entry), "execution_" + interaction_id + ".json");
}

void InteractionLogger::log_verification(const std::string& interaction_id,
                                         bool success,
                                         const std::string& detail,
                                         const json& metadata) {
    std::lock_guard<std::mutex> lock(mtx_);

    InteractionEntry entry;
    entry.timestamp = utc_now("%Y-%m-%dT%H:%M:%SZ");
    entry.interaction_id = interaction_id;
    entry.type = "verification";
    entry.metadata = metadata;
    entry.metadata["success"] = success;
    entry.metadata["detail"] = detail;

    record(std::move(entry), "verification_" + interaction_id + ".json");
}

json InteractionLogger::recent_json() const {
    std::lock_guard<std::mutex> lock(mtx_);
    json list = json::array();
    for (auto it = recent_.rbegin(); it != recent_.rend(); ++it) {
        list.push_back(*it);
    }
    return list;
}

}
