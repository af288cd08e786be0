#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace code_validation {

struct ConversationMessage {
    std::string role;      // user | assistant
    std::string content;
};

struct TestResultFile {
    std::string filename;
    std::string content;
};

struct ResultRecord {
    std::string code;
    std::vector<TestResultFile> results;
    double timestamp = 0.0;   // unix seconds
};

struct Conversation {
    std::vector<ConversationMessage> messages;
    std::vector<ResultRecord> test_results;
};

void to_json(nlohmann::json& j, const ConversationMessage& m);
void from_json(const nlohmann::json& j, ConversationMessage& m);
void to_json(nlohmann::json& j, const TestResultFile& f);
void from_json(const nlohmann::json& j, TestResultFile& f);
void to_json(nlohmann::json& j, const ResultRecord& r);
void from_json(const nlohmann::json& j, ResultRecord& r);
void to_json(nlohmann::json& j, const Conversation& c);
void from_json(const nlohmann::json& j, Conversation& c);

// Per-test conversation state. Entries idle longer than `ttl` are dropped by
// evict_expired(); past `max_entries` the least recently touched entry goes first.
class ConversationStore {
public:
    using Clock = std::chrono::steady_clock;

    ConversationStore(std::chrono::seconds ttl, size_t max_entries,
                      std::function<Clock::time_point()> now = Clock::now);

    // Returns true when the conversation did not exist yet.
    bool open(const std::string& test_id);
    // Seeds a conversation restored from disk, replacing any in-memory state.
    void restore(const std::string& test_id, Conversation conversation);

    void append_message(const std::string& test_id, const std::string& role, const std::string& content);
    void append_result(const std::string& test_id, const std::string& code,
                       const std::vector<TestResultFile>& results, double timestamp);

    std::optional<Conversation> snapshot(const std::string& test_id) const;

    // Turns + latest code/results, framed as an improvement request. "" for unknown ids.
    std::string build_context_prompt(const std::string& test_id) const;

    bool erase(const std::string& test_id);
    size_t evict_expired();
    size_t size() const;

private:
    struct Entry {
        Conversation conversation;
        Clock::time_point last_touched;
    };

    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
    std::chrono::seconds ttl_;
    size_t max_entries_;
    std::function<Clock::time_point()> now_;

    Entry& touch_unlocked(const std::string& test_id);
    void evict_overflow_unlocked(const std::string& keep);
};

}
