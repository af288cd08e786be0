#include "orchestrator/ConversationStore.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace code_validation {

using json = nlohmann::json;

void to_json(json& j, const ConversationMessage& m) {
    j = json{{"role", m.role}, {"content", m.content}};
}

void from_json(const json& j, ConversationMessage& m) {
    m.role = j.value("role", "");
    m.content = j.value("content", "");
}

void to_json(json& j, const TestResultFile& f) {
    j = json{{"filename", f.filename}, {"content", f.content}};
}

void from_json(const json& j, TestResultFile& f) {
    f.filename = j.value("filename", "");
    f.content = j.value("content", "");
}

void to_json(json& j, const ResultRecord& r) {
    j = json{{"code", r.code}, {"results", r.results}, {"timestamp", r.timestamp}};
}

void from_json(const json& j, ResultRecord& r) {
    r.code = j.value("code", "");
    r.results = j.value("results", std::vector<TestResultFile>{});
    r.timestamp = j.value("timestamp", 0.0);
}

void to_json(json& j, const Conversation& c) {
    j = json{{"messages", c.messages}, {"test_results", c.test_results}};
}

void from_json(const json& j, Conversation& c) {
    c.messages = j.value("messages", std::vector<ConversationMessage>{});
    c.test_results = j.value("test_results", std::vector<ResultRecord>{});
}

ConversationStore::ConversationStore(std::chrono::seconds ttl, size_t max_entries,
                                     std::function<Clock::time_point()> now)
    : ttl_(ttl), max_entries_(max_entries == 0 ? 1 : max_entries), now_(std::move(now)) {}

ConversationStore::Entry& ConversationStore::touch_unlocked(const std::string& test_id) {
    Entry& entry = entries_[test_id];
    entry.last_touched = now_();
    evict_overflow_unlocked(test_id);
    return entries_.at(test_id);
}

void ConversationStore::evict_overflow_unlocked(const std::string& keep) {
    while (entries_.size() > max_entries_) {
        auto oldest = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == keep) continue;
            if (oldest == entries_.end() || it->second.last_touched < oldest->second.last_touched) oldest = it;
        }
        if (oldest == entries_.end()) return;
        spdlog::debug("🧹 Conversation {} evicted (capacity)", oldest->first);
        entries_.erase(oldest);
    }
}

bool ConversationStore::open(const std::string& test_id) {
    std::unique_lock lock(mutex_);
    bool created = entries_.find(test_id) == entries_.end();
    touch_unlocked(test_id);
    return created;
}

void ConversationStore::restore(const std::string& test_id, Conversation conversation) {
    std::unique_lock lock(mutex_);
    touch_unlocked(test_id).conversation = std::move(conversation);
}

void ConversationStore::append_message(const std::string& test_id, const std::string& role, const std::string& content) {
    std::unique_lock lock(mutex_);
    touch_unlocked(test_id).conversation.messages.push_back({role, content});
}

void ConversationStore::append_result(const std::string& test_id, const std::string& code,
                                      const std::vector<TestResultFile>& results, double timestamp) {
    std::unique_lock lock(mutex_);
    touch_unlocked(test_id).conversation.test_results.push_back({code, results, timestamp});
}

std::optional<Conversation> ConversationStore::snapshot(const std::string& test_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(test_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.conversation;
}

std::string ConversationStore::build_context_prompt(const std::string& test_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(test_id);
    if (it == entries_.end()) return "";

    const Conversation& c = it->second.conversation;
    std::string prompt = "Previous conversation and test history:\n\n";
    for (const auto& msg : c.messages) {
        prompt += (msg.role == "user" ? "User: " : "Assistant: ") + msg.content + "\n\n";
    }

    if (!c.test_results.empty()) {
        const ResultRecord& latest = c.test_results.back();
        prompt += "Latest test code:\n" + latest.code + "\n\n";
        prompt += "Latest test results:\n";
        for (const auto& file : latest.results) prompt += file.content + "\n";
    }

    prompt += "\nPlease improve the test based on the above conversation and previous results.";
    return prompt;
}

bool ConversationStore::erase(const std::string& test_id) {
    std::unique_lock lock(mutex_);
    return entries_.erase(test_id) > 0;
}

size_t ConversationStore::evict_expired() {
    std::unique_lock lock(mutex_);
    auto now = now_();
    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.last_touched > ttl_) {
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) spdlog::info("🧹 Evicted {} idle conversation(s)", evicted);
    return evicted;
}

size_t ConversationStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}
