#include "llm/BridgeCodeGenerator.hpp"
#include "domain/Errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <algorithm>

namespace code_validation {

using json = nlohmann::json;

namespace {

bool is_retriable(const cpr::Response& r) {
    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) return true;
    return r.status_code == 408 || r.status_code == 429 || r.status_code >= 500;
}

// Transport errors, 408, 429 and 5xx are retried with a linearly growing pause.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_retries) {
    const int attempts = std::max(1, max_retries);
    cpr::Response r;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        r = request_factory();
        if (r.status_code >= 200 && r.status_code < 300) return r;
        if (!is_retriable(r) || attempt == attempts - 1) return r;

        auto delay = std::chrono::milliseconds(500 * (attempt + 1));
        spdlog::warn("🔁 LLM bridge request failed (attempt {}/{}, status {}). Retrying in {} ms",
                     attempt + 1, attempts, r.status_code, delay.count());
        std::this_thread::sleep_for(delay);
    }
    return r;
}

}

BridgeCodeGenerator::BridgeCodeGenerator(LLMSettings settings) : settings_(std::move(settings)) {}

std::string BridgeCodeGenerator::generate(const std::string& prompt) {
    return ask(prompt, false);
}

std::string BridgeCodeGenerator::generate_followup(const std::string& prompt) {
    return ask(prompt, true);
}

json BridgeCodeGenerator::history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return history_;
}

void BridgeCodeGenerator::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    history_ = json::array();
}

std::string BridgeCodeGenerator::ask(const std::string& prompt, bool continue_conversation) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!continue_conversation) history_ = json::array();

    GenerationResult result = call_bridge(prompt, history_);
    if (!result.success) throw LLMError("LLM bridge returned no answer");

    history_.push_back({{"role", "user"}, {"content", prompt}});
    history_.push_back({{"role", "assistant"}, {"content", result.text}});

    spdlog::info("🤖 LLM answered ({} chars, {} tokens)", result.text.size(), result.total_tokens);
    return result.text;
}

GenerationResult BridgeCodeGenerator::call_bridge(const std::string& prompt, const json& history) {
    json payload = {
        {"prompt", prompt},
        {"history", history},
        {"temperature", settings_.temperature}
    };
    if (!settings_.model.empty()) payload["model"] = settings_.model;

    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!settings_.api_key.empty()) headers["Authorization"] = "Bearer " + settings_.api_key;

    std::string body = payload.dump();
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{settings_.bridge_url},
                         cpr::Body{body},
                         headers,
                         cpr::Timeout{settings_.timeout_ms});
    }, settings_.max_retries);

    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) {
        throw LLMError("LLM bridge unreachable: " + r.error.message);
    }
    if (r.status_code != 200) {
        throw LLMError("LLM bridge returned HTTP " + std::to_string(r.status_code) + ": " + r.text.substr(0, 200));
    }

    json j = json::parse(r.text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw LLMError("LLM bridge response is not JSON");

    GenerationResult result;
    result.success = j.value("success", false);
    if (j.contains("text") && j["text"].is_string()) result.text = j["text"].get<std::string>();
    if (j.contains("usage") && j["usage"].is_object()) {
        result.prompt_tokens = j["usage"].value("prompt_tokens", 0);
        result.completion_tokens = j["usage"].value("completion_tokens", 0);
        result.total_tokens = j["usage"].value("total_tokens", result.prompt_tokens + result.completion_tokens);
    }
    if (result.success && result.text.empty()) result.success = false;
    return result;
}

}
