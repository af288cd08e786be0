#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "config/Settings.hpp"
#include "llm/CodeGenerator.hpp"

namespace code_validation {

// Talks to a JSON bridge in front of the model:
//   POST {prompt, history, temperature[, model]} -> {success, text[, usage]}
class BridgeCodeGenerator : public ICodeGenerator {
public:
    explicit BridgeCodeGenerator(LLMSettings settings);

    std::string generate(const std::string& prompt) override;
    std::string generate_followup(const std::string& prompt) override;

    // Running conversation as [{role, content}, ...].
    nlohmann::json history() const;
    void reset();

private:
    LLMSettings settings_;
    nlohmann::json history_ = nlohmann::json::array();
    mutable std::mutex mtx_;

    std::string ask(const std::string& prompt, bool continue_conversation);
    GenerationResult call_bridge(const std::string& prompt, const nlohmann::json& history);
};

}
