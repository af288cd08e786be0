#pragma once
#include <string>
#include <vector>
#include "llm/CodeBlockParser.hpp"

namespace code_validation {

struct GenerationResult {
    std::string text;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;
    bool success = false;
};

// The code-writing agent. generate() starts a fresh conversation,
// generate_followup() continues it. Both throw LLMError.
class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;

    virtual std::string generate(const std::string& prompt) = 0;
    virtual std::string generate_followup(const std::string& prompt) = 0;

    virtual std::vector<std::string> extract_code_blocks(const std::string& text) const {
        return CodeBlockParser().extract_python(text);
    }
};

}
