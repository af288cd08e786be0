#pragma once
#include <string>
#include <vector>

namespace code_validation {

struct CodeBlock {
    std::string language;   // empty when the fence carries no tag
    std::string content;
    int start_line = 0;     // 1-based, opening fence
    int end_line = 0;       // 1-based, closing fence
};

// Extracts ``` fenced blocks. The opening fence must start a line and may carry a
// single language tag; the closing fence may be indented.
class CodeBlockParser {
public:
    std::vector<CodeBlock> extract_code_blocks(const std::string& text) const;

    // Contents of the untagged and `python` blocks, in order.
    std::vector<std::string> extract_python(const std::string& text) const;

private:
    static bool parse_opening_fence(const std::string& line, std::string& language);
    static bool is_closing_fence(const std::string& line);
};

}
