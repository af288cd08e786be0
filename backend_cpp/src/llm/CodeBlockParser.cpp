#include "llm/CodeBlockParser.hpp"
#include <algorithm>
#include <cctype>

namespace code_validation {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool is_space(char c) {
    return std::isspace((unsigned char)c) != 0;
}

bool is_language_char(char c) {
    return std::isalnum((unsigned char)c) || c == '+' || c == '#' || c == '_' || c == '-';
}

}

bool CodeBlockParser::parse_opening_fence(const std::string& line, std::string& language) {
    if (line.compare(0, 3, "```") != 0) return false;

    size_t i = 3;
    while (i < line.size() && is_space(line[i])) ++i;
    size_t tag_start = i;
    while (i < line.size() && is_language_char(line[i])) ++i;
    size_t tag_end = i;
    while (i < line.size() && is_space(line[i])) ++i;
    if (i != line.size()) return false;

    language = line.substr(tag_start, tag_end - tag_start);
    return true;
}

bool CodeBlockParser::is_closing_fence(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && is_space(line[i])) ++i;
    return line.compare(i, 3, "```") == 0;
}

std::vector<CodeBlock> CodeBlockParser::extract_code_blocks(const std::string& text) const {
    std::vector<CodeBlock> blocks;
    std::vector<std::string> lines = split_lines(text);

    size_t i = 0;
    while (i < lines.size()) {
        std::string language;
        if (!parse_opening_fence(lines[i], language)) {
            ++i;
            continue;
        }

        // First closing fence after the opening line ends the block (non-greedy).
        size_t close = i + 1;
        while (close < lines.size() && !is_closing_fence(lines[close])) ++close;
        // An empty fence pair carries no content line and is not a block.
        if (close >= lines.size() || close == i + 1) {
            ++i;
            continue;
        }

        CodeBlock block;
        block.language = language;
        block.start_line = (int)i + 1;
        block.end_line = (int)close + 1;
        for (size_t k = i + 1; k < close; ++k) {
            if (k > i + 1) block.content += "\n";
            block.content += lines[k];
        }
        blocks.push_back(std::move(block));
        i = close + 1;
    }
    return blocks;
}

std::vector<std::string> CodeBlockParser::extract_python(const std::string& text) const {
    std::vector<std::string> out;
    for (auto& block : extract_code_blocks(text)) {
        std::string lang = block.language;
        std::transform(lang.begin(), lang.end(), lang.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (lang.empty() || lang == "python") out.push_back(std::move(block.content));
    }
    return out;
}

}
