#include "llm/CodeBlockParser.hpp"
#include "llm/CodeGenerator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using namespace code_validation;  // NOLINT

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, ExtractsTaggedAndUntaggedBlocks) {
    std::string text =
        "Here you go:\n"
        "```python\n"
        "print('a')\n"
        "```\n"
        "and\n"
        "```\n"
        "x = 1\n"
        "y = 2\n"
        "```\n";
    auto blocks = CodeBlockParser().extract_code_blocks(text);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].language, "python");
    EXPECT_EQ(blocks[0].content, "print('a')");
    EXPECT_EQ(blocks[0].start_line, 2);
    EXPECT_EQ(blocks[0].end_line, 4);
    EXPECT_EQ(blocks[1].language, "");
    EXPECT_EQ(blocks[1].content, "x = 1\ny = 2");
}

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, PythonFilterDropsOtherLanguages) {
    std::string text =
        "```bash\nls\n```\n"
        "```Python\nprint(1)\n```\n"
        "```c++\nint main() {}\n```\n"
        "```\nprint(2)\n```\n";
    EXPECT_THAT(CodeBlockParser().extract_python(text), ElementsAre("print(1)", "print(2)"));
}

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, FenceMustStartTheLine) {
    std::string text = "inline ```python\nprint(1)\n``` text";
    EXPECT_THAT(CodeBlockParser().extract_code_blocks(text), IsEmpty());
}

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, IndentedClosingFenceIsAccepted) {
    std::string text = "```python\nif x:\n    pass\n    ```\n";
    auto blocks = CodeBlockParser().extract_python(text);
    EXPECT_THAT(blocks, ElementsAre("if x:\n    pass"));
}

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, UnterminatedBlockIsIgnored) {
    EXPECT_THAT(CodeBlockParser().extract_code_blocks("```python\nprint(1)\n"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, NoFencesNoBlocks) {
    EXPECT_THAT(CodeBlockParser().extract_python("I cannot help with that."), IsEmpty());
}

class PlainGenerator : public ICodeGenerator {
public:
    std::string generate(const std::string&) override { return ""; }
    std::string generate_followup(const std::string&) override { return ""; }
};

// NOLINTNEXTLINE
TEST(CodeBlockParserTest, GeneratorDefaultExtractionUsesPythonFilter) {
    PlainGenerator generator;
    EXPECT_THAT(generator.extract_code_blocks("```js\nx\n```\n```python\ny\n```"), ElementsAre("y"));
}

}  // namespace
