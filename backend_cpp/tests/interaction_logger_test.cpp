#include <regex>
#include <fstream>
#include <sstream>
#include <filesystem>

#include "loop/InteractionLogger.hpp"
#include "utils/Ids.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace code_validation;  // NOLINT

std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Files in `dir` whose name ends with `suffix`.
std::vector<fs::path> files_ending_with(const fs::path& dir, const std::string& suffix) {
    std::vector<fs::path> found;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            found.push_back(entry.path());
        }
    }
    return found;
}

class InteractionLoggerTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = fs::temp_directory_path() / ("interaction_test_" + short_hex_id()); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, ContentFilesCarryTimestampAndToken) {
    InteractionLogger logger(dir_);
    std::string path = logger.save_content("hello", "note.txt");

    std::string name = fs::path(path).filename().string();
    EXPECT_TRUE(std::regex_match(name, std::regex(R"(\d{8}_\d{6}_[0-9a-f]{8}_note\.txt)"))) << name;
    EXPECT_EQ(read_file(path), "hello");
}

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, LlmInteractionWritesPromptResponseAndCode) {
    InteractionLogger logger(dir_);
    logger.log_llm_interaction("abc", "the prompt", std::string("the answer"), std::string("print(1)"),
                               {{"type", "initial_prompt"}});

    auto records = files_ending_with(dir_, "_interaction_abc.json");
    ASSERT_EQ(records.size(), 1u);
    json entry = json::parse(read_file(records[0]));
    EXPECT_EQ(entry["type"], "llm_interaction");
    EXPECT_EQ(entry["interaction_id"], "abc");
    EXPECT_EQ(entry["metadata"]["type"], "initial_prompt");
    EXPECT_EQ(read_file(entry["files"]["prompt_file"].get<std::string>()), "the prompt");
    EXPECT_EQ(read_file(entry["files"]["response_file"].get<std::string>()), "the answer");
    EXPECT_EQ(read_file(entry["files"]["extracted_code_file"].get<std::string>()), "print(1)");
}

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, AbsentContentIsNull) {
    InteractionLogger logger(dir_);
    logger.log_llm_interaction("p", "prompt only", std::nullopt, std::nullopt);
    logger.log_execution("p", "x = 1", "", "");

    json recent = logger.recent_json();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_TRUE(recent[1]["files"]["response_file"].is_null());
    EXPECT_TRUE(recent[0]["files"]["output_file"].is_null());
    EXPECT_TRUE(recent[0]["files"]["error_file"].is_null());
    EXPECT_TRUE(recent[0]["files"]["code_file"].is_string());
}

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, ExecutionRecordsErrorText) {
    InteractionLogger logger(dir_);
    logger.log_execution("e1", "raise X", "", "Traceback", {{"attempt", 2}});

    auto records = files_ending_with(dir_, "_execution_e1.json");
    ASSERT_EQ(records.size(), 1u);
    json entry = json::parse(read_file(records[0]));
    EXPECT_EQ(entry["metadata"]["attempt"], 2);
    EXPECT_EQ(read_file(entry["files"]["error_file"].get<std::string>()), "Traceback");
}

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, VerificationOutcomeLandsInMetadata) {
    InteractionLogger logger(dir_);
    logger.log_verification("v1", false, "folder test_1 not found");

    json recent = logger.recent_json();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0]["type"], "verification");
    EXPECT_EQ(recent[0]["metadata"]["success"], false);
    EXPECT_EQ(recent[0]["metadata"]["detail"], "folder test_1 not found");
    EXPECT_EQ(files_ending_with(dir_, "_verification_v1.json").size(), 1u);
}

// NOLINTNEXTLINE
TEST_F(InteractionLoggerTest, RecentIsNewestFirstAndCapped) {
    InteractionLogger logger(dir_, 3);
    for (int i = 0; i < 5; ++i) logger.log_verification("id" + std::to_string(i), true, "ok");

    json recent = logger.recent_json();
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0]["interaction_id"], "id4");
    EXPECT_EQ(recent[2]["interaction_id"], "id2");
}

}  // namespace
