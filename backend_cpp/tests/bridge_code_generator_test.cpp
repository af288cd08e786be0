#include <atomic>
#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "llm/BridgeCodeGenerator.hpp"
#include "domain/Errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using json = nlohmann::json;

using ::testing::ElementsAre;

using namespace code_validation;  // NOLINT

// Loopback stand-in for the LLM bridge. Answers are queued as (status, body).
class BridgeCodeGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post("/bridge/generate", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mtx_);
            requests_.push_back(json::parse(req.body));
            authorization_ = req.get_header_value("Authorization");
            auto reply = answers_.empty() ? std::make_pair(200, json{{"success", true}, {"text", "ok"}}.dump())
                                           : answers_[std::min(calls_.load(), answers_.size() - 1)];
            ++calls_;
            res.status = reply.first;
            res.set_content(reply.second, "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();

        settings_.bridge_url = "http://127.0.0.1:" + std::to_string(port_) + "/bridge/generate";
        settings_.timeout_ms = 5000;
        settings_.max_retries = 2;
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    void answer(int status, const json& body) { answers_.emplace_back(status, body.dump()); }

    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
    LLMSettings settings_;

    std::mutex mtx_;
    std::vector<std::pair<int, std::string>> answers_;
    std::vector<json> requests_;
    std::string authorization_;
    std::atomic<size_t> calls_{0};
};

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, FollowUpCarriesHistory) {
    answer(200, {{"success", true}, {"text", "first answer"}});
    answer(200, {{"success", true}, {"text", "second answer"}, {"usage", {{"total_tokens", 12}}}});
    settings_.model = "m1";
    BridgeCodeGenerator generator(settings_);

    EXPECT_EQ(generator.generate("write a test"), "first answer");
    EXPECT_EQ(generator.generate_followup("fix it"), "second answer");

    ASSERT_EQ(requests_.size(), 2u);
    EXPECT_EQ(requests_[0]["prompt"], "write a test");
    EXPECT_TRUE(requests_[0]["history"].empty());
    EXPECT_EQ(requests_[0]["model"], "m1");
    ASSERT_EQ(requests_[1]["history"].size(), 2u);
    EXPECT_EQ(requests_[1]["history"][0]["content"], "write a test");
    EXPECT_EQ(requests_[1]["history"][1]["role"], "assistant");
    EXPECT_EQ(generator.history().size(), 4u);
}

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, GenerateStartsAFreshConversation) {
    BridgeCodeGenerator generator(settings_);
    generator.generate("one");
    generator.generate_followup("two");
    generator.generate("three");

    ASSERT_EQ(requests_.size(), 3u);
    EXPECT_TRUE(requests_[2]["history"].empty());
    EXPECT_EQ(generator.history().size(), 2u);
}

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, ApiKeyIsSentAsBearer) {
    settings_.api_key = "secret";
    BridgeCodeGenerator generator(settings_);
    generator.generate("x");
    EXPECT_EQ(authorization_, "Bearer secret");
}

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, ServerErrorIsRetried) {
    answer(503, {{"error", "busy"}});
    answer(200, {{"success", true}, {"text", "after retry"}});
    BridgeCodeGenerator generator(settings_);

    EXPECT_EQ(generator.generate("x"), "after retry");
    EXPECT_EQ(calls_.load(), 2u);
}

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, ClientErrorIsNotRetried) {
    answer(400, {{"error", "bad prompt"}});
    BridgeCodeGenerator generator(settings_);

    EXPECT_THROW(generator.generate("x"), LLMError);
    EXPECT_EQ(calls_.load(), 1u);
}

// NOLINTNEXTLINE
TEST_F(BridgeCodeGeneratorTest, UnsuccessfulAnswerIsAnError) {
    answer(200, {{"success", false}, {"text", ""}});
    BridgeCodeGenerator generator(settings_);

    EXPECT_THROW(generator.generate("x"), LLMError);
    EXPECT_TRUE(generator.history().empty());
}

// NOLINTNEXTLINE
TEST(BridgeCodeGeneratorUnreachableTest, UnreachableBridgeIsAnError) {
    LLMSettings settings;
    settings.bridge_url = "http://127.0.0.1:1/bridge/generate";
    settings.timeout_ms = 2000;
    settings.max_retries = 1;
    BridgeCodeGenerator generator(settings);
    EXPECT_THROW(generator.generate("x"), LLMError);
}

// NOLINTNEXTLINE
TEST(BridgeCodeGeneratorUnreachableTest, DefaultExtractionKeepsPythonBlocks) {
    BridgeCodeGenerator generator(LLMSettings{});
    EXPECT_THAT(generator.extract_code_blocks("```python\na()\n```\n```sql\nselect 1\n```"), ElementsAre("a()"));
}

}  // namespace
