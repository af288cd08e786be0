#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "config/Settings.hpp"
#include "client/ExecutionClient.hpp"
#include "llm/CodeGenerator.hpp"
#include "llm/PromptBuilder.hpp"
#include "loop/InteractionLogger.hpp"
#include "orchestrator/ConversationStore.hpp"

namespace code_validation {

struct TestRequest {
    std::string validation_id;
    std::string execution_id;
    ModelArtifacts artifacts;            // artifacts.execution_folder = execution dir on the sandbox
    std::string description;             // new test
    std::string test_id;                 // existing test, with follow_up_message
    std::string follow_up_message;
};

struct TestOutcome {
    std::string test_id;
    std::vector<TestResultFile> results;
    std::string test_code;
    int attempts = 0;
    Conversation conversation;
};

void to_json(nlohmann::json& j, const TestOutcome& outcome);

// Each test gets its own code generator so conversations never mix.
using GeneratorFactory = std::function<std::shared_ptr<ICodeGenerator>()>;

class TestService {
public:
    TestService(GeneratorFactory generator_factory,
                std::shared_ptr<IExecutionClient> client,
                std::shared_ptr<InteractionLogger> logger,
                std::shared_ptr<ConversationStore> conversations,
                const Settings& settings);

    // Throws TestExecutionError on invalid input or a failed cycle.
    TestOutcome execute_test(const TestRequest& request);

    // Fetches the .md files of test_<id>, caching the images they reference.
    std::vector<TestResultFile> process_test_results(const std::string& execution_id,
                                                     const std::string& test_id,
                                                     const std::string& validation_id);

    // Rewrites relative ![alt](path) links to the locally cached copy.
    std::string process_markdown(const std::string& content,
                                 const std::string& execution_id,
                                 const std::string& test_id,
                                 const std::string& validation_id);

    // Returns `<validation_id>/tests/test_<id>/images/<file>` or nullopt when the download failed.
    std::optional<std::string> fetch_and_cache_image(const std::string& execution_id,
                                                     const std::string& image,
                                                     const std::string& test_id,
                                                     const std::string& validation_id);

    // The `tests` object of the validation's metadata.json.
    nlohmann::json load_test_metadata(const std::string& validation_id) const;

    // Throws TestExecutionError for unknown tests.
    void delete_test(const std::string& validation_id, const std::string& test_id);

    std::filesystem::path test_directory(const std::string& validation_id, const std::string& test_id) const;

private:
    GeneratorFactory generator_factory_;
    std::shared_ptr<IExecutionClient> client_;
    std::shared_ptr<InteractionLogger> logger_;
    std::shared_ptr<ConversationStore> conversations_;
    Settings settings_;
    std::filesystem::path base_folder_;
    mutable std::mutex metadata_mutex_;

    std::filesystem::path metadata_path(const std::string& validation_id) const;
    nlohmann::json load_metadata_unlocked(const std::string& validation_id) const;
    void save_metadata_unlocked(const std::string& validation_id, nlohmann::json metadata) const;
    void add_test_metadata(const std::string& validation_id, const std::string& test_id, const nlohmann::json& data);
    void ensure_conversation(const std::string& validation_id, const std::string& test_id);
};

}
