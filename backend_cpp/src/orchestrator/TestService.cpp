#include "orchestrator/TestService.hpp"
#include "loop/RepairLoop.hpp"
#include "loop/RequestRetry.hpp"
#include "domain/Errors.hpp"
#include "domain/TreeSearch.hpp"
#include "utils/Ids.hpp"
#include <regex>
#include <ctime>
#include <chrono>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* COMPLETED_MESSAGE =
    "Test execution completed. Results have been generated and can be viewed in the results tab.";

double unix_now() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string iso_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void write_text(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw TestExecutionError("Cannot create " + path.parent_path().string() + ": " + ec.message());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw TestExecutionError("Cannot write " + path.string());
    out << content;
}

// Ids end up as path components below the upload folder.
void check_ids(const std::string& validation_id, const std::string& test_id) {
    if (!is_valid_execution_id(validation_id)) {
        throw TestExecutionError("Invalid validation id: " + validation_id);
    }
    if (!test_id.empty() && test_id.find_first_not_of("0123456789") != std::string::npos) {
        throw TestExecutionError("Invalid test id: " + test_id);
    }
}

bool is_external(const std::string& link) {
    return link.rfind("http://", 0) == 0 || link.rfind("https://", 0) == 0;
}

}

void to_json(json& j, const TestOutcome& outcome) {
    j = json{
        {"status", "success"},
        {"test_id", outcome.test_id},
        {"results", outcome.results},
        {"testCode", outcome.test_code},
        {"attempts", outcome.attempts},
        {"conversation", outcome.conversation}
    };
}

TestService::TestService(GeneratorFactory generator_factory,
                         std::shared_ptr<IExecutionClient> client,
                         std::shared_ptr<InteractionLogger> logger,
                         std::shared_ptr<ConversationStore> conversations,
                         const Settings& settings)
    : generator_factory_(std::move(generator_factory)), client_(std::move(client)),
      logger_(std::move(logger)), conversations_(std::move(conversations)),
      settings_(settings), base_folder_(settings.storage.base_upload_folder) {}

fs::path TestService::test_directory(const std::string& validation_id, const std::string& test_id) const {
    return base_folder_ / validation_id / "tests" / ("test_" + test_id);
}

fs::path TestService::metadata_path(const std::string& validation_id) const {
    return base_folder_ / validation_id / "metadata.json";
}

void TestService::ensure_conversation(const std::string& validation_id, const std::string& test_id) {
    if (!conversations_->open(test_id)) return;

    // Evicted or never seen in this process: pick up what metadata.json remembers.
    json tests = load_test_metadata(validation_id);
    if (tests.contains(test_id) && tests[test_id].contains("conversation")) {
        try {
            conversations_->restore(test_id, tests[test_id]["conversation"].get<Conversation>());
        } catch (const json::exception& e) {
            throw TestExecutionError("Failed to execute test: stored conversation for " + test_id + " is malformed: " + e.what());
        }
        spdlog::info("💾 Conversation for test {} restored from metadata", test_id);
    }
}

TestOutcome TestService::execute_test(const TestRequest& request) {
    // 1. Validate
    if (request.validation_id.empty() || request.execution_id.empty()) {
        throw TestExecutionError("Failed to execute test: validation_id and execution_id are required");
    }
    if (request.test_id.empty() && request.description.empty()) {
        throw TestExecutionError("Failed to execute test: Either test_id or description must be provided");
    }
    if (!request.test_id.empty() && request.follow_up_message.empty() && request.description.empty()) {
        throw TestExecutionError("Failed to execute test: Follow-up message required for existing test");
    }
    try {
        check_ids(request.validation_id, request.test_id);
    } catch (const TestExecutionError& e) {
        throw TestExecutionError(std::string("Failed to execute test: ") + e.what());
    }

    // 2. Conversation + user turn
    std::string test_id = request.test_id;
    if (test_id.empty()) {
        // Unix seconds; bumped while taken so two tests started in the same second stay apart.
        long long stamp = (long long)std::time(nullptr);
        test_id = std::to_string(stamp);
        while (fs::exists(test_directory(request.validation_id, test_id)) || !conversations_->open(test_id)) {
            test_id = std::to_string(++stamp);
        }
    } else {
        ensure_conversation(request.validation_id, test_id);
    }

    const bool follow_up = !request.follow_up_message.empty();
    conversations_->append_message(test_id, "user", follow_up ? request.follow_up_message : request.description);

    // 3. Prompt
    fs::path test_dir = test_directory(request.validation_id, test_id);
    std::string prompt = PromptBuilder::independent_test_prompt(
        request.artifacts,
        follow_up ? "Improve existing test based on feedback" : request.description,
        conversations_->build_context_prompt(test_id),
        test_id);
    try {
        write_text(test_dir / "prompt.txt", prompt);
    } catch (const TestExecutionError& e) {
        conversations_->append_message(test_id, "assistant", std::string("Error executing test: ") + e.what());
        throw TestExecutionError(std::string("Failed to execute test: ") + e.what());
    }

    // 4. Cycle
    RepairLoop loop(generator_factory_(), client_, logger_, settings_.loop,
                    settings_.execution.max_request_attempts, base_folder_);
    CycleResult cycle = loop.run_cycle(prompt, request.execution_id, test_id, request.validation_id);

    if (!cycle.success) {
        conversations_->append_message(test_id, "assistant", "Error executing test: " + cycle.message);
        spdlog::error("❌ Test {} failed ({}): {}", test_id, failure_kind_to_string(cycle.failure), cycle.message);
        throw TestExecutionError("Failed to execute test: " + cycle.message);
    }

    // 5. Results
    std::vector<TestResultFile> results;
    try {
        results = process_test_results(request.execution_id, test_id, request.validation_id);
    } catch (const ValidationError& e) {
        conversations_->append_message(test_id, "assistant", std::string("Error executing test: ") + e.what());
        throw TestExecutionError(std::string("Failed to execute test: ") + e.what());
    }

    conversations_->append_message(test_id, "assistant", COMPLETED_MESSAGE);
    conversations_->append_result(test_id, cycle.code, results, unix_now());

    TestOutcome outcome;
    outcome.test_id = test_id;
    outcome.results = std::move(results);
    outcome.test_code = cycle.code;
    outcome.attempts = cycle.attempts;
    outcome.conversation = conversations_->snapshot(test_id).value_or(Conversation{});

    // 6. Metadata
    add_test_metadata(request.validation_id, test_id, {
        {"description", follow_up ? request.follow_up_message : request.description},
        {"prompt", prompt},
        {"code", outcome.test_code},
        {"results", outcome.results},
        {"conversation", outcome.conversation}
    });

    spdlog::info("✅ Test {} completed in {} attempt(s), {} result file(s)", test_id, outcome.attempts, outcome.results.size());
    return outcome;
}

std::vector<TestResultFile> TestService::process_test_results(const std::string& execution_id,
                                                              const std::string& test_id,
                                                              const std::string& validation_id) {
    std::vector<TestResultFile> results;
    const int attempts = settings_.execution.max_request_attempts;

    ExecutionListing listing = with_request_retries(
        [&]() { return client_->list_files(execution_id); }, attempts, "list_files");

    const FileNode* folder = find_directory(listing.structure, "test_" + test_id);
    if (!folder) return results;

    fs::path test_dir = test_directory(validation_id, test_id);

    for (const FileNode* child : collect_files(*folder, "md")) {
        std::string content = with_request_retries(
            [&]() { return client_->get_file(execution_id, folder->name + "/" + child->name); }, attempts, "get_file");

        std::string processed = process_markdown(content, execution_id, test_id, validation_id);
        write_text(test_dir / child->name, processed);
        results.push_back({child->name, processed});
    }
    return results;
}

std::string TestService::process_markdown(const std::string& content,
                                          const std::string& execution_id,
                                          const std::string& test_id,
                                          const std::string& validation_id) {
    static const std::regex image_pattern(R"(!\[(.*?)\]\((.*?)\))");

    std::string result;
    size_t last_end = 0;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), image_pattern);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        result += content.substr(last_end, (size_t)match.position(0) - last_end);
        last_end = (size_t)(match.position(0) + match.length(0));

        std::string alt = match[1];
        std::string link = match[2];
        if (is_external(link)) {
            result += match.str(0);
            continue;
        }

        auto cached = fetch_and_cache_image(execution_id, link, test_id, validation_id);
        result += cached ? "![" + alt + "](/test-images/" + *cached + ")" : match.str(0);
    }
    result += content.substr(last_end);
    return result;
}

std::optional<std::string> TestService::fetch_and_cache_image(const std::string& execution_id,
                                                              const std::string& image,
                                                              const std::string& test_id,
                                                              const std::string& validation_id) {
    std::string filename = fs::path(image).filename().string();
    if (filename.empty()) return std::nullopt;

    try {
        std::string data = with_request_retries(
            [&]() { return client_->get_file(execution_id, "test_" + test_id + "/" + image); },
            settings_.execution.max_request_attempts, "get_file");

        fs::path target = test_directory(validation_id, test_id) / "images" / filename;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::warn("⚠️ Cannot cache image {}", target.string());
            return std::nullopt;
        }
        out << data;
    } catch (const ExecutionError& e) {
        spdlog::warn("⚠️ Image {} not cached: {}", image, e.what());
        return std::nullopt;
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("⚠️ Image {} not cached: {}", image, e.what());
        return std::nullopt;
    }

    return validation_id + "/tests/test_" + test_id + "/images/" + filename;
}

json TestService::load_metadata_unlocked(const std::string& validation_id) const {
    fs::path path = metadata_path(validation_id);
    if (!fs::exists(path)) return json{{"validation_id", validation_id}, {"tests", json::object()}};

    std::ifstream f(path);
    json metadata = json::parse(f, nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object()) {
        throw TestExecutionError("Corrupt metadata: " + path.string());
    }
    if (!metadata.contains("tests") || !metadata["tests"].is_object()) metadata["tests"] = json::object();
    return metadata;
}

void TestService::save_metadata_unlocked(const std::string& validation_id, json metadata) const {
    metadata["validation_id"] = validation_id;
    metadata["updated_at"] = iso_now();
    write_text(metadata_path(validation_id), metadata.dump(2));
}

void TestService::add_test_metadata(const std::string& validation_id, const std::string& test_id, const json& data) {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    json metadata = load_metadata_unlocked(validation_id);
    metadata["tests"][test_id] = data;
    save_metadata_unlocked(validation_id, std::move(metadata));
}

json TestService::load_test_metadata(const std::string& validation_id) const {
    check_ids(validation_id, "");
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    return load_metadata_unlocked(validation_id)["tests"];
}

void TestService::delete_test(const std::string& validation_id, const std::string& test_id) {
    check_ids(validation_id, test_id);
    if (test_id.empty()) throw TestExecutionError("Invalid test id: empty");
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    json metadata = load_metadata_unlocked(validation_id);
    if (!metadata["tests"].contains(test_id)) {
        throw TestExecutionError("Test " + test_id + " not found in validation " + validation_id);
    }

    metadata["tests"].erase(test_id);
    save_metadata_unlocked(validation_id, std::move(metadata));

    std::error_code ec;
    fs::remove_all(test_directory(validation_id, test_id), ec);
    if (ec) spdlog::warn("⚠️ Test folder for {} not removed: {}", test_id, ec.message());
    conversations_->erase(test_id);
    spdlog::info("🗑️ Test {} deleted from validation {}", test_id, validation_id);
}

}
