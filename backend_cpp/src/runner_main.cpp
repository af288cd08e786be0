#include <memory>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <sstream>
#include <chrono>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "config/Settings.hpp"
#include "domain/Errors.hpp"
#include "client/ExecutionClient.hpp"
#include "llm/BridgeCodeGenerator.hpp"
#include "loop/InteractionLogger.hpp"
#include "orchestrator/ConversationStore.hpp"
#include "orchestrator/TestService.hpp"
#include "utils/Ids.hpp"
#include "utils/Logging.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace code_validation;

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  code_validation_runner run <request.json> [config.json]\n"
              << "  code_validation_runner tests <validation_id> [config.json]\n"
              << "  code_validation_runner delete <validation_id> <test_id> [config.json]\n"
              << "  code_validation_runner latex <execution_id> <file.tex> [config.json]\n";
}

json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot open " + path);
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw ConfigurationError(path + " is not a JSON object");
    return j;
}

std::string read_text_file(const std::string& path) {
    if (path.empty()) return "";
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        spdlog::warn("⚠️ Could not read {}", path);
        return "";
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// request.json:
// { "validation_id"?, "files": [...], "documentation"?, "code"?, "train"?, "test"?, "pickle"?,
//   "tests": [{"description": "..."} | {"test_id": "...", "follow_up": "..."}] }
int run_request(const Settings& settings, const std::string& request_path) {
    json request = read_json_file(request_path);

    auto client = std::make_shared<ExecutionClient>(settings.execution.service_url, settings.execution.request_timeout_ms);
    if (!client->healthy()) spdlog::warn("⚠️ Sandbox at {} does not answer /health", client->base_url());

    // 1. Upload the model artifacts
    std::vector<fs::path> files;
    for (const auto& f : request.value("files", json::array())) files.emplace_back(f.get<std::string>());
    ExecutionHandle handle = client->create_execution_from_paths(files);

    std::string validation_id = request.value("validation_id", generate_uuid());
    spdlog::info("🧪 Validation {} uses execution {}", validation_id, handle.execution_id);

    ModelArtifacts artifacts;
    artifacts.documentation = read_text_file(request.value("documentation", ""));
    artifacts.code = read_text_file(request.value("code", ""));
    artifacts.train_path = request.value("train", "");
    artifacts.test_path = request.value("test", "");
    artifacts.pickle_path = request.value("pickle", "");
    artifacts.execution_folder = handle.directory;

    // 2. Services
    auto logger = std::make_shared<InteractionLogger>(settings.logging.interaction_dir);
    auto conversations = std::make_shared<ConversationStore>(
        std::chrono::seconds(settings.conversation.ttl_seconds), settings.conversation.max_entries);
    LLMSettings llm = settings.llm;
    TestService service([llm]() { return std::make_shared<BridgeCodeGenerator>(llm); },
                        client, logger, conversations, settings);

    // 3. Tests, one after the other
    int failures = 0;
    for (const auto& t : request.value("tests", json::array())) {
        TestRequest test;
        test.validation_id = validation_id;
        test.execution_id = handle.execution_id;
        test.artifacts = artifacts;
        test.description = t.value("description", "");
        test.test_id = t.value("test_id", "");
        test.follow_up_message = t.value("follow_up", "");

        try {
            TestOutcome outcome = service.execute_test(test);
            std::cout << json(outcome).dump(2) << std::endl;
        } catch (const TestExecutionError& e) {
            ++failures;
            std::cout << json{{"status", "error"}, {"error", e.what()}}.dump(2) << std::endl;
        }
        conversations->evict_expired();
    }
    return failures == 0 ? 0 : 2;
}

}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        print_usage();
        return 1;
    }
    std::string command = argv[1];
    int config_index = (command == "delete" || command == "latex") ? 4 : 3;

    Settings settings;
    try {
        settings = Settings::load(argc > config_index ? argv[config_index] : "");
        settings.ensure_directories();
        setup_logging(settings, "runner");
    } catch (const ConfigurationError& e) {
        spdlog::critical("🔥 {}", e.what());
        return 1;
    }

    try {
        if (command == "run") return run_request(settings, argv[2]);

        auto client = std::make_shared<ExecutionClient>(settings.execution.service_url, settings.execution.request_timeout_ms);
        auto logger = std::make_shared<InteractionLogger>(settings.logging.interaction_dir);
        auto conversations = std::make_shared<ConversationStore>(
            std::chrono::seconds(settings.conversation.ttl_seconds), settings.conversation.max_entries);
        LLMSettings llm = settings.llm;
        TestService service([llm]() { return std::make_shared<BridgeCodeGenerator>(llm); },
                            client, logger, conversations, settings);

        if (command == "tests") {
            std::cout << service.load_test_metadata(argv[2]).dump(2) << std::endl;
            return 0;
        }
        if (command == "delete" && argc >= 4) {
            service.delete_test(argv[2], argv[3]);
            return 0;
        }
        if (command == "latex" && argc >= 4) {
            PdfDocument pdf = client->compile_latex(argv[2], argv[3]);
            fs::path out = fs::path(argv[3]).stem().string() + ".pdf";
            std::ofstream f(out, std::ios::binary | std::ios::trunc);
            if (!f.is_open()) {
                spdlog::error("❌ Cannot write {}", out.string());
                return 1;
            }
            f << pdf.bytes;
            for (const auto& warning : pdf.warnings) spdlog::warn("📄 {}", warning);
            spdlog::info("✅ {} written ({} bytes)", out.string(), pdf.bytes.size());
            return 0;
        }
    } catch (const ValidationError& e) {
        spdlog::error("❌ {}", e.what());
        return 1;
    }

    print_usage();
    return 1;
}
