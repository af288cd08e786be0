#include "loop/RepairLoop.hpp"
#include "loop/RequestRetry.hpp"
#include "llm/PromptBuilder.hpp"
#include "domain/Errors.hpp"
#include "domain/TreeSearch.hpp"
#include "utils/Ids.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* REPORT_FILE = "report.md";

CycleResult fail(CycleResult& cycle, FailureKind kind, const std::string& message) {
    cycle.success = false;
    cycle.failure = kind;
    cycle.message = message;
    return cycle;
}

}

std::string failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::NoCodeGenerated: return "no_code_generated";
        case FailureKind::GenerationFailed: return "generation_failed";
        case FailureKind::RepairFailed: return "repair_failed";
        case FailureKind::RetriesExhausted: return "retries_exhausted";
        case FailureKind::SandboxUnreachable: return "sandbox_unreachable";
        case FailureKind::NotFound: return "not_found";
        case FailureKind::SandboxError: return "sandbox_error";
    }
    return "unknown";
}

RepairLoop::RepairLoop(std::shared_ptr<ICodeGenerator> generator,
                       std::shared_ptr<IExecutionClient> client,
                       std::shared_ptr<InteractionLogger> logger,
                       LoopSettings loop,
                       int request_attempts,
                       fs::path base_path)
    : generator_(std::move(generator)), client_(std::move(client)), logger_(std::move(logger)),
      loop_(loop), request_attempts_(request_attempts), base_path_(std::move(base_path)) {
    if (loop_.max_retries < 1) loop_.max_retries = 1;
}

fs::path RepairLoop::test_directory(const std::string& validation_id, const std::string& test_number) const {
    return base_path_ / validation_id / "tests" / ("test_" + test_number);
}

void RepairLoop::persist_code(const fs::path& test_dir, const std::string& code, int attempt) const {
    std::error_code ec;
    fs::create_directories(test_dir, ec);
    if (ec) {
        spdlog::error("❌ Cannot create {}: {}", test_dir.string(), ec.message());
        return;
    }

    std::vector<fs::path> targets = {test_dir / "test_code.py"};
    if (attempt > 1) targets.push_back(test_dir / ("test_code_attempt_" + std::to_string(attempt) + ".py"));

    for (const auto& target : targets) {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("❌ Cannot write {}", target.string());
            continue;
        }
        out << code;
    }
}

bool RepairLoop::verify(const std::string& execution_id, const std::string& folder_name, std::string& detail) {
    ExecutionListing listing = with_request_retries(
        [&]() { return client_->list_files(execution_id); }, request_attempts_, "list_files");

    const FileNode* folder = find_directory(listing.structure, folder_name);
    if (!folder) {
        detail = "folder " + folder_name + " not found";
        return false;
    }
    if (!has_file_child(*folder, REPORT_FILE)) {
        detail = folder_name + "/" + REPORT_FILE + " not found";
        return false;
    }
    detail = folder_name + "/" + REPORT_FILE + " present";
    return true;
}

CycleResult RepairLoop::run_cycle(const std::string& prompt,
                                  const std::string& execution_id,
                                  const std::string& test_number,
                                  const std::string& validation_id) {
    CycleResult cycle;
    cycle.interaction_id = generate_uuid();
    const std::string& iid = cycle.interaction_id;

    spdlog::info("🔄 Cycle {} started (test {}, execution {})", iid, test_number, execution_id);

    // 1. Ask
    logger_->log_llm_interaction(iid, prompt, std::nullopt, std::nullopt,
                                 {{"type", "initial_prompt"}, {"test_number", test_number}, {"execution_id", execution_id}});
    std::string response;
    try {
        response = generator_->generate(prompt);
    } catch (const LLMError& e) {
        spdlog::error("❌ Cycle {}: generation failed: {}", iid, e.what());
        logger_->log_execution(iid, "", "", e.what(), {{"type", "error"}});
        return fail(cycle, FailureKind::GenerationFailed, e.what());
    }

    std::vector<std::string> blocks = generator_->extract_code_blocks(response);
    logger_->log_llm_interaction(iid, prompt, response,
                                 blocks.empty() ? std::nullopt : std::optional<std::string>(blocks.front()),
                                 {{"type", "code_extraction"}, {"blocks", blocks.size()}});
    if (blocks.empty()) {
        spdlog::warn("⚠️ Cycle {}: no code blocks in the answer", iid);
        return fail(cycle, FailureKind::NoCodeGenerated, "No code blocks generated");
    }
    if (blocks.size() > 1) {
        spdlog::debug("Cycle {}: {} code blocks, executing the first", iid, blocks.size());
    }

    // 2. Persist intent before anything runs
    cycle.code = blocks.front();
    persist_code(test_directory(validation_id, test_number), cycle.code, 1);

    try {
        return run_attempts(cycle, prompt, execution_id, test_number, validation_id);
    } catch (const SandboxUnreachable& e) {
        logger_->log_execution(iid, "", "", e.what(), {{"type", "verification_error"}});
        return fail(cycle, FailureKind::SandboxUnreachable, e.what());
    } catch (const NotFound& e) {
        logger_->log_execution(iid, "", "", e.what(), {{"type", "verification_error"}});
        return fail(cycle, FailureKind::NotFound, e.what());
    } catch (const ValidationError& e) {
        logger_->log_execution(iid, "", "", e.what(), {{"type", "verification_error"}});
        return fail(cycle, FailureKind::SandboxError, e.what());
    }
}

CycleResult RepairLoop::run_attempts(CycleResult& cycle,
                                     const std::string& prompt,
                                     const std::string& execution_id,
                                     const std::string& test_number,
                                     const std::string& validation_id) {
    const std::string& iid = cycle.interaction_id;
    const std::string folder_name = "test_" + test_number;
    const int max_attempts = loop_.max_retries;

    for (int attempt = 1;; ++attempt) {
        // 3. Execute
        cycle.attempts = attempt;
        ExecutionResult result = with_request_retries(
            [&]() { return client_->execute(cycle.code, execution_id); }, request_attempts_, "execute");
        cycle.last_execution = result;

        logger_->log_execution(iid, cycle.code, result.output, result.error,
                               {{"attempt", attempt}, {"execution_id", execution_id},
                                {"exit_code", result.exit_code}, {"timed_out", result.timed_out}});

        // 4. Classify, 5. Verify
        std::string repair_prompt;
        bool failed = result.has_error() || (loop_.output_is_failure && result.has_output());
        if (failed) {
            spdlog::warn("⚠️ Cycle {}: attempt {}/{} produced error/output", iid, attempt, max_attempts);
            repair_prompt = PromptBuilder::execution_error_prompt(result.error + result.output, prompt, cycle.code);
        } else {
            std::string detail;
            bool verified = verify(execution_id, folder_name, detail);
            logger_->log_verification(iid, verified, detail, {{"attempt", attempt}});
            if (verified) {
                cycle.success = true;
                cycle.failure = FailureKind::None;
                cycle.message = detail;
                spdlog::info("✅ Cycle {}: verified after {} attempt(s)", iid, attempt);
                return cycle;
            }
            spdlog::warn("⚠️ Cycle {}: attempt {}/{}: {}", iid, attempt, max_attempts, detail);
            repair_prompt = PromptBuilder::missing_folder_prompt(prompt, folder_name, cycle.code);
        }

        // 7. Exhaustion
        if (attempt >= max_attempts) {
            return fail(cycle, FailureKind::RetriesExhausted,
                        "Test did not succeed after " + std::to_string(attempt) + " attempt(s)");
        }

        // 6. Repair
        std::string response;
        try {
            response = generator_->generate_followup(repair_prompt);
        } catch (const LLMError& e) {
            spdlog::error("❌ Cycle {}: repair request failed: {}", iid, e.what());
            return fail(cycle, FailureKind::RepairFailed, e.what());
        }

        std::vector<std::string> blocks = generator_->extract_code_blocks(response);
        logger_->log_llm_interaction(iid, repair_prompt, response,
                                     blocks.empty() ? std::nullopt : std::optional<std::string>(blocks.front()),
                                     {{"type", "repair"}, {"attempt", attempt}});
        if (blocks.empty()) {
            return fail(cycle, FailureKind::RepairFailed, "Repair answer contained no code");
        }

        cycle.code = blocks.front();
        persist_code(test_directory(validation_id, test_number), cycle.code, attempt + 1);
    }
}

}
