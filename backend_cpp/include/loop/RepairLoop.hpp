#pragma once
#include <memory>
#include <string>
#include <filesystem>
#include "config/Settings.hpp"
#include "domain/ExecutionTypes.hpp"
#include "client/ExecutionClient.hpp"
#include "llm/CodeGenerator.hpp"
#include "loop/InteractionLogger.hpp"

namespace code_validation {

enum class FailureKind {
    None,
    NoCodeGenerated,
    GenerationFailed,
    RepairFailed,
    RetriesExhausted,
    SandboxUnreachable,
    NotFound,
    SandboxError
};

std::string failure_kind_to_string(FailureKind kind);

struct CycleResult {
    bool success = false;
    std::string code;                 // accepted code, or the last one tried
    int attempts = 0;                 // execute calls made
    FailureKind failure = FailureKind::None;
    std::string message;
    std::string interaction_id;
    ExecutionResult last_execution;
};

// ask -> execute -> verify -> (repair -> execute ...) for one test.
// A cycle makes at most `loop.max_retries` execute calls and one repair prompt
// fewer. Success means `test_<n>/report.md` exists somewhere in the execution tree.
class RepairLoop {
public:
    RepairLoop(std::shared_ptr<ICodeGenerator> generator,
               std::shared_ptr<IExecutionClient> client,
               std::shared_ptr<InteractionLogger> logger,
               LoopSettings loop,
               int request_attempts,
               std::filesystem::path base_path);

    // Never throws a ValidationError; every failure is reported in the result.
    CycleResult run_cycle(const std::string& prompt,
                          const std::string& execution_id,
                          const std::string& test_number,
                          const std::string& validation_id);

    // `<base_path>/<validation_id>/tests/test_<n>`
    std::filesystem::path test_directory(const std::string& validation_id, const std::string& test_number) const;

private:
    std::shared_ptr<ICodeGenerator> generator_;
    std::shared_ptr<IExecutionClient> client_;
    std::shared_ptr<InteractionLogger> logger_;
    LoopSettings loop_;
    int request_attempts_;
    std::filesystem::path base_path_;

    CycleResult run_attempts(CycleResult& cycle, const std::string& prompt, const std::string& execution_id,
                             const std::string& test_number, const std::string& validation_id);

    void persist_code(const std::filesystem::path& test_dir, const std::string& code, int attempt) const;
    bool verify(const std::string& execution_id, const std::string& folder_name, std::string& detail);
};

}
