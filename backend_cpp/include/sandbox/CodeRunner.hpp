#pragma once
#include <string>
#include <mutex>
#include <filesystem>
#include "domain/ExecutionTypes.hpp"

namespace code_validation {

// Runs submitted code. Faults of the code itself come back as error text, never as exceptions.
class CodeRunner {
public:
    virtual ~CodeRunner() = default;
    virtual ExecutionResult run(const std::string& code, const std::filesystem::path& working_dir) = 0;
};

// One interpreter child process per call, killed after `timeout_sec`.
class ProcessCodeRunner : public CodeRunner {
public:
    ProcessCodeRunner(std::string interpreter, int timeout_sec, bool serialize = false,
                      std::filesystem::path scratch_dir = {});

    ExecutionResult run(const std::string& code, const std::filesystem::path& working_dir) override;

private:
    std::string interpreter_;
    int timeout_sec_;
    bool serialize_;
    std::filesystem::path scratch_dir_;
    std::mutex run_mutex_;

    ExecutionResult run_unlocked(const std::string& code, const std::filesystem::path& working_dir);
};

}
