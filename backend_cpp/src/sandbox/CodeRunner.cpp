#include "sandbox/CodeRunner.hpp"
#include "utils/SubProcess.hpp"
#include "utils/Ids.hpp"
#include <fstream>
#include <chrono>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;

ProcessCodeRunner::ProcessCodeRunner(std::string interpreter, int timeout_sec, bool serialize, fs::path scratch_dir)
    : interpreter_(std::move(interpreter)), timeout_sec_(timeout_sec), serialize_(serialize),
      scratch_dir_(scratch_dir.empty() ? fs::temp_directory_path() / "code_validation" : std::move(scratch_dir)) {
    fs::create_directories(scratch_dir_);
}

ExecutionResult ProcessCodeRunner::run(const std::string& code, const fs::path& working_dir) {
    if (serialize_) {
        std::lock_guard<std::mutex> lock(run_mutex_);
        return run_unlocked(code, working_dir);
    }
    return run_unlocked(code, working_dir);
}

ExecutionResult ProcessCodeRunner::run_unlocked(const std::string& code, const fs::path& working_dir) {
    ExecutionResult result;
    auto start = std::chrono::steady_clock::now();

    // 1. Script lives outside the working dir so it never shows up in listings
    std::string token = generate_uuid();
    fs::path script = scratch_dir_ / ("exec_" + token + ".py");
    fs::path stderr_file = scratch_dir_ / ("exec_" + token + ".err");

    {
        std::ofstream out(script, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.error = "ERROR: Cannot write script file " + script.string();
            result.exit_code = -1;
            return result;
        }
        out << code;
    }

    // 2. Execute
    ProcessOptions opts;
    opts.working_dir = working_dir.string();
    opts.timeout_sec = timeout_sec_;
    opts.merge_stderr = false;
    opts.stderr_capture = stderr_file.string();

    try {
        auto proc = SubProcess::run({interpreter_, "-u", script.string()}, opts);
        result.output = std::move(proc.output);
        result.error = std::move(proc.error);
        result.exit_code = proc.exit_code;
        result.timed_out = proc.timed_out;
    } catch (const std::exception& e) {
        result.error = std::string("ERROR: Failed to start interpreter: ") + e.what();
        result.exit_code = -1;
    }

    // 3. Cleanup
    std::error_code ec;
    fs::remove(script, ec);
    fs::remove(stderr_file, ec);

    // 4. Make every fault visible in the error text
    if (result.timed_out) {
        if (!result.error.empty() && result.error.back() != '\n') result.error += "\n";
        result.error += "Execution timed out after " + std::to_string(timeout_sec_) + " seconds";
    } else if (result.exit_code != 0 && result.error.empty()) {
        result.error = "Process exited with code " + std::to_string(result.exit_code);
    }

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("🐍 Sandbox: Executed {} bytes in {} -> exit {} ({:.1f} ms)",
                 code.size(), working_dir.string(), result.exit_code, ms);
    return result;
}

}
