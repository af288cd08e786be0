#pragma once
#include <string>
#include <array>
#include <vector>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <sys/wait.h>
#include "utils/Scrubber.hpp"

namespace code_validation {

struct ProcessResult {
    std::string output;
    std::string error;
    int exit_code = 0;
    bool success = false;
    bool timed_out = false;
};

struct ProcessOptions {
    std::string working_dir;      // empty = inherit
    int timeout_sec = 0;          // 0 = no limit
    bool merge_stderr = true;     // false = stderr captured separately into ProcessResult::error
    std::string stderr_capture;   // scratch file for the separate stderr stream
};

class SubProcess {
public:
    // exit code of timeout(1) when the child was killed
    static constexpr int TIMEOUT_EXIT_CODE = 124;

    // Runs argv through /bin/sh. Every argument is shell-quoted.
    static ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& opts = {}) {
        std::string cmd;
        if (!opts.working_dir.empty()) cmd += "cd " + shell_quote(opts.working_dir) + " && ";
        if (opts.timeout_sec > 0) cmd += "timeout -k 5 " + std::to_string(opts.timeout_sec) + " ";
        for (size_t i = 0; i < argv.size(); ++i) {
            if (i) cmd += " ";
            cmd += shell_quote(argv[i]);
        }

        // The child never reads from our stdin.
        cmd += " </dev/null";

        bool separate = !opts.merge_stderr && !opts.stderr_capture.empty();
        cmd += separate ? " 2>" + shell_quote(opts.stderr_capture) : " 2>&1";

        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) throw std::runtime_error("popen() failed for: " + cmd);

        std::array<char, 4096> buffer;
        std::string result;
        size_t n;
        while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
            result.append(buffer.data(), n);
        }

        int status = pclose(pipe);
        int rc = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

        ProcessResult out;
        out.output = std::move(result);
        out.exit_code = rc;
        out.success = rc == 0;
        out.timed_out = opts.timeout_sec > 0 && (rc == TIMEOUT_EXIT_CODE || rc == 128 + 9);

        if (separate) {
            std::ifstream err(opts.stderr_capture, std::ios::binary);
            std::stringstream ss;
            ss << err.rdbuf();
            out.error = ss.str();
            std::error_code ec;
            std::filesystem::remove(opts.stderr_capture, ec);
        }
        return out;
    }
};

}
