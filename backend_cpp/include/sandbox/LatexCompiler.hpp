#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "domain/ExecutionTypes.hpp"

namespace code_validation {

class LatexCompiler {
public:
    explicit LatexCompiler(std::string compiler = "pdflatex", int passes = 2, int timeout_sec = 120);

    // Writes extra files + document.tex into `directory`, runs the compiler and
    // returns document.pdf whenever it exists, whatever the exit codes said.
    // Throws LatexCompilationError when no PDF was produced.
    LatexResult compile(const std::string& source, const std::filesystem::path& directory,
                        const std::vector<UploadedFile>& extra_files = {});

    // Inserts the utf8 inputenc + T1 fontenc preamble after \documentclass when missing.
    static std::string ensure_utf8_preamble(const std::string& source);

    // Lines mentioning warning/error (case-insensitive), skipping "Package ..." lines.
    static std::vector<std::string> extract_warnings(const std::string& log_content);

private:
    std::string compiler_;
    int passes_;
    int timeout_sec_;
};

}
