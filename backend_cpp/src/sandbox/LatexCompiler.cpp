#include "sandbox/LatexCompiler.hpp"
#include "sandbox/SandboxWorkspace.hpp"
#include "domain/Errors.hpp"
#include "utils/SubProcess.hpp"
#include <regex>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

}

LatexCompiler::LatexCompiler(std::string compiler, int passes, int timeout_sec)
    : compiler_(std::move(compiler)), passes_(passes), timeout_sec_(timeout_sec) {}

std::string LatexCompiler::ensure_utf8_preamble(const std::string& source) {
    static const std::regex inputenc_utf8(R"(\\usepackage\s*\[[^\]]*utf8[^\]]*\]\s*\{inputenc\})");
    if (std::regex_search(source, inputenc_utf8)) return source;

    // \documentclass[opts]{class}
    static const std::regex docclass(R"(\\documentclass\s*(\[[^\]]*\])?\s*\{[^}]*\})");
    std::smatch match;
    if (!std::regex_search(source, match, docclass)) return source;

    size_t insert_at = (size_t)(match.position(0) + match.length(0));
    return source.substr(0, insert_at) +
           "\n\\usepackage[utf8]{inputenc}\n\\usepackage[T1]{fontenc}" +
           source.substr(insert_at);
}

std::vector<std::string> LatexCompiler::extract_warnings(const std::string& log_content) {
    std::vector<std::string> warnings;
    std::istringstream in(log_content);
    std::string line;
    while (std::getline(in, line)) {
        std::string stripped = trim(line);
        if (stripped.rfind("Package", 0) == 0) continue;
        std::string lower = to_lower(stripped);
        if (lower.find("warning") != std::string::npos || lower.find("error") != std::string::npos) {
            warnings.push_back(stripped);
        }
    }
    return warnings;
}

LatexResult LatexCompiler::compile(const std::string& source, const fs::path& directory,
                                   const std::vector<UploadedFile>& extra_files) {
    fs::create_directories(directory);

    // 1. Support files (images, .bib, ...)
    auto saved = SandboxWorkspace::save_files(directory, extra_files);
    spdlog::debug("📎 LaTeX support files: {}", saved.size());

    // 2. document.tex with UTF-8 preamble
    fs::path tex_file = directory / "document.tex";
    {
        std::ofstream out(tex_file, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throw LatexCompilationError("Cannot write " + tex_file.string());
        out << ensure_utf8_preamble(source);
    }

    // 3. Compile twice so cross references resolve. Only a PDF from this run counts.
    LatexResult result;
    std::string transcript;
    fs::path log_file = directory / "document.log";
    fs::path pdf_path = directory / "document.pdf";
    std::error_code ec;
    fs::remove(pdf_path, ec);
    fs::remove(log_file, ec);

    for (int pass = 0; pass < passes_; ++pass) {
        spdlog::debug("📄 LaTeX compilation pass {}", pass + 1);

        ProcessOptions opts;
        opts.working_dir = directory.string();
        opts.timeout_sec = timeout_sec_;
        try {
            auto proc = SubProcess::run({compiler_, "-interaction=nonstopmode", "-file-line-error", "document.tex"}, opts);
            transcript += proc.output;
            if (!proc.success) {
                spdlog::warn("⚠️ LaTeX pass {} exited with code {}", pass + 1, proc.exit_code);
            }
        } catch (const std::exception& e) {
            transcript += std::string("ERROR: ") + e.what() + "\n";
            spdlog::error("❌ LaTeX pass {} could not start: {}", pass + 1, e.what());
        }

        if (fs::exists(log_file)) {
            std::ifstream f(log_file, std::ios::binary);
            std::stringstream ss;
            ss << f.rdbuf();
            auto found = extract_warnings(ss.str());
            result.warnings.insert(result.warnings.end(), found.begin(), found.end());
        }
    }

    // 4. The artifact wins over the exit code
    if (fs::exists(pdf_path)) {
        result.pdf_path = pdf_path.string();
        spdlog::info("✅ PDF generated at {} ({} warnings)", result.pdf_path, result.warnings.size());
        return result;
    }

    throw LatexCompilationError("PDF file was not generated:\n" + transcript);
}

}
