#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "domain/ExecutionTypes.hpp"

namespace cpr { class Response; }

namespace code_validation {

// Typed view of the sandbox's HTTP surface. Every failure is an ExecutionError
// subclass; nothing here retries.
class IExecutionClient {
public:
    virtual ~IExecutionClient() = default;

    virtual ExecutionHandle create_execution(const std::vector<UploadedFile>& files) = 0;
    virtual ExecutionResult execute(const std::string& code, const std::optional<std::string>& execution_id) = 0;
    virtual ExecutionListing list_files(const std::string& execution_id) = 0;
    virtual std::string get_file(const std::string& execution_id, const std::string& path) = 0;
    virtual PdfDocument compile_latex(const std::string& execution_id, const std::string& filename) = 0;
    virtual PdfDocument latex_to_pdf(const std::string& source, const std::vector<UploadedFile>& files) = 0;
};

class ExecutionClient : public IExecutionClient {
public:
    ExecutionClient(std::string base_url, int timeout_ms);

    ExecutionHandle create_execution(const std::vector<UploadedFile>& files) override;
    ExecutionResult execute(const std::string& code, const std::optional<std::string>& execution_id) override;
    ExecutionListing list_files(const std::string& execution_id) override;
    std::string get_file(const std::string& execution_id, const std::string& path) override;
    PdfDocument compile_latex(const std::string& execution_id, const std::string& filename) override;
    PdfDocument latex_to_pdf(const std::string& source, const std::vector<UploadedFile>& files) override;

    // Reads local files and uploads them under their base names.
    ExecutionHandle create_execution_from_paths(const std::vector<std::filesystem::path>& paths);

    // GET /health; false instead of throwing.
    bool healthy() const;

    const std::string& base_url() const { return base_url_; }

    // Throws the ExecutionError subclass matching the response, if any.
    static void raise_for_status(const cpr::Response& r, const std::string& operation);

    // Percent-encodes every byte outside the unreserved set, keeping '/'.
    static std::string encode_path(const std::string& path);

private:
    std::string base_url_;
    int timeout_ms_;
};

}
