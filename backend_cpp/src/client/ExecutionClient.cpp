#include "client/ExecutionClient.hpp"
#include "domain/Errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdio>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string error_message(const cpr::Response& r) {
    json body = json::parse(r.text, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return r.text.substr(0, 200);
}

json parse_body(const cpr::Response& r, const std::string& operation) {
    json body = json::parse(r.text, nullptr, false);
    if (body.is_discarded()) {
        throw ExecutionError(operation + ": response is not valid JSON", (int)r.status_code, r.text);
    }
    return body;
}

template <typename T>
T decode_body(const cpr::Response& r, const std::string& operation) {
    json body = parse_body(r, operation);
    try {
        return body.get<T>();
    } catch (const json::exception& e) {
        throw ExecutionError(operation + ": malformed response: " + e.what(), (int)r.status_code, r.text);
    }
}

std::vector<std::string> split_warnings(const std::string& header) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < header.size()) {
        size_t end = header.find("; ", start);
        if (end == std::string::npos) end = header.size();
        if (end > start) out.push_back(header.substr(start, end - start));
        start = end + 2;
    }
    return out;
}

PdfDocument to_pdf(const cpr::Response& r) {
    PdfDocument doc;
    doc.bytes = r.text;
    auto it = r.header.find("X-LaTeX-Warnings");
    if (it != r.header.end()) doc.warnings = split_warnings(it->second);
    return doc;
}

std::vector<cpr::Part> file_parts(const std::string& prefix, bool numbered, const std::vector<UploadedFile>& files) {
    std::vector<cpr::Part> parts;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& f = files[i];
        std::string field = numbered ? prefix + std::to_string(i) : prefix;
        parts.emplace_back(field, cpr::Buffer{f.content.begin(), f.content.end(), fs::path(f.filename)});
    }
    return parts;
}

}

ExecutionClient::ExecutionClient(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

void ExecutionClient::raise_for_status(const cpr::Response& r, const std::string& operation) {
    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) {
        throw SandboxUnreachable(operation + ": " + (r.error.message.empty() ? "no response" : r.error.message));
    }
    if (r.status_code >= 200 && r.status_code < 300) return;

    std::string msg = operation + ": " + error_message(r);
    switch (r.status_code) {
        case 400: throw BadRequest(msg, r.text);
        case 403: throw Forbidden(msg, r.text);
        case 404: throw NotFound(msg, r.text);
        default:  throw ExecutionError(msg, (int)r.status_code, r.text);
    }
}

std::string ExecutionClient::encode_path(const std::string& path) {
    std::string out;
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += (char)c;
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

ExecutionHandle ExecutionClient::create_execution(const std::vector<UploadedFile>& files) {
    if (files.empty()) throw BadRequest("create_execution: no files provided");

    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/create-execution"});
    session.SetTimeout(cpr::Timeout{timeout_ms_});
    session.SetMultipart(cpr::Multipart(file_parts("files", false, files)));

    cpr::Response r = session.Post();
    raise_for_status(r, "create_execution");

    ExecutionHandle handle = decode_body<ExecutionHandle>(r, "create_execution");
    spdlog::info("📦 Execution {} created ({} files)", handle.execution_id, handle.saved_files.size());
    return handle;
}

ExecutionHandle ExecutionClient::create_execution_from_paths(const std::vector<fs::path>& paths) {
    std::vector<UploadedFile> files;
    for (const auto& p : paths) {
        std::ifstream f(p, std::ios::binary);
        if (!f.is_open()) throw BadRequest("create_execution: cannot read " + p.string());
        std::stringstream ss;
        ss << f.rdbuf();
        files.push_back({p.filename().string(), ss.str()});
    }
    return create_execution(files);
}

ExecutionResult ExecutionClient::execute(const std::string& code, const std::optional<std::string>& execution_id) {
    json payload = {{"code", code}};
    if (execution_id) payload["execution_id"] = *execution_id;

    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/execute"});
    session.SetTimeout(cpr::Timeout{timeout_ms_});
    session.SetHeader(cpr::Header{{"Content-Type", "application/json"}});
    session.SetBody(cpr::Body{payload.dump()});

    cpr::Response r = session.Post();
    raise_for_status(r, "execute");
    return decode_body<ExecutionResult>(r, "execute");
}

ExecutionListing ExecutionClient::list_files(const std::string& execution_id) {
    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/list-execution-files/" + encode_path(execution_id)});
    session.SetTimeout(cpr::Timeout{timeout_ms_});

    cpr::Response r = session.Get();
    raise_for_status(r, "list_files");
    return decode_body<ExecutionListing>(r, "list_files");
}

std::string ExecutionClient::get_file(const std::string& execution_id, const std::string& path) {
    // Dot segments would be collapsed by the URL layer before reaching the sandbox.
    std::stringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "..") throw Forbidden("get_file: path escapes the execution: " + path);
    }
    if (!path.empty() && path.front() == '/') throw Forbidden("get_file: absolute path: " + path);

    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/app/uploads/" + encode_path(execution_id) + "/" + encode_path(path)});
    session.SetTimeout(cpr::Timeout{timeout_ms_});

    cpr::Response r = session.Get();
    raise_for_status(r, "get_file");
    return r.text;
}

PdfDocument ExecutionClient::compile_latex(const std::string& execution_id, const std::string& filename) {
    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/compile-existing-latex"});
    session.SetTimeout(cpr::Timeout{timeout_ms_});
    session.SetHeader(cpr::Header{{"Content-Type", "application/json"}});
    session.SetBody(cpr::Body{json{{"execution_id", execution_id}, {"filename", filename}}.dump()});

    cpr::Response r = session.Post();
    raise_for_status(r, "compile_latex");
    return to_pdf(r);
}

PdfDocument ExecutionClient::latex_to_pdf(const std::string& source, const std::vector<UploadedFile>& files) {
    std::vector<cpr::Part> parts = file_parts("files_", true, files);
    parts.emplace_back("latex", source);

    cpr::Session session;
    session.SetUrl(cpr::Url{base_url_ + "/latex-to-pdf"});
    session.SetTimeout(cpr::Timeout{timeout_ms_});
    session.SetMultipart(cpr::Multipart(parts));

    cpr::Response r = session.Post();
    raise_for_status(r, "latex_to_pdf");
    return to_pdf(r);
}

bool ExecutionClient::healthy() const {
    cpr::Response r = cpr::Get(cpr::Url{base_url_ + "/health"}, cpr::Timeout{5000});
    if (r.status_code != 200) return false;
    json body = json::parse(r.text, nullptr, false);
    return !body.is_discarded() && body.value("status", "") == "nominal";
}

}
