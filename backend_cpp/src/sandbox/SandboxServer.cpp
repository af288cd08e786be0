#include "sandbox/SandboxServer.hpp"
#include "domain/Errors.hpp"
#include "utils/Ids.hpp"
#include "utils/Scrubber.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const size_t MAX_WARNING_HEADERS = 5;

void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

// Header values must stay on one line.
std::string warnings_header(const std::vector<std::string>& warnings) {
    std::string out;
    for (size_t i = 0; i < warnings.size() && i < MAX_WARNING_HEADERS; ++i) {
        if (i > 0) out += "; ";
        out += warnings[i];
    }
    std::string scrubbed = scrub_json_string(out);
    for (char& c : scrubbed) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return scrubbed;
}

std::string read_binary(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw LatexCompilationError("Cannot read " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void send_pdf(httplib::Response& res, const LatexResult& result, const std::string& download_name) {
    res.set_content(read_binary(result.pdf_path), "application/pdf");
    res.set_header("Content-Disposition", "attachment; filename=\"" + download_name + "\"");
    if (!result.warnings.empty()) {
        res.set_header("X-LaTeX-Warnings", warnings_header(result.warnings));
    }
}

// Removes a per-request scratch directory on scope exit.
struct ScratchDirectory {
    fs::path path;
    explicit ScratchDirectory(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) spdlog::warn("⚠️ Could not remove scratch dir {}: {}", path.string(), ec.message());
    }
};

// Maps typed errors onto status codes. Anything unexpected is a 500.
template<typename Fn>
void guarded(const char* route, httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const NotFound& e) {
        spdlog::warn("🔍 {}: {}", route, e.what());
        send_error(res, 404, e.what());
    } catch (const Forbidden& e) {
        spdlog::warn("🛡️ {}: {}", route, e.what());
        send_error(res, 403, e.what());
    } catch (const BadRequest& e) {
        spdlog::warn("⚠️ {}: {}", route, e.what());
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("❌ {} failed: {}", route, e.what());
        send_error(res, 500, e.what());
    }
}

}

SandboxServer::SandboxServer(const SandboxSettings& settings)
    : SandboxServer(settings,
                    std::make_shared<SandboxWorkspace>(settings.upload_root),
                    std::make_shared<ProcessCodeRunner>(settings.python_binary,
                                                        settings.execute_timeout_seconds,
                                                        settings.serialize_execute),
                    std::make_shared<LatexCompiler>(settings.latex_binary)) {}

SandboxServer::SandboxServer(const SandboxSettings& settings,
                             std::shared_ptr<SandboxWorkspace> workspace,
                             std::shared_ptr<CodeRunner> runner,
                             std::shared_ptr<LatexCompiler> latex)
    : settings_(settings), workspace_(std::move(workspace)),
      runner_(std::move(runner)), latex_(std::move(latex)) {
    server_.set_payload_max_length(settings_.max_upload_bytes);
    setup_routes();
}

int SandboxServer::bind(const std::string& host, int port) {
    if (port == 0) return server_.bind_to_any_port(host);
    return server_.bind_to_port(host, port) ? port : -1;
}

bool SandboxServer::listen_after_bind() {
    return server_.listen_after_bind();
}

bool SandboxServer::run() {
    int port = bind(settings_.host, settings_.port);
    if (port < 0) {
        spdlog::critical("🔥 Sandbox could not bind {}:{}", settings_.host, settings_.port);
        return false;
    }
    spdlog::info("🚀 Execution sandbox listening on {}:{} (uploads: {})",
                 settings_.host, port, workspace_->upload_root().string());
    return listen_after_bind();
}

void SandboxServer::stop() {
    server_.stop();
}

void SandboxServer::wait_until_ready() const {
    server_.wait_until_ready();
}

void SandboxServer::setup_routes() {
    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });
    server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

    server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) { handle_execute(req, res); });
    server_.Post("/create-execution", [this](const httplib::Request& req, httplib::Response& res) { handle_create_execution(req, res); });
    server_.Get("/list-execution-files/:execution_id", [this](const httplib::Request& req, httplib::Response& res) { handle_list_files(req, res); });
    server_.Get(R"(/app/uploads/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) { handle_get_file(req, res); });
    server_.Post("/latex-to-pdf", [this](const httplib::Request& req, httplib::Response& res) { handle_latex_to_pdf(req, res); });
    server_.Post("/compile-existing-latex", [this](const httplib::Request& req, httplib::Response& res) { handle_compile_existing_latex(req, res); });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status": "nominal"})", "application/json");
    });
}

void SandboxServer::handle_execute(const httplib::Request& req, httplib::Response& res) {
    guarded("/execute", res, [&]() {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) throw BadRequest("Request body must be a JSON object");
        if (!body.contains("code") || !body["code"].is_string()) throw BadRequest("No code provided");

        std::string code = body["code"].get<std::string>();

        // 1. Optional execution directory becomes the working directory
        fs::path working_dir;
        if (body.contains("execution_id") && body["execution_id"].is_string()) {
            std::string execution_id = body["execution_id"].get<std::string>();
            auto dir = workspace_->resolve_execution(execution_id);
            if (!dir) throw NotFound("Execution not found: " + execution_id);
            working_dir = *dir;
        }

        // 2. Run; faults of the code come back inside the result
        ExecutionResult result = runner_->run(code, working_dir);
        res.set_content(json(result).dump(), "application/json");
    });
}

void SandboxServer::handle_create_execution(const httplib::Request& req, httplib::Response& res) {
    guarded("/create-execution", res, [&]() {
        if (!req.is_multipart_form_data() || !req.has_file("files")) throw BadRequest("No files provided");

        std::vector<UploadedFile> uploads;
        for (const auto& part : req.get_file_values("files")) {
            uploads.push_back({part.filename, part.content});
        }

        ExecutionHandle handle = workspace_->create_execution(uploads);
        spdlog::info("📦 Created execution {} with {} files", handle.execution_id, handle.saved_files.size());
        res.set_content(json(handle).dump(), "application/json");
    });
}

void SandboxServer::handle_list_files(const httplib::Request& req, httplib::Response& res) {
    guarded("/list-execution-files", res, [&]() {
        ExecutionListing listing = workspace_->list_files(req.path_params.at("execution_id"));
        res.set_content(json(listing).dump(), "application/json");
    });
}

void SandboxServer::handle_get_file(const httplib::Request& req, httplib::Response& res) {
    guarded("/app/uploads", res, [&]() {
        std::string execution_id = req.matches[1];
        std::string relative_path = req.matches[2];
        std::string content = workspace_->get_file(execution_id, relative_path);
        res.set_content(content, "application/octet-stream");
    });
}

void SandboxServer::handle_latex_to_pdf(const httplib::Request& req, httplib::Response& res) {
    guarded("/latex-to-pdf", res, [&]() {
        if (!req.is_multipart_form_data() || !req.has_file("latex")) throw BadRequest("No LaTeX content provided");

        std::string source = req.get_file_value("latex").content;
        if (source.empty()) throw BadRequest("No LaTeX content provided");

        // Support files arrive as files_0, files_1, ...
        std::vector<UploadedFile> extras;
        for (const auto& entry : req.files) {
            if (entry.first.rfind("files_", 0) != 0) continue;
            extras.push_back({entry.second.filename, entry.second.content});
        }

        ScratchDirectory scratch(fs::temp_directory_path() / ("latex_" + generate_uuid()));
        LatexResult result = latex_->compile(source, scratch.path, extras);
        send_pdf(res, result, "document.pdf");
    });
}

void SandboxServer::handle_compile_existing_latex(const httplib::Request& req, httplib::Response& res) {
    guarded("/compile-existing-latex", res, [&]() {
        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) throw BadRequest("Request body must be a JSON object");

        std::string execution_id = body.value("execution_id", "");
        std::string filename = body.value("filename", "");
        if (execution_id.empty() || filename.empty()) throw BadRequest("Missing execution_id or filename");

        // 1. Locate the .tex inside the execution
        auto dir = workspace_->resolve_execution(execution_id);
        if (!dir) throw NotFound("Execution not found: " + execution_id);

        fs::path tex_path = SandboxWorkspace::resolve_inside(*dir, filename);
        if (tex_path.extension() != ".tex" || !fs::is_regular_file(tex_path)) throw NotFound("LaTeX file not found: " + filename);

        // 2. Compile next to it so relative includes resolve
        std::string source = read_binary(tex_path);
        LatexResult result = latex_->compile(source, tex_path.parent_path());
        spdlog::info("📄 Compiled {} in execution {}", filename, execution_id);
        send_pdf(res, result, secure_filename(tex_path.stem().string() + ".pdf"));
    });
}

}
