#include <thread>
#include <memory>
#include <fstream>
#include <filesystem>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "sandbox/SandboxServer.hpp"
#include "client/ExecutionClient.hpp"
#include "domain/Errors.hpp"
#include "domain/TreeSearch.hpp"
#include "utils/Ids.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace code_validation;  // NOLINT

// Real server on an ephemeral loopback port, driven through the real client.
class SandboxServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("sandbox_server_test_" + short_hex_id());
        fs::create_directories(dir_);

        SandboxSettings settings;
        settings.upload_root = (dir_ / "uploads").string();

        auto workspace = std::make_shared<SandboxWorkspace>(settings.upload_root);
        auto runner = std::make_shared<ProcessCodeRunner>("python3", 30, false, dir_ / "scratch");
        auto latex = std::make_shared<LatexCompiler>(fake_compiler().string(), 1, 30);
        server_ = std::make_unique<SandboxServer>(settings, workspace, runner, latex);

        port_ = server_->bind("127.0.0.1", 0);
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_->listen_after_bind(); });
        server_->wait_until_ready();

        client_ = std::make_unique<ExecutionClient>("http://127.0.0.1:" + std::to_string(port_) + "/", 30000);
    }

    void TearDown() override {
        if (server_) server_->stop();
        if (thread_.joinable()) thread_.join();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Writes document.pdf plus a log with one warning.
    fs::path fake_compiler() {
        fs::path script = dir_ / "fake-pdflatex";
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "printf '%%PDF-1.4 fake' > document.pdf\n"
            << "printf 'LaTeX Warning: Label(s) may have changed.\\n' > document.log\n";
        out.close();
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
        return script;
    }

    fs::path dir_;
    int port_ = -1;
    std::unique_ptr<SandboxServer> server_;
    std::thread thread_;
    std::unique_ptr<ExecutionClient> client_;
};

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, HealthIsNominal) {
    EXPECT_TRUE(client_->healthy());
    EXPECT_EQ(client_->base_url(), "http://127.0.0.1:" + std::to_string(port_));
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, UploadListAndDownload) {
    ExecutionHandle handle = client_->create_execution({{"model.py", "VALUE = 1\n"}, {"data.csv", "a\n1\n"}});
    EXPECT_THAT(handle.saved_files, ElementsAre("model.py", "data.csv"));

    ExecutionListing listing = client_->list_files(handle.execution_id);
    EXPECT_EQ(listing.stats.total_files, 2u);
    EXPECT_EQ(listing.stats.execution_id, handle.execution_id);
    EXPECT_EQ(listing.directory, handle.directory);

    EXPECT_EQ(client_->get_file(handle.execution_id, "data.csv"), "a\n1\n");
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, ExecuteRunsInsideTheExecution) {
    ExecutionHandle handle = client_->create_execution({{"model.py", "VALUE = 41\n"}});

    std::string code =
        "import os\n"
        "from model import VALUE\n"
        "os.makedirs('test_1/images', exist_ok=True)\n"
        "open('test_1/report.md', 'w').write('# ok ' + str(VALUE + 1))\n";
    ExecutionResult result = client_->execute(code, handle.execution_id);
    EXPECT_THAT(result.error, IsEmpty());
    EXPECT_THAT(result.output, IsEmpty());

    ExecutionListing listing = client_->list_files(handle.execution_id);
    const FileNode* folder = find_directory(listing.structure, "test_1");
    ASSERT_NE(folder, nullptr);
    EXPECT_TRUE(has_file_child(*folder, "report.md"));
    EXPECT_EQ(client_->get_file(handle.execution_id, "test_1/report.md"), "# ok 42");
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, ExecuteReportsFaultsInTheBody) {
    ExecutionResult result = client_->execute("print('out')\nraise RuntimeError('bad')", std::nullopt);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_THAT(result.error, HasSubstr("RuntimeError: bad"));
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, UnknownExecutionIsNotFound) {
    const std::string unknown = "00000000-0000-4000-8000-000000000000";
    EXPECT_THROW(client_->list_files(unknown), NotFound);
    EXPECT_THROW(client_->get_file(unknown, "a.txt"), NotFound);
    EXPECT_THROW(client_->execute("print(1)", unknown), NotFound);
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, MissingFileIsNotFound) {
    ExecutionHandle handle = client_->create_execution({{"a.txt", "a"}});
    EXPECT_THROW(client_->get_file(handle.execution_id, "b.txt"), NotFound);
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, EmptyUploadIsBadRequest) {
    httplib::Client raw("127.0.0.1", port_);
    httplib::MultipartFormDataItems items = {{"other", "x", "", ""}};
    auto res = raw.Post("/create-execution", items);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_THROW(client_->create_execution({}), BadRequest);
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, TraversalIsForbiddenOnBothSides) {
    ExecutionHandle handle = client_->create_execution({{"a.txt", "a"}});
    std::ofstream(dir_ / "uploads" / "secret.txt") << "secret";

    EXPECT_THROW(client_->get_file(handle.execution_id, "../secret.txt"), Forbidden);

    httplib::Client raw("127.0.0.1", port_);
    auto res = raw.Get("/app/uploads/" + handle.execution_id + "/%2E%2E/secret.txt");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_NE(res->body, "secret");
    EXPECT_TRUE(json::parse(res->body).contains("error"));
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, ExecuteWithoutCodeIsBadRequest) {
    httplib::Client raw("127.0.0.1", port_);
    auto res = raw.Post("/execute", R"({"execution_id": "x"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"], "No code provided");
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, LatexSourceCompilesToPdf) {
    PdfDocument pdf = client_->latex_to_pdf("\\documentclass{article}\\begin{document}x\\end{document}",
                                            {{"logo.png", "PNG"}});
    EXPECT_EQ(pdf.bytes, "%PDF-1.4 fake");
    EXPECT_THAT(pdf.warnings, ElementsAre("LaTeX Warning: Label(s) may have changed."));
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, ExistingLatexCompilesNextToItsSource) {
    ExecutionHandle handle = client_->create_execution({{"report.tex", "\\documentclass{article}"}});

    PdfDocument pdf = client_->compile_latex(handle.execution_id, "report.tex");
    EXPECT_EQ(pdf.bytes, "%PDF-1.4 fake");
    EXPECT_TRUE(fs::exists(fs::path(handle.directory) / "document.pdf"));

    EXPECT_THROW(client_->compile_latex(handle.execution_id, "absent.tex"), NotFound);
    EXPECT_THROW(client_->compile_latex(handle.execution_id, "../report.tex"), Forbidden);
}

// NOLINTNEXTLINE
TEST_F(SandboxServerTest, PreflightIsAnswered) {
    httplib::Client raw("127.0.0.1", port_);
    auto res = raw.Options("/execute");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

// Sandbox stand-in whose 200 answers are valid JSON of the wrong shape.
class MalformedSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post("/execute", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"output": "", "error": "", "exit_code": "0"})", "application/json");
        });
        server_.Get("/list-execution-files/abc", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"execution_id": "abc"})", "application/json");
        });
        server_.Post("/create-execution", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("[1, 2, 3]", "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
        client_ = std::make_unique<ExecutionClient>("http://127.0.0.1:" + std::to_string(port_), 5000);
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
    std::unique_ptr<ExecutionClient> client_;
};

// NOLINTNEXTLINE
TEST_F(MalformedSandboxTest, WrongFieldTypeIsExecutionError) {
    try {
        client_->execute("print(1)");
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("execute: malformed response"));
        EXPECT_EQ(e.status_code(), 200);
    }
}

// NOLINTNEXTLINE
TEST_F(MalformedSandboxTest, MissingFieldAndWrongShapeAreExecutionErrors) {
    EXPECT_THROW(client_->list_files("abc"), ExecutionError);
    EXPECT_THROW(client_->create_execution({{"model.py", "x = 1"}}), ExecutionError);
}

// NOLINTNEXTLINE
TEST(ExecutionClientTest, UnreachableSandboxIsTyped) {
    ExecutionClient client("http://127.0.0.1:1", 2000);
    EXPECT_THROW(client.list_files("abc"), SandboxUnreachable);
    EXPECT_FALSE(client.healthy());
}

// NOLINTNEXTLINE
TEST(ExecutionClientTest, PathEncodingKeepsSlashes) {
    EXPECT_EQ(ExecutionClient::encode_path("test_1/my plot.png"), "test_1/my%20plot.png");
    EXPECT_EQ(ExecutionClient::encode_path("a%b"), "a%25b");
}

}  // namespace
