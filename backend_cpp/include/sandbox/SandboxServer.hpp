#pragma once
#include <memory>
#include <string>
#include <httplib.h>
#include "config/Settings.hpp"
#include "sandbox/SandboxWorkspace.hpp"
#include "sandbox/CodeRunner.hpp"
#include "sandbox/LatexCompiler.hpp"

namespace code_validation {

// HTTP face of the execution sandbox.
class SandboxServer {
public:
    explicit SandboxServer(const SandboxSettings& settings);
    SandboxServer(const SandboxSettings& settings,
                  std::shared_ptr<SandboxWorkspace> workspace,
                  std::shared_ptr<CodeRunner> runner,
                  std::shared_ptr<LatexCompiler> latex);

    // port 0 = pick any free port. Returns the bound port, or -1.
    int bind(const std::string& host, int port);
    // Blocks until stop().
    bool listen_after_bind();
    // bind + listen on the configured host/port.
    bool run();
    void stop();
    void wait_until_ready() const;

    SandboxWorkspace& workspace() { return *workspace_; }

private:
    SandboxSettings settings_;
    httplib::Server server_;
    std::shared_ptr<SandboxWorkspace> workspace_;
    std::shared_ptr<CodeRunner> runner_;
    std::shared_ptr<LatexCompiler> latex_;

    void setup_routes();

    void handle_execute(const httplib::Request& req, httplib::Response& res);
    void handle_create_execution(const httplib::Request& req, httplib::Response& res);
    void handle_list_files(const httplib::Request& req, httplib::Response& res);
    void handle_get_file(const httplib::Request& req, httplib::Response& res);
    void handle_latex_to_pdf(const httplib::Request& req, httplib::Response& res);
    void handle_compile_existing_latex(const httplib::Request& req, httplib::Response& res);
};

}
