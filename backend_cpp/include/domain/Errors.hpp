#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace code_validation {

// Root of everything the validation pipeline throws on purpose.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A sandbox request that did not succeed. status_code is 0 when no HTTP
// response was received at all.
class ExecutionError : public ValidationError {
public:
    ExecutionError(const std::string& msg, int status_code = 0, std::string body = "")
        : ValidationError(msg), status_code_(status_code), body_(std::move(body)) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    int status_code_;
    std::string body_;
};

class SandboxUnreachable : public ExecutionError {
public:
    explicit SandboxUnreachable(const std::string& msg) : ExecutionError(msg, 0) {}
};

class NotFound : public ExecutionError {
public:
    explicit NotFound(const std::string& msg, std::string body = "")
        : ExecutionError(msg, 404, std::move(body)) {}
};

class BadRequest : public ExecutionError {
public:
    explicit BadRequest(const std::string& msg, std::string body = "")
        : ExecutionError(msg, 400, std::move(body)) {}
};

class Forbidden : public ExecutionError {
public:
    explicit Forbidden(const std::string& msg, std::string body = "")
        : ExecutionError(msg, 403, std::move(body)) {}
};

class NoCodeGenerated : public ValidationError {
public:
    explicit NoCodeGenerated(const std::string& msg) : ValidationError(msg) {}
};

class RetriesExhausted : public ValidationError {
public:
    explicit RetriesExhausted(const std::string& msg) : ValidationError(msg) {}
};

class LLMError : public ValidationError {
public:
    explicit LLMError(const std::string& msg) : ValidationError(msg) {}
};

class LatexCompilationError : public ValidationError {
public:
    explicit LatexCompilationError(const std::string& msg) : ValidationError(msg) {}
};

class ConfigurationError : public ValidationError {
public:
    explicit ConfigurationError(const std::string& msg) : ValidationError(msg) {}
};

class TestExecutionError : public ValidationError {
public:
    explicit TestExecutionError(const std::string& msg) : ValidationError(msg) {}
};

}
