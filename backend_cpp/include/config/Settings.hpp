#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace code_validation {

struct SandboxSettings {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::string upload_root = "data/uploads";
    std::string python_binary = "python3";
    std::string latex_binary = "pdflatex";
    int execute_timeout_seconds = 300;
    bool serialize_execute = false;
    size_t max_upload_bytes = 32ull * 1024 * 1024;
};

struct ExecutionSettings {
    std::string service_url = "http://127.0.0.1:5000";
    int request_timeout_ms = 310000;
    int max_request_attempts = 3;
};

struct LoopSettings {
    int max_retries = 3;
    bool output_is_failure = true;
};

struct LLMSettings {
    std::string bridge_url = "http://127.0.0.1:5001/bridge/generate";
    std::string api_key;
    std::string model;
    int timeout_ms = 180000;
    int max_retries = 3;
    double temperature = 0.0;
};

struct StorageSettings {
    std::string base_upload_folder = "data/validations";
};

struct ConversationSettings {
    int ttl_seconds = 24 * 3600;
    size_t max_entries = 256;
};

struct LoggingSettings {
    std::string level = "info";
    std::string log_dir = "data/logs";
    std::string interaction_dir = "data/logs/interactions";
};

class Settings {
public:
    SandboxSettings sandbox;
    ExecutionSettings execution;
    LoopSettings loop;
    LLMSettings llm;
    StorageSettings storage;
    ConversationSettings conversation;
    LoggingSettings logging;

    // Loads `path`, or the first config found on the default search paths when
    // `path` is empty. Missing file = defaults. Environment variables win over the file.
    static Settings load(const std::string& path = "");

    static Settings from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    void apply_env_overrides();
    void validate() const;
    void ensure_directories() const;
};

}
