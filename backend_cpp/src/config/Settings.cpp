#include "config/Settings.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace code_validation {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

int env_int(const char* name, int fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        size_t pos = 0;
        int parsed = std::stoi(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(v);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(std::string("Environment variable ") + name + " is not an integer: " + v);
    }
}

bool env_bool(const char* name, bool fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    throw ConfigurationError(std::string("Environment variable ") + name + " is not a boolean: " + v);
}

void env_string(const char* name, std::string& target) {
    if (const char* v = env(name)) target = v;
}

}

Settings Settings::load(const std::string& path) {
    std::vector<std::string> search_paths;
    if (!path.empty()) {
        search_paths.push_back(path);
    } else {
        search_paths = {"code_validation.json", "config/code_validation.json", "../code_validation.json"};
    }

    Settings settings;
    bool loaded = false;
    for (const auto& candidate : search_paths) {
        std::ifstream f(candidate);
        if (!f.is_open()) continue;

        try {
            settings = from_json(json::parse(f));
        } catch (const json::exception& e) {
            throw ConfigurationError("Failed to parse " + candidate + ": " + e.what());
        }
        spdlog::info("⚙️ Configuration loaded from {}", candidate);
        loaded = true;
        break;
    }

    if (!loaded) {
        if (!path.empty()) throw ConfigurationError("Configuration file not found: " + path);
        spdlog::warn("⚠️ No configuration file found. Using defaults.");
    }

    settings.apply_env_overrides();
    settings.validate();
    return settings;
}

Settings Settings::from_json(const json& j) {
    Settings s;
    try {
        auto sandbox = j.value("sandbox", json::object());
        s.sandbox.host = sandbox.value("host", s.sandbox.host);
        s.sandbox.port = sandbox.value("port", s.sandbox.port);
        s.sandbox.upload_root = sandbox.value("upload_root", s.sandbox.upload_root);
        s.sandbox.python_binary = sandbox.value("python_binary", s.sandbox.python_binary);
        s.sandbox.latex_binary = sandbox.value("latex_binary", s.sandbox.latex_binary);
        s.sandbox.execute_timeout_seconds = sandbox.value("execute_timeout_seconds", s.sandbox.execute_timeout_seconds);
        s.sandbox.serialize_execute = sandbox.value("serialize_execute", s.sandbox.serialize_execute);
        s.sandbox.max_upload_bytes = sandbox.value("max_upload_bytes", s.sandbox.max_upload_bytes);

        auto execution = j.value("execution", json::object());
        s.execution.service_url = execution.value("service_url", s.execution.service_url);
        s.execution.request_timeout_ms = execution.value("request_timeout_ms", s.execution.request_timeout_ms);
        s.execution.max_request_attempts = execution.value("max_request_attempts", s.execution.max_request_attempts);

        auto loop = j.value("loop", json::object());
        s.loop.max_retries = loop.value("max_retries", s.loop.max_retries);
        s.loop.output_is_failure = loop.value("output_is_failure", s.loop.output_is_failure);

        auto llm = j.value("llm", json::object());
        s.llm.bridge_url = llm.value("bridge_url", s.llm.bridge_url);
        s.llm.api_key = llm.value("api_key", s.llm.api_key);
        s.llm.model = llm.value("model", s.llm.model);
        s.llm.timeout_ms = llm.value("timeout_ms", s.llm.timeout_ms);
        s.llm.max_retries = llm.value("max_retries", s.llm.max_retries);
        s.llm.temperature = llm.value("temperature", s.llm.temperature);

        auto storage = j.value("storage", json::object());
        s.storage.base_upload_folder = storage.value("base_upload_folder", s.storage.base_upload_folder);

        auto conversation = j.value("conversation", json::object());
        s.conversation.ttl_seconds = conversation.value("ttl_seconds", s.conversation.ttl_seconds);
        s.conversation.max_entries = conversation.value("max_entries", s.conversation.max_entries);

        auto logging = j.value("logging", json::object());
        s.logging.level = logging.value("level", s.logging.level);
        s.logging.log_dir = logging.value("log_dir", s.logging.log_dir);
        s.logging.interaction_dir = logging.value("interaction_dir", s.logging.interaction_dir);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }
    return s;
}

json Settings::to_json() const {
    return {
        {"sandbox", {
            {"host", sandbox.host},
            {"port", sandbox.port},
            {"upload_root", sandbox.upload_root},
            {"python_binary", sandbox.python_binary},
            {"latex_binary", sandbox.latex_binary},
            {"execute_timeout_seconds", sandbox.execute_timeout_seconds},
            {"serialize_execute", sandbox.serialize_execute},
            {"max_upload_bytes", sandbox.max_upload_bytes}
        }},
        {"execution", {
            {"service_url", execution.service_url},
            {"request_timeout_ms", execution.request_timeout_ms},
            {"max_request_attempts", execution.max_request_attempts}
        }},
        {"loop", {
            {"max_retries", loop.max_retries},
            {"output_is_failure", loop.output_is_failure}
        }},
        {"llm", {
            {"bridge_url", llm.bridge_url},
            {"model", llm.model},
            {"timeout_ms", llm.timeout_ms},
            {"max_retries", llm.max_retries},
            {"temperature", llm.temperature}
        }},
        {"storage", {{"base_upload_folder", storage.base_upload_folder}}},
        {"conversation", {
            {"ttl_seconds", conversation.ttl_seconds},
            {"max_entries", conversation.max_entries}
        }},
        {"logging", {
            {"level", logging.level},
            {"log_dir", logging.log_dir},
            {"interaction_dir", logging.interaction_dir}
        }}
    };
}

void Settings::apply_env_overrides() {
    sandbox.port = env_int("SANDBOX_PORT", sandbox.port);
    env_string("SANDBOX_UPLOAD_ROOT", sandbox.upload_root);
    env_string("SANDBOX_PYTHON", sandbox.python_binary);
    env_string("SANDBOX_LATEX", sandbox.latex_binary);
    sandbox.serialize_execute = env_bool("SANDBOX_SERIALIZE_EXECUTE", sandbox.serialize_execute);

    env_string("EXECUTION_SERVICE_URL", execution.service_url);
    execution.request_timeout_ms = env_int("EXECUTION_TIMEOUT_MS", execution.request_timeout_ms);
    execution.max_request_attempts = env_int("EXECUTION_MAX_RETRIES", execution.max_request_attempts);

    loop.max_retries = env_int("LOOP_MAX_RETRIES", loop.max_retries);

    env_string("LLM_BRIDGE_URL", llm.bridge_url);
    env_string("LLM_API_KEY", llm.api_key);
    llm.timeout_ms = env_int("LLM_TIMEOUT_MS", llm.timeout_ms);
    llm.max_retries = env_int("LLM_MAX_RETRIES", llm.max_retries);

    env_string("BASE_UPLOAD_FOLDER", storage.base_upload_folder);

    env_string("LOG_LEVEL", logging.level);
    env_string("LOG_DIR", logging.log_dir);
    env_string("INTERACTION_LOGS_DIR", logging.interaction_dir);
}

void Settings::validate() const {
    if (sandbox.port <= 0 || sandbox.port > 65535) {
        throw ConfigurationError("sandbox.port out of range: " + std::to_string(sandbox.port));
    }
    if (sandbox.execute_timeout_seconds <= 0) throw ConfigurationError("sandbox.execute_timeout_seconds must be positive");
    if (execution.max_request_attempts < 1) throw ConfigurationError("execution.max_request_attempts must be >= 1");
    if (execution.request_timeout_ms <= 0) throw ConfigurationError("execution.request_timeout_ms must be positive");
    if (loop.max_retries < 1) throw ConfigurationError("loop.max_retries must be >= 1");
    if (llm.max_retries < 1) throw ConfigurationError("llm.max_retries must be >= 1");
    if (execution.service_url.empty()) throw ConfigurationError("execution.service_url is empty");
    if (sandbox.upload_root.empty()) throw ConfigurationError("sandbox.upload_root is empty");
}

void Settings::ensure_directories() const {
    for (const auto& dir : {sandbox.upload_root, storage.base_upload_folder, logging.log_dir, logging.interaction_dir}) {
        if (dir.empty()) continue;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw ConfigurationError("Cannot create directory " + dir + ": " + ec.message());
    }
}

}
