#include "utils/Logging.hpp"
#include <memory>
#include <vector>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace code_validation {

namespace fs = std::filesystem;

void setup_logging(const Settings& settings, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    try {
        fs::create_directories(settings.logging.log_dir);
        auto file_path = (fs::path(settings.logging.log_dir) / (name + ".log")).string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, 5 * 1024 * 1024, 3));
    } catch (const std::exception& e) {
        // Console-only is still usable
        spdlog::warn("⚠️ File logging disabled: {}", e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(settings.logging.level));
    spdlog::flush_on(spdlog::level::warn);
}

}
