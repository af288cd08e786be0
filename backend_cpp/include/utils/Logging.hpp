#pragma once
#include <string>
#include "config/Settings.hpp"

namespace code_validation {

// Installs the process-wide spdlog logger: colour console + rotating file under
// settings.logging.log_dir, named `<name>.log`.
void setup_logging(const Settings& settings, const std::string& name);

}
