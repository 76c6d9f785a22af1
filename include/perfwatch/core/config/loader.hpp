#pragma once
#include <perfwatch/core/config/app_config.hpp>
#include <string>

namespace PerfWatch {

class ConfigLoader {
public:
    /**
     * @throws std::runtime_error if the file is missing or unparsable
     * @throws ConfigError on a missing required field, wrong type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

} // namespace PerfWatch
