#pragma once

#include <cstdint>
#include <string>

#include "devicehost/config/config.hpp"

namespace devicehost::log {

// Log configuration
class LogConfig : public config::ClonableConfigurationProperties<LogConfig> {
public:
    // Log level enumeration
    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        FATAL = 5
    };

    // Console output configuration
    struct ConsoleConfig {
        bool enabled = true;
        std::string pattern =
            "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    // File output configuration
    struct FileConfig {
        bool enabled = false;
        std::string log_file = "logs/devicehost.log";
        int64_t max_file_size = 10485760;  // 10MB
        int max_files = 5;
        std::string pattern =
            "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    // Configuration data
    LogLevel global_level = LogLevel::INFO;
    ConsoleConfig console;
    FileConfig file;

    // ConfigurationProperties interface implementation
    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "log"; }

    // Helper methods for string/enum conversion
    static LogLevel level_from_string(const std::string& level_str);
    static std::string level_to_string(LogLevel level);
};

}  // namespace devicehost::log
