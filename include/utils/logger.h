#pragma once

#include <string>
#include <cstdint>

namespace subvault {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void setCategory(const std::string& category);
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    
    static void flush();
    static void rotate();
    
    static uint64_t getErrorCount();
    static std::string getLogPath();
    
    static void setAllowSensitiveLogging(bool allow);
    
    // Hotkeys and seeds are shortened or masked unless sensitive logging is enabled
    static std::string redactAddress(const std::string& address);
};

#define LOG_TRACE(msg) do { if (subvault::utils::Logger::getLevel() <= subvault::utils::LogLevel::TRACE) subvault::utils::Logger::trace(msg); } while(0)
#define LOG_DEBUG(msg) do { if (subvault::utils::Logger::getLevel() <= subvault::utils::LogLevel::DEBUG) subvault::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) subvault::utils::Logger::info(msg)
#define LOG_WARN(msg) subvault::utils::Logger::warn(msg)
#define LOG_ERROR(msg) subvault::utils::Logger::error(msg)

}
}
