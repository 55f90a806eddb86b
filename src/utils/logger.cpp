#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <filesystem>
#include <vector>
#include <cctype>

namespace subvault {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::string logCategory;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static const uint32_t maxFiles = 5;
static std::atomic<uint64_t> errorCount{0};
static std::atomic<bool> allowSensitive{false};

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static bool isKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Redacts the value of `key=value`, `key: value` and `"key": "value"` pairs
// whose key is a secret field. A bare mention of the word is left alone.
static std::string sanitize(const std::string& in) {
    std::string s = in;
    static const std::vector<std::string> keys = {"secretSeed", "secret", "private_key", "privkey", "seed_hex"};
    for (const auto& k : keys) {
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t next = pos + k.size();
            if ((pos > 0 && isKeyChar(s[pos - 1])) || (next < s.size() && isKeyChar(s[next]))) {
                pos = next;
                continue;
            }
            size_t i = next;
            if (i < s.size() && (s[i] == '"' || s[i] == '\'')) i++;
            while (i < s.size() && s[i] == ' ') i++;
            if (i >= s.size() || (s[i] != '=' && s[i] != ':')) {
                pos = next;
                continue;
            }
            i++;
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == '\'')) i++;
            size_t end = i;
            while (end < s.size() && s[end] != '"' && s[end] != '\'' && s[end] != ' ' && s[end] != ',' &&
                   s[end] != ')' && s[end] != ';' && s[end] != '}' && s[end] != '\n') end++;
            if (i < end) {
                s.replace(i, end - i, "[REDACTED]");
                pos = i + 10;
            } else {
                pos = next;
            }
        }
    }
    return s;
}

static void writeLog(LogLevel level, const std::string& msg) {
    if (level < currentLevel.load()) return;
    
    std::lock_guard<std::mutex> lock(logMutex);
    
    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    
    std::string outMsg = allowSensitive ? msg : sanitize(msg);
    const std::string& cat = logCategory;

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!cat.empty()) {
        oss << " [" << cat << "]";
    }
    oss << " " << outMsg << "\n";

    std::string line = oss.str();
    
    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }
    
    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            Logger::rotate();
        }
    }
    
    if (level >= LogLevel::ERROR) errorCount++;
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) logFile.close();
    logPath = path;
    
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    
    logFile.open(path, std::ios::app);
    const char* env = std::getenv("SUBVAULT_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::setCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(logMutex);
    logCategory = category;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFileSize = bytes;
}

void Logger::trace(const std::string& msg) {
    writeLog(LogLevel::TRACE, msg);
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

// Called with logMutex held from writeLog.
void Logger::rotate() {
    if (logPath.empty()) return;
    
    if (logFile.is_open()) {
        logFile.close();
    }
    
    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }
    
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    
    logFile.open(logPath, std::ios::app);
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(logMutex);
    return logPath;
}

std::string Logger::redactAddress(const std::string& address) {
    if (allowSensitive) return address;
    if (address.length() > 12) {
        return address.substr(0, 6) + "..." + address.substr(address.length() - 4);
    }
    return address;
}

}
}
