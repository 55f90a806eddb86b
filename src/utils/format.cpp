#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <sys/statvfs.h>

namespace subvault {
namespace utils {

std::string Formatter::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 5) { size /= 1024; unit++; }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

uint64_t availableDiskSpace(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    while (!p.empty() && !std::filesystem::exists(p, ec)) {
        if (p == p.parent_path()) break;
        p = p.parent_path();
    }
    if (p.empty()) p = ".";
    
    struct statvfs stat;
    if (statvfs(p.string().c_str(), &stat) != 0) {
        return 0;
    }
    return static_cast<uint64_t>(stat.f_bavail) * stat.f_frsize;
}

}
}
