#pragma once

#include <string>
#include <cstdint>

namespace subvault {
namespace utils {

class Formatter {
public:
    static std::string formatBytes(uint64_t bytes);
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
};

// Free bytes available to an unprivileged writer on the filesystem holding
// `path` (or its nearest existing parent). Returns 0 when it cannot be read.
uint64_t availableDiskSpace(const std::string& path);

}
}
