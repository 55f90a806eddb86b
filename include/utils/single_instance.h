#pragma once

#include <memory>
#include <string>

namespace subvault::utils {

// Exclusive fcntl lock on <dir>/<name>; released when the object dies.
class SingleInstanceLock {
public:
    static std::unique_ptr<SingleInstanceLock> acquire(
        const std::string& dir,
        const std::string& name = "neuron.lock",
        std::string* errorOut = nullptr);

    ~SingleInstanceLock();

    SingleInstanceLock(const SingleInstanceLock&) = delete;
    SingleInstanceLock& operator=(const SingleInstanceLock&) = delete;

    const std::string& path() const { return lockPath_; }

private:
    SingleInstanceLock() = default;

    std::string lockPath_;
    int fd_ = -1;
};

} // namespace subvault::utils
