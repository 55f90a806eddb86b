#include "utils/single_instance.h"

#include <cstring>
#include <filesystem>

#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace subvault::utils {
namespace {

static bool tryLockFileFcntl(int fd) {
    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    int rc;
    do {
        rc = fcntl(fd, F_SETLK, &fl);
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
}

static pid_t getLockOwnerPidFcntl(int fd) {
    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    if (fcntl(fd, F_GETLK, &fl) != 0) return -1;
    if (fl.l_type == F_UNLCK) return -1;
    return fl.l_pid;
}

static void unlockFileFcntl(int fd) {
    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    fcntl(fd, F_SETLK, &fl);
}

static bool writePidToFd(int fd, long pid) {
    std::string data = std::to_string(pid);
    data.push_back('\n');

    if (ftruncate(fd, 0) != 0) return false;
    if (lseek(fd, 0, SEEK_SET) < 0) return false;

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return false;
    }
    return true;
}

} // namespace

std::unique_ptr<SingleInstanceLock> SingleInstanceLock::acquire(
    const std::string& dir,
    const std::string& name,
    std::string* errorOut) {
    auto lock = std::unique_ptr<SingleInstanceLock>(new SingleInstanceLock());
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        if (errorOut) *errorOut = "Failed to create " + dir + ": " + ec.message();
        return nullptr;
    }
    lock->lockPath_ = (std::filesystem::path(dir) / name).string();

    int fd = ::open(lock->lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errorOut) *errorOut = "Failed to open instance lock file " + lock->lockPath_;
        return nullptr;
    }

    if (!tryLockFileFcntl(fd)) {
        pid_t ownerPid = getLockOwnerPidFcntl(fd);
        ::close(fd);
        if (errorOut) {
            *errorOut = "Another neuron is already running in " + dir;
            if (ownerPid > 0) *errorOut += " (pid " + std::to_string(ownerPid) + ")";
        }
        return nullptr;
    }

    if (!writePidToFd(fd, static_cast<long>(getpid()))) {
        unlockFileFcntl(fd);
        ::close(fd);
        if (errorOut) *errorOut = "Failed to write instance lock file";
        return nullptr;
    }
    lock->fd_ = fd;
    return lock;
}

SingleInstanceLock::~SingleInstanceLock() {
    if (fd_ >= 0) {
        unlockFileFcntl(fd_);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace subvault::utils
