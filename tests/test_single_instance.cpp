#include <gtest/gtest.h>
#include "utils/single_instance.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace subvault::utils;

class SingleInstanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "subvault_test_single_instance";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    // fcntl locks never conflict inside one process, so the contender is a
    // child. Returns its exit code: 0 when it got the lock, 1 otherwise.
    int acquireInChild(const std::string& dir, const std::string& name) {
        std::string errFile = (testDir / "child.err").string();
        pid_t pid = fork();
        if (pid == 0) {
            std::string err;
            auto lock = SingleInstanceLock::acquire(dir, name, &err);
            std::ofstream(errFile) << err;
            _exit(lock ? 0 : 1);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        std::ifstream in(errFile);
        std::stringstream ss;
        ss << in.rdbuf();
        childError = ss.str();
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    std::filesystem::path testDir;
    std::string childError;
};

TEST_F(SingleInstanceTest, WritesPidIntoLockFile) {
    std::string dir = (testDir / "miner").string();
    auto lock = SingleInstanceLock::acquire(dir, "miner.lock");
    ASSERT_NE(lock, nullptr);
    EXPECT_EQ(lock->path(), (testDir / "miner" / "miner.lock").string());

    std::ifstream in(lock->path());
    long pid = 0;
    in >> pid;
    EXPECT_EQ(pid, static_cast<long>(getpid()));
}

TEST_F(SingleInstanceTest, SecondHolderIsRefused) {
    std::string dir = testDir.string();
    auto lock = SingleInstanceLock::acquire(dir, "validator.lock");
    ASSERT_NE(lock, nullptr);

    EXPECT_EQ(acquireInChild(dir, "validator.lock"), 1);
    EXPECT_NE(childError.find("already running"), std::string::npos);
    EXPECT_NE(childError.find("pid " + std::to_string(getpid())), std::string::npos);

    // Other roles lock their own file.
    EXPECT_EQ(acquireInChild(dir, "miner.lock"), 0);
}

TEST_F(SingleInstanceTest, ReleasedOnDestruction) {
    std::string dir = testDir.string();
    auto lock = SingleInstanceLock::acquire(dir, "miner.lock");
    ASSERT_NE(lock, nullptr);
    lock.reset();
    EXPECT_EQ(acquireInChild(dir, "miner.lock"), 0);
}
