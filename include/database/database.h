#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace subvault {
namespace database {

// Puts applied together by Database::write.
class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::string& value);
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Key/value store over a single SQLite table `kv`. Several processes may
// open the same file; writers wait on the busy timeout.
class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    // Empty when the key is absent.
    std::vector<uint8_t> get(const std::string& key) const;
    std::string getString(const std::string& key) const;

    // All-or-nothing; joins an open transaction instead of starting one.
    // The batch is emptied on success.
    bool write(WriteBatch& batch);

    // Visits keys starting with `prefix` in key order until fn returns false.
    void forEach(const std::string& prefix, std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;

    // IMMEDIATE transaction: takes the write lock up front so a
    // read-modify-write sequence is not interleaved with another process.
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
