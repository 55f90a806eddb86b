#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace subvault {
namespace database {

// One allocation's chunks in a SQLite file, table "DB<seed>".
// Miners keep the chunk text in a `data` column, validators keep only its
// sha256 hex in a `hash` column.
class ChunkStore {
public:
    ChunkStore();
    ~ChunkStore();

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    bool open(const std::string& path, const std::string& seed, bool hashOnly);
    void close();
    bool isOpen() const;

    uint64_t count() const;
    uint64_t maxId() const;

    // Stored hash, or the hash of the stored data for full stores.
    std::optional<std::string> hash(uint64_t id) const;
    // Empty for hash-only stores.
    std::optional<std::string> data(uint64_t id) const;

    // Inserts values[k] under id firstId + k in one transaction.
    bool append(uint64_t firstId, const std::vector<std::string>& values);
    // Deletes every id above n.
    bool truncate(uint64_t n);
    bool clear();

    static bool isValidSeed(const std::string& seed);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
