#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <cstdint>

namespace subvault {
namespace core {

constexpr uint64_t CHUNK_SIZE = 1ULL << 20;
constexpr uint64_t MIN_N_CHUNKS = 1ULL << 10;
// Keeps one chunk inside a single wire frame.
constexpr uint64_t MAX_CHUNK_SIZE = 8ULL << 20;
constexpr size_t DEFAULT_GENERATE_WORKERS = 10;
// Rough on-disk cost of one hash-only row.
constexpr uint64_t HASH_ROW_BYTES = 96;
// Rows are inserted in transactions of at most this many payload bytes.
constexpr uint64_t MAX_BATCH_BYTES = 16ULL << 20;
// Free space a store needs beyond its rows while generating: the WAL of one
// batch plus its checkpoint copy.
constexpr uint64_t GENERATE_HEADROOM_BYTES = 2 * MAX_BATCH_BYTES;

struct Allocation {
    std::string path;
    uint64_t nChunks = 0;
    std::string seed;
    std::string miner;
    std::string validator;
    bool hashOnly = false;
    uint64_t chunkSize = CHUNK_SIZE;
    
    std::string toString() const;
};

// <dbRoot>/<walletName>/<walletHotkey>/DB-<miner>-<validator>
std::string allocationPath(const std::string& dbRoot, const std::string& walletName,
                           const std::string& walletHotkey, const std::string& miner,
                           const std::string& validator);

Allocation makeAllocation(const std::string& dbRoot, const std::string& walletName,
                          const std::string& walletHotkey, const std::string& miner,
                          const std::string& validator, uint64_t nChunks, bool hashOnly,
                          uint64_t chunkSize = CHUNK_SIZE);

// Deterministic chunk text: hex sha256 chain starting at sha256Hex(seed + "/" + id),
// truncated to `size` characters.
std::string chunkData(const std::string& seed, uint64_t id, uint64_t size);
std::string chunkHash(const std::string& seed, uint64_t id, uint64_t size);

// Bytes an allocation still needs on disk to reach nChunks, including page
// overhead and GENERATE_HEADROOM_BYTES; 0 when nothing is missing.
uint64_t requiredBytes(const Allocation& alloc, bool restart);

// Brings every store to exactly nChunks rows. Fails before writing anything
// when a target filesystem lacks the room.
Result<void> generate(const std::vector<Allocation>& allocations,
                      size_t workers = DEFAULT_GENERATE_WORKERS,
                      bool restart = false);

std::string humanReadableSize(uint64_t bytes);

}
}
