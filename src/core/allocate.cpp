#include "core/allocate.h"
#include "crypto/crypto.h"
#include "database/chunk_store.h"
#include "utils/logger.h"
#include "utils/threading.h"
#include "utils/utils.h"
#include <filesystem>
#include <future>
#include <map>
#include <sstream>
#include <algorithm>

namespace subvault {
namespace core {

static constexpr uint64_t HASH_HEX_LEN = 64;

std::string Allocation::toString() const {
    std::ostringstream ss;
    ss << "Allocation(miner=" << utils::Logger::redactAddress(miner)
       << ", validator=" << utils::Logger::redactAddress(validator)
       << ", n_chunks=" << nChunks
       << ", size=" << humanReadableSize(nChunks * chunkSize)
       << ", hash=" << (hashOnly ? "true" : "false") << ")";
    return ss.str();
}

std::string allocationPath(const std::string& dbRoot, const std::string& walletName,
                           const std::string& walletHotkey, const std::string& miner,
                           const std::string& validator) {
    std::filesystem::path p(dbRoot);
    p /= walletName;
    p /= walletHotkey;
    p /= "DB-" + miner + "-" + validator;
    return p.string();
}

Allocation makeAllocation(const std::string& dbRoot, const std::string& walletName,
                          const std::string& walletHotkey, const std::string& miner,
                          const std::string& validator, uint64_t nChunks, bool hashOnly,
                          uint64_t chunkSize) {
    Allocation a;
    a.path = allocationPath(dbRoot, walletName, walletHotkey, miner, validator);
    a.nChunks = nChunks;
    a.seed = miner + validator;
    a.miner = miner;
    a.validator = validator;
    a.hashOnly = hashOnly;
    a.chunkSize = chunkSize;
    return a;
}

std::string chunkData(const std::string& seed, uint64_t id, uint64_t size) {
    std::string out;
    out.reserve(static_cast<size_t>(size));
    std::string block = crypto::sha256Hex(seed + "/" + std::to_string(id));
    while (out.size() < size) {
        uint64_t take = std::min<uint64_t>(HASH_HEX_LEN, size - out.size());
        out.append(block, 0, static_cast<size_t>(take));
        block = crypto::sha256Hex(block);
    }
    return out;
}

std::string chunkHash(const std::string& seed, uint64_t id, uint64_t size) {
    return crypto::sha256Hex(chunkData(seed, id, size));
}

static uint64_t existingChunks(const Allocation& alloc) {
    std::error_code ec;
    if (!std::filesystem::exists(alloc.path, ec)) return 0;
    database::ChunkStore store;
    if (!store.open(alloc.path, alloc.seed, alloc.hashOnly)) return 0;
    return store.maxId();
}

uint64_t requiredBytes(const Allocation& alloc, bool restart) {
    uint64_t have = restart ? 0 : existingChunks(alloc);
    if (have >= alloc.nChunks) return 0;
    uint64_t perChunk = alloc.hashOnly ? HASH_ROW_BYTES : alloc.chunkSize + HASH_ROW_BYTES;
    uint64_t rows = (alloc.nChunks - have) * perChunk;
    // Overflow pages and b-tree interior pages add about 1/64.
    return rows + rows / 64 + GENERATE_HEADROOM_BYTES;
}

static Result<void> generateOne(const Allocation& alloc, bool restart) {
    if (!database::ChunkStore::isValidSeed(alloc.seed)) {
        return makeError(ErrorCode::VALIDATION_FAILED, "allocation seed must be alphanumeric", alloc.path);
    }
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(alloc.path).parent_path(), ec);
    if (ec) {
        return makeError(ErrorCode::PERMISSION_DENIED, "cannot create directory: " + ec.message(), alloc.path);
    }
    
    database::ChunkStore store;
    if (!store.open(alloc.path, alloc.seed, alloc.hashOnly)) {
        return makeError(ErrorCode::DATABASE_ERROR, "cannot open chunk store", alloc.path);
    }
    if (restart && !store.clear()) {
        return makeError(ErrorCode::DATABASE_ERROR, "cannot clear chunk store", alloc.path);
    }
    
    uint64_t next = store.maxId() + 1;
    uint64_t perChunk = alloc.hashOnly ? HASH_HEX_LEN : std::max<uint64_t>(alloc.chunkSize, 1);
    uint64_t batchSize = std::max<uint64_t>(1, MAX_BATCH_BYTES / perChunk);
    
    while (next <= alloc.nChunks) {
        uint64_t end = std::min(alloc.nChunks, next + batchSize - 1);
        std::vector<std::string> values;
        values.reserve(static_cast<size_t>(end - next + 1));
        for (uint64_t id = next; id <= end; id++) {
            if (alloc.hashOnly) values.push_back(chunkHash(alloc.seed, id, alloc.chunkSize));
            else values.push_back(chunkData(alloc.seed, id, alloc.chunkSize));
        }
        if (!store.append(next, values)) {
            return makeError(ErrorCode::DATABASE_ERROR, "chunk insert failed at id " + std::to_string(next), alloc.path);
        }
        next = end + 1;
    }
    
    if (!store.truncate(alloc.nChunks)) {
        return makeError(ErrorCode::DATABASE_ERROR, "chunk truncate failed", alloc.path);
    }
    LOG_TRACE("Generated " + alloc.toString());
    return {};
}

Result<void> generate(const std::vector<Allocation>& allocations, size_t workers, bool restart) {
    if (allocations.empty()) return {};
    
    std::map<std::string, uint64_t> needed;
    for (const auto& alloc : allocations) {
        std::string dir = std::filesystem::path(alloc.path).parent_path().string();
        needed[dir] += requiredBytes(alloc, restart);
    }
    for (const auto& [dir, bytes] : needed) {
        if (bytes == 0) continue;
        uint64_t avail = utils::availableDiskSpace(dir);
        if (avail < bytes) {
            return makeError(ErrorCode::INSUFFICIENT_SPACE,
                             "need " + humanReadableSize(bytes) + ", have " + humanReadableSize(avail), dir);
        }
    }
    
    utils::ThreadPool pool(std::max<size_t>(1, std::min(workers, allocations.size())));
    std::vector<std::future<Result<void>>> results;
    results.reserve(allocations.size());
    for (const auto& alloc : allocations) {
        results.push_back(pool.enqueue([&alloc, restart] { return generateOne(alloc, restart); }));
    }
    
    Result<void> first;
    for (auto& f : results) {
        Result<void> r = f.get();
        if (r.failed()) {
            LOG_ERROR("Allocation failed: " + r.error().describe());
            if (first.ok()) first = r;
        }
    }
    return first;
}

std::string humanReadableSize(uint64_t bytes) {
    return utils::Formatter::formatBytes(bytes);
}

}
}
