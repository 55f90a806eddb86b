#include "database/chunk_store.h"
#include "crypto/crypto.h"
#include <sqlite3.h>
#include <mutex>
#include <cctype>

namespace subvault {
namespace database {

static constexpr int BUSY_TIMEOUT_MS = 10000;

struct ChunkStore::Impl {
    sqlite3* db = nullptr;
    std::string table;
    std::string column;
    bool hashOnly = false;
    mutable std::mutex mtx;
    
    std::optional<std::string> selectText(uint64_t id) const;
    bool exec(const std::string& sql);
};

std::optional<std::string> ChunkStore::Impl::selectText(uint64_t id) const {
    std::string sql = "SELECT " + column + " FROM \"" + table + "\" WHERE id = ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));
    
    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        int len = sqlite3_column_bytes(stmt, 0);
        if (text) result = std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
    }
    sqlite3_finalize(stmt);
    return result;
}

bool ChunkStore::Impl::exec(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (errMsg) sqlite3_free(errMsg);
    return rc == SQLITE_OK;
}

ChunkStore::ChunkStore() : impl_(std::make_unique<Impl>()) {}

ChunkStore::~ChunkStore() { close(); }

bool ChunkStore::isValidSeed(const std::string& seed) {
    if (seed.empty()) return false;
    for (char c : seed) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool ChunkStore::open(const std::string& path, const std::string& seed, bool hashOnly) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;
    if (!isValidSeed(seed)) return false;
    
    if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    sqlite3_busy_timeout(impl_->db, BUSY_TIMEOUT_MS);
    
    impl_->table = "DB" + seed;
    impl_->hashOnly = hashOnly;
    impl_->column = hashOnly ? "hash" : "data";
    
    std::string create = "CREATE TABLE IF NOT EXISTS \"" + impl_->table +
                         "\" (id INTEGER PRIMARY KEY, " + impl_->column + " TEXT);";
    if (!impl_->exec(create)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");
    return true;
}

void ChunkStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool ChunkStore::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

uint64_t ChunkStore::count() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;
    
    std::string sql = "SELECT COUNT(*) FROM \"" + impl_->table + "\";";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;
    
    uint64_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return cnt;
}

uint64_t ChunkStore::maxId() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;
    
    std::string sql = "SELECT COALESCE(MAX(id), 0) FROM \"" + impl_->table + "\";";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;
    
    uint64_t id = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return id;
}

std::optional<std::string> ChunkStore::hash(uint64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return std::nullopt;
    auto value = impl_->selectText(id);
    if (!value || impl_->hashOnly) return value;
    return crypto::sha256Hex(*value);
}

std::optional<std::string> ChunkStore::data(uint64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || impl_->hashOnly) return std::nullopt;
    return impl_->selectText(id);
}

bool ChunkStore::append(uint64_t firstId, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    if (values.empty()) return true;
    
    if (!impl_->exec("BEGIN IMMEDIATE;")) return false;
    
    std::string sql = "INSERT OR REPLACE INTO \"" + impl_->table + "\" (id, " + impl_->column + ") VALUES (?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    
    bool ok = true;
    for (size_t k = 0; k < values.size(); k++) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(firstId + k));
        sqlite3_bind_text(stmt, 2, values[k].data(), static_cast<int>(values[k].size()), SQLITE_STATIC);
        if (sqlite3_step(stmt) != SQLITE_DONE) { ok = false; break; }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    
    if (!ok) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    return true;
}

bool ChunkStore::truncate(uint64_t n) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    
    std::string sql = "DELETE FROM \"" + impl_->table + "\" WHERE id > ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(n));
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool ChunkStore::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->exec("DELETE FROM \"" + impl_->table + "\";");
}

}
}
