#include "database/database.h"
#include <sqlite3.h>
#include <mutex>
#include <utility>

namespace subvault {
namespace database {

static constexpr int BUSY_TIMEOUT_MS = 10000;

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::string>> puts;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::string& value) {
    impl_->puts.emplace_back(key, value);
}

struct Database::Impl {
    sqlite3* db = nullptr;
    sqlite3_stmt* getStmt = nullptr;
    sqlite3_stmt* putStmt = nullptr;
    mutable std::mutex mtx;

    bool exec(const char* sql) {
        return sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    void release() {
        sqlite3_finalize(getStmt);
        sqlite3_finalize(putStmt);
        getStmt = nullptr;
        putStmt = nullptr;
        sqlite3_close(db);
        db = nullptr;
    }
};

static std::vector<uint8_t> columnBytes(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int size = sqlite3_column_bytes(stmt, col);
    if (!blob || size <= 0) return {};
    const uint8_t* p = static_cast<const uint8_t*>(blob);
    return std::vector<uint8_t>(p, p + size);
}

// Smallest string greater than every key starting with `prefix`; empty when
// there is none (prefix of all 0xff bytes).
static std::string prefixEnd(std::string prefix) {
    while (!prefix.empty()) {
        unsigned char last = static_cast<unsigned char>(prefix.back());
        if (last < 0xff) {
            prefix.back() = static_cast<char>(last + 1);
            return prefix;
        }
        prefix.pop_back();
    }
    return prefix;
}

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
        impl_->release();
        return false;
    }
    sqlite3_busy_timeout(impl_->db, BUSY_TIMEOUT_MS);

    if (!impl_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB) WITHOUT ROWID;")) {
        impl_->release();
        return false;
    }
    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");

    if (sqlite3_prepare_v2(impl_->db, "SELECT value FROM kv WHERE key = ?;", -1, &impl_->getStmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(impl_->db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);", -1,
                           &impl_->putStmt, nullptr) != SQLITE_OK) {
        impl_->release();
        return false;
    }
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) impl_->release();
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return {};

    sqlite3_stmt* stmt = impl_->getStmt;
    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    std::vector<uint8_t> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) result = columnBytes(stmt, 0);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

std::string Database::getString(const std::string& key) const {
    auto data = get(key);
    return std::string(data.begin(), data.end());
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    bool nested = sqlite3_get_autocommit(impl_->db) == 0;
    if (!nested && !impl_->exec("BEGIN IMMEDIATE;")) return false;

    bool ok = true;
    sqlite3_stmt* stmt = impl_->putStmt;
    for (const auto& [key, value] : batch.impl_->puts) {
        sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (!ok) break;
    }

    if (!nested) {
        if (ok && !impl_->exec("COMMIT;")) ok = false;
        if (!ok) impl_->exec("ROLLBACK;");
    }
    if (ok) batch.impl_->puts.clear();
    return ok;
}

void Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    std::string end = prefixEnd(prefix);
    std::string sql = "SELECT key, value FROM kv WHERE key >= ?";
    if (!end.empty()) sql += " AND key < ?";
    sql += " ORDER BY key;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return;
    sqlite3_bind_text(stmt, 1, prefix.data(), static_cast<int>(prefix.size()), SQLITE_TRANSIENT);
    if (!end.empty()) sqlite3_bind_text(stmt, 2, end.data(), static_cast<int>(end.size()), SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        std::string key(text ? reinterpret_cast<const char*>(text) : "",
                        static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
        if (!fn(key, columnBytes(stmt, 1))) break;
    }
    sqlite3_finalize(stmt);
}

bool Database::beginTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db && impl_->exec("BEGIN IMMEDIATE;");
}

bool Database::commitTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db && impl_->exec("COMMIT;");
}

bool Database::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db && impl_->exec("ROLLBACK;");
}

}
}
