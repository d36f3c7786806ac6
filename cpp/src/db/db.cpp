#include "stash/db/db.hpp"
#include <sqlite3.h>
#include <cstring>
#include <ctime>
#include <new>
#include <string>
#include <utility>

namespace stash::db {

using namespace stash::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS groups (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            title TEXT NOT NULL,
            visibility INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_groups_owner ON groups(owner_id);

        CREATE TABLE IF NOT EXISTS objects (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            logical_name TEXT NOT NULL,
            storage_name TEXT NOT NULL UNIQUE,
            size INTEGER,
            checksum BLOB NOT NULL,
            content_type TEXT NOT NULL,
            is_compressed INTEGER,
            is_encrypted INTEGER,
            nonce BLOB,
            key_id TEXT,
            visibility INTEGER NOT NULL DEFAULT 0,
            group_id INTEGER REFERENCES groups(id) ON DELETE CASCADE,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_objects_owner ON objects(owner_id);
        CREATE INDEX IF NOT EXISTS idx_objects_group ON objects(group_id);
    )SQL";

    constexpr const char* kObjectColumns =
        "id, owner_id, logical_name, storage_name, size, checksum, content_type, "
        "is_compressed, is_encrypted, nonce, key_id, visibility, group_id, created_at";

    [[nodiscard]] Status db_error() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    [[nodiscard]] Status not_open() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    [[nodiscard]] Timestamp now_seconds() noexcept {
        return static_cast<Timestamp>(std::time(nullptr));
    }

    void bind_flag(sqlite3_stmt* stmt, int idx, Flag f) noexcept {
        if (f == Flag::Unknown) {
            sqlite3_bind_null(stmt, idx);
        } else {
            sqlite3_bind_int(stmt, idx, f == Flag::Yes ? 1 : 0);
        }
    }

    [[nodiscard]] Flag column_flag(sqlite3_stmt* stmt, int idx) noexcept {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL) {
            return Flag::Unknown;
        }
        return flag_from_bool(sqlite3_column_int(stmt, idx) != 0);
    }

    [[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int idx) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, idx));
        return text ? std::string(text) : std::string();
    }

    [[nodiscard]] Visibility column_visibility(sqlite3_stmt* stmt, int idx) noexcept {
        const int v = sqlite3_column_int(stmt, idx);
        if (v == static_cast<int>(Visibility::Public)) {
            return Visibility::Public;
        }
        if (v == static_cast<int>(Visibility::Unlisted)) {
            return Visibility::Unlisted;
        }
        return Visibility::Private;
    }

    // Column order follows kObjectColumns
    void read_object_row(sqlite3_stmt* stmt, StoredObject* out) {
        out->id = ObjectId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
        out->owner = OwnerId{static_cast<u64>(sqlite3_column_int64(stmt, 1))};
        out->logical_name = column_string(stmt, 2);
        out->storage_name = column_string(stmt, 3);

        if (sqlite3_column_type(stmt, 4) == SQLITE_NULL) {
            out->size = 0;
            out->size_known = false;
        } else {
            out->size = static_cast<u64>(sqlite3_column_int64(stmt, 4));
            out->size_known = true;
        }

        out->checksum = Hash256{};
        const void* sum = sqlite3_column_blob(stmt, 5);
        if (sum && sqlite3_column_bytes(stmt, 5) == static_cast<int>(out->checksum.b.size())) {
            std::memcpy(out->checksum.b.data(), sum, out->checksum.b.size());
        }

        out->content_type = column_string(stmt, 6);
        out->compressed = column_flag(stmt, 7);
        out->encrypted = column_flag(stmt, 8);

        out->nonce = Nonce96{};
        out->has_nonce = false;
        const void* nonce = sqlite3_column_blob(stmt, 9);
        if (nonce && sqlite3_column_bytes(stmt, 9) == static_cast<int>(out->nonce.b.size())) {
            std::memcpy(out->nonce.b.data(), nonce, out->nonce.b.size());
            out->has_nonce = true;
        }

        out->key_id = column_string(stmt, 10);
        out->visibility = column_visibility(stmt, 11);
        out->group = sqlite3_column_type(stmt, 12) == SQLITE_NULL
            ? GroupId::invalid()
            : GroupId{static_cast<u64>(sqlite3_column_int64(stmt, 12))};
        out->created_at = sqlite3_column_int64(stmt, 13);
    }
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Database::~Database() noexcept {
    (void)close();
}

Status Database::open(const DbConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }

    const char* path = cfg.path.empty() ? ":memory:" : cfg.path.c_str();
    int rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }

    // WAL fails on in-memory databases; that is not fatal
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += cfg.journal_mode.empty() ? "WAL" : cfg.journal_mode;
    (void)exec_locked(journal_sql.c_str());

    (void)exec_locked("PRAGMA synchronous=NORMAL");
    (void)exec_locked("PRAGMA temp_store=MEMORY");
    sqlite3_busy_timeout(db_, 5000);

    if (!exec_locked(kSchemaSQL)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }

    return ok_status();
}

Status Database::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    const int rc = sqlite3_close(db_);
    db_ = nullptr;
    return rc == SQLITE_OK ? ok_status() : db_error();
}

bool Database::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool Database::exec_locked(const char* sql) noexcept {
    if (!db_ || !sql) return false;
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    return rc == SQLITE_OK;
}

// ============================================================================
// Object Operations
// ============================================================================

Status Database::insert_locked(const StoredObject& obj, ObjectId* out) noexcept {
    const char* sql = "INSERT INTO objects (owner_id, logical_name, storage_name, size, checksum, "
                      "content_type, is_compressed, is_encrypted, nonce, key_id, visibility, group_id, created_at) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(obj.owner.v));
    sqlite3_bind_text(stmt, 2, obj.logical_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, obj.storage_name.c_str(), -1, SQLITE_TRANSIENT);
    if (obj.size_known) {
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(obj.size));
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_blob(stmt, 5, obj.checksum.b.data(), static_cast<int>(obj.checksum.b.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, obj.content_type.c_str(), -1, SQLITE_TRANSIENT);
    bind_flag(stmt, 7, obj.compressed);
    bind_flag(stmt, 8, obj.encrypted);
    if (obj.has_nonce) {
        sqlite3_bind_blob(stmt, 9, obj.nonce.b.data(), static_cast<int>(obj.nonce.b.size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    if (obj.key_id.empty()) {
        sqlite3_bind_null(stmt, 10);
    } else {
        sqlite3_bind_text(stmt, 10, obj.key_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, 11, static_cast<int>(obj.visibility));
    if (obj.group.is_valid()) {
        sqlite3_bind_int64(stmt, 12, static_cast<sqlite3_int64>(obj.group.v));
    } else {
        sqlite3_bind_null(stmt, 12);
    }
    sqlite3_bind_int64(stmt, 13, obj.created_at != 0 ? obj.created_at : now_seconds());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }
    if (rc != SQLITE_DONE) {
        return db_error();
    }

    *out = ObjectId{static_cast<u64>(sqlite3_last_insert_rowid(db_))};
    return ok_status();
}

Status Database::object_insert(const StoredObject& obj, ObjectId* out) noexcept {
    if (!out || !obj.owner.is_valid() || obj.storage_name.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    return insert_locked(obj, out);
}

Status Database::object_get(ObjectId id, StoredObject* out) noexcept {
    if (!out || !id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    std::string sql;
    try {
        sql = std::string("SELECT ") + kObjectColumns + " FROM objects WHERE id = ?";
    } catch (const std::bad_alloc&) {
        return db_error();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        try {
            read_object_row(stmt, out);
        } catch (const std::bad_alloc&) {
            sqlite3_finalize(stmt);
            return db_error();
        }
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_error();
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status Database::list_locked(const char* where, u64 key, std::vector<StoredObject>* out) noexcept {
    try {
        const std::string sql = std::string("SELECT ") + kObjectColumns + " FROM objects WHERE " + where +
            " ORDER BY id";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return db_error();
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(key));

        std::vector<StoredObject> rows;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            StoredObject obj;
            read_object_row(stmt, &obj);
            rows.push_back(std::move(obj));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return db_error();
        }
        *out = std::move(rows);
    } catch (const std::bad_alloc&) {
        return db_error();
    }
    return ok_status();
}

Status Database::object_list_by_owner(OwnerId owner, std::vector<StoredObject>* out) noexcept {
    if (!out || !owner.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    return list_locked("owner_id = ?", owner.v, out);
}

Status Database::object_list_by_group(GroupId group, std::vector<StoredObject>* out) noexcept {
    if (!out || !group.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    return list_locked("group_id = ?", group.v, out);
}

Status Database::object_rename(ObjectId id, std::string_view logical_name) noexcept {
    if (!id.is_valid() || logical_name.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "UPDATE objects SET logical_name = ? WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_text(stmt, 1, logical_name.data(), static_cast<int>(logical_name.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

Status Database::object_set_visibility(ObjectId id, Visibility visibility) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "UPDATE objects SET visibility = ? WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(visibility));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

Status Database::delete_locked(ObjectId id) noexcept {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM objects WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

Status Database::object_delete(ObjectId id) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    return delete_locked(id);
}

Status Database::object_replace(ObjectId old_id, const StoredObject& replacement, ObjectId* out) noexcept {
    if (!out || !old_id.is_valid() || !replacement.owner.is_valid() || replacement.storage_name.empty()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    if (!exec_locked("BEGIN IMMEDIATE TRANSACTION")) {
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }

    ObjectId new_id = ObjectId::invalid();
    Status s = insert_locked(replacement, &new_id);
    if (is_ok(s)) {
        s = delete_locked(old_id);
    }

    if (!is_ok(s)) {
        (void)exec_locked("ROLLBACK");
        return s;
    }

    if (!exec_locked("COMMIT")) {
        (void)exec_locked("ROLLBACK");
        return db_error();
    }

    *out = new_id;
    return ok_status();
}

Status Database::owner_usage(OwnerId owner, DbUsage* out) noexcept {
    if (!out || !owner.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT size, storage_name FROM objects WHERE owner_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(owner.v));

    DbUsage usage;
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            if (sqlite3_column_type(stmt, 0) == SQLITE_NULL) {
                usage.unsized_storage_names.push_back(column_string(stmt, 1));
            } else {
                usage.recorded_bytes += static_cast<u64>(sqlite3_column_int64(stmt, 0));
            }
        }
    } catch (const std::bad_alloc&) {
        sqlite3_finalize(stmt);
        return db_error();
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    *out = std::move(usage);
    return ok_status();
}

// ============================================================================
// Group Operations
// ============================================================================

Status Database::group_create(const Group& group, GroupId* out) noexcept {
    if (!out || !group.owner.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    const char* sql = "INSERT INTO groups (owner_id, title, visibility, created_at) VALUES (?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(group.owner.v));
    sqlite3_bind_text(stmt, 2, group.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, static_cast<int>(group.visibility));
    sqlite3_bind_int64(stmt, 4, group.created_at != 0 ? group.created_at : now_seconds());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    *out = GroupId{static_cast<u64>(sqlite3_last_insert_rowid(db_))};
    return ok_status();
}

Status Database::group_get(GroupId id, Group* out) noexcept {
    if (!out || !id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    const char* sql = "SELECT id, owner_id, title, visibility, created_at FROM groups WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        try {
            out->id = GroupId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};
            out->owner = OwnerId{static_cast<u64>(sqlite3_column_int64(stmt, 1))};
            out->title = column_string(stmt, 2);
            out->visibility = column_visibility(stmt, 3);
            out->created_at = sqlite3_column_int64(stmt, 4);
        } catch (const std::bad_alloc&) {
            sqlite3_finalize(stmt);
            return db_error();
        }
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_error();
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status Database::group_delete(GroupId id) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        return not_open();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM groups WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_error();
    }

    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    return ok_status();
}

} // namespace stash::db
