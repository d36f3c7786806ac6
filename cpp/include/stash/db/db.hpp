#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"

struct sqlite3;

namespace stash::db {
    using u64 = stash::core::u64;

    struct DbConfig {
        std::string path{":memory:"};
        std::string journal_mode{"WAL"};
    };

    // Owner usage as recorded in metadata. Rows written before sizes were
    // recorded contribute through their storage names instead.
    struct DbUsage {
        u64 recorded_bytes{0};
        std::vector<std::string> unsized_storage_names;
    };

    // One SQLite connection, serialised by an internal mutex.
    class Database {
    public:
        Database() noexcept = default;
        ~Database() noexcept;

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        [[nodiscard]] stash::core::Status open(const DbConfig& cfg) noexcept;
        stash::core::Status close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Objects
        [[nodiscard]] stash::core::Status object_insert(const stash::core::StoredObject& obj,
            stash::core::ObjectId* out) noexcept;
        [[nodiscard]] stash::core::Status object_get(stash::core::ObjectId id,
            stash::core::StoredObject* out) noexcept;
        [[nodiscard]] stash::core::Status object_list_by_owner(stash::core::OwnerId owner,
            std::vector<stash::core::StoredObject>* out) noexcept;
        [[nodiscard]] stash::core::Status object_list_by_group(stash::core::GroupId group,
            std::vector<stash::core::StoredObject>* out) noexcept;
        [[nodiscard]] stash::core::Status object_rename(stash::core::ObjectId id,
            std::string_view logical_name) noexcept;
        [[nodiscard]] stash::core::Status object_set_visibility(stash::core::ObjectId id,
            stash::core::Visibility visibility) noexcept;
        [[nodiscard]] stash::core::Status object_delete(stash::core::ObjectId id) noexcept;
        // Inserts `replacement` and deletes `old_id` in one transaction
        [[nodiscard]] stash::core::Status object_replace(stash::core::ObjectId old_id,
            const stash::core::StoredObject& replacement,
            stash::core::ObjectId* out) noexcept;

        [[nodiscard]] stash::core::Status owner_usage(stash::core::OwnerId owner, DbUsage* out) noexcept;

        // Groups
        [[nodiscard]] stash::core::Status group_create(const stash::core::Group& group,
            stash::core::GroupId* out) noexcept;
        [[nodiscard]] stash::core::Status group_get(stash::core::GroupId id, stash::core::Group* out) noexcept;
        [[nodiscard]] stash::core::Status group_delete(stash::core::GroupId id) noexcept;

    private:
        [[nodiscard]] stash::core::Status insert_locked(const stash::core::StoredObject& obj,
            stash::core::ObjectId* out) noexcept;
        [[nodiscard]] stash::core::Status delete_locked(stash::core::ObjectId id) noexcept;
        [[nodiscard]] stash::core::Status list_locked(const char* sql, u64 key,
            std::vector<stash::core::StoredObject>* out) noexcept;
        [[nodiscard]] bool exec_locked(const char* sql) noexcept;

        sqlite3* db_{nullptr};
        mutable std::mutex mutex_;
    };

} // namespace stash::db
