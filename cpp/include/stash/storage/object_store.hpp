#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"
#include "stash/db/db.hpp"
#include "stash/security/policy.hpp"
#include "stash/storage/buffer.hpp"
#include "stash/storage/config.hpp"
#include "stash/storage/quota.hpp"
#include "stash/storage/reader.hpp"
#include "stash/storage/source.hpp"
#include "stash/storage/writer.hpp"

namespace stash::storage {

inline constexpr const char* kChecksumHeader = "X-Checksum-SHA256";
inline constexpr const char* kDispositionHeader = "Content-Disposition";

// Parameters for putting an object
struct ObjectPutParams {
    stash::core::OwnerId owner{stash::core::OwnerId::invalid()};   // Authenticated uploader
    std::string logical_name;                                       // Declared filename, never used as a path
    ByteSource* source{nullptr};                                    // Object bytes
    u64 declared_size{0};                                           // Optional: 0 = unknown
    stash::core::Visibility visibility{stash::core::Visibility::Private};
    stash::core::GroupId group{stash::core::GroupId::invalid()};    // Optional: owning note
};

// Result from putting an object
struct ObjectPutResult {
    stash::core::StoredObject object;
};

// Result from getting an object
struct ObjectGetResult {
    stash::core::StoredObject object;
    std::vector<u8> data;                // Buffered reads only
    std::string content_type;
    std::string content_disposition;     // attachment; filename="..."
    std::string checksum_hex;            // X-Checksum-SHA256 value
};

// Owns the metadata connection, the per-owner lock registry and the
// flat object directory. Instances are independent of each other.
class ObjectStore {
public:
    ObjectStore() noexcept = default;
    ~ObjectStore() noexcept;

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Creates data_root (0700) and opens the metadata database
    [[nodiscard]] stash::core::Status open(const ObjectStoreConfig& cfg) noexcept;
    stash::core::Status close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return open_; }

    [[nodiscard]] const ObjectStoreConfig& config() const noexcept { return cfg_; }

    // ========================================================================
    // Ingestion
    // ========================================================================

    // Put an object into the store
    // - Rejects disallowed extensions and declared sizes above the ceiling
    // - Quota pre-check, streaming write, quota post-check under the owner's lock
    // - Metadata is written only after the file commit; a metadata failure
    //   removes the committed file
    [[nodiscard]] stash::core::Status put(const ObjectPutParams& params, ObjectPutResult* result) noexcept;

    // Update as create-new / delete-old. The old size counts as released
    // for the quota post-check.
    [[nodiscard]] stash::core::Status replace(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        ByteSource& source,
        ObjectPutResult* result) noexcept;

    // ========================================================================
    // Retrieval
    // ========================================================================

    // Buffered download (access-checked before any byte is read)
    [[nodiscard]] stash::core::Status get(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        ObjectGetResult* result) noexcept;

    // Chunked download; `result->data` stays empty
    [[nodiscard]] stash::core::Status get_stream(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        const ChunkSink& sink,
        ObjectGetResult* result) noexcept;

    [[nodiscard]] stash::core::Status stat(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        stash::core::StoredObject* out) noexcept;

    [[nodiscard]] stash::core::Status list(stash::core::OwnerId owner,
        std::vector<stash::core::StoredObject>* out) noexcept;

    // Re-reads the object; *valid is false on an integrity or decrypt failure
    [[nodiscard]] stash::core::Status verify(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        bool* valid) noexcept;

    // ========================================================================
    // Mutation (ownership required)
    // ========================================================================

    [[nodiscard]] stash::core::Status rename(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        std::string_view new_name) noexcept;

    [[nodiscard]] stash::core::Status set_visibility(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        stash::core::Visibility visibility) noexcept;

    // Metadata first, then the file; a missing file is tolerated
    [[nodiscard]] stash::core::Status remove(stash::core::OwnerId caller, stash::core::ObjectId id) noexcept;

    // ========================================================================
    // Quota and groups
    // ========================================================================

    [[nodiscard]] stash::core::Status usage(stash::core::OwnerId owner, u64* bytes) noexcept;

    [[nodiscard]] stash::core::Status create_group(stash::core::OwnerId owner,
        std::string_view title,
        stash::core::Visibility visibility,
        stash::core::GroupId* out) noexcept;

    // Deletes the group and every object that references it, files included
    [[nodiscard]] stash::core::Status remove_group(stash::core::OwnerId caller, stash::core::GroupId id) noexcept;

    [[nodiscard]] OwnerLockRegistry& locks() noexcept { return locks_; }

private:
    [[nodiscard]] stash::core::Status load_authorized(stash::core::OwnerId caller,
        stash::core::ObjectId id,
        stash::security::Right right,
        stash::core::StoredObject* out) noexcept;
    [[nodiscard]] stash::core::Status write_locked(stash::core::OwnerId owner,
        std::string_view extension,
        ByteSource& source,
        u64 released,
        WrittenObject* written,
        std::string* storage_name) noexcept;
    [[nodiscard]] ReaderOptions reader_options() const noexcept;
    [[nodiscard]] std::string object_path(const stash::core::StoredObject& obj) const;
    [[nodiscard]] stash::core::Status read_into(const stash::core::StoredObject& obj,
        const ChunkSink* sink,
        ObjectGetResult* result) noexcept;
    void unlink_object(const std::string& storage_name) noexcept;

    ObjectStoreConfig cfg_;
    stash::db::Database db_;
    OwnerLockRegistry locks_;
    std::unique_ptr<QuotaLedger> quota_;
    std::string key_id_;
    bool open_{false};
};

// "a/b\"c.txt" -> attachment; filename="b_c.txt"
[[nodiscard]] std::string content_disposition_for(std::string_view logical_name);

} // namespace stash::storage
