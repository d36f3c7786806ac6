#include "stash/storage/object_store.hpp"
#include "stash/storage/hashing.hpp"
#include "stash/storage/layout.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <new>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace stash::storage {

using namespace stash::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {
    [[nodiscard]] Status not_open() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Create directory hierarchy recursively
    Status create_directories(const std::string& path) {
        if (path.empty()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (::mkdir(path.c_str(), 0700) == 0 || errno == EEXIST) {
            return ok_status();
        }
        if (errno != ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }

        const size_t slash = path.find_last_of('/', path.size() > 1 ? path.size() - 2 : 0);
        if (slash == std::string::npos || slash == 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, ENOENT);
        }
        Status s = create_directories(path.substr(0, slash));
        if (!is_ok(s)) {
            return s;
        }
        if (::mkdir(path.c_str(), 0700) != 0 && errno != EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }
        return ok_status();
    }

    // A metadata row whose file is gone is a storage failure, not a 404
    [[nodiscard]] Status map_read_status(const StoredObject& obj, Status s) noexcept {
        if (s.code == StatusCode::NotFound && s.domain == StatusDomain::Storage) {
            spdlog::error("store: object {} has metadata but no file ({})", obj.id.v, obj.storage_name);
            return make_status(StatusDomain::Storage, StatusCode::Io, ENOENT);
        }
        return s;
    }
}

std::string content_disposition_for(std::string_view logical_name) {
    const size_t slash = logical_name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        logical_name.remove_prefix(slash + 1);
    }

    std::string name;
    name.reserve(logical_name.size());
    for (char c : logical_name) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == '"' || c == '\\') {
            name.push_back('_');
        } else {
            name.push_back(c);
        }
    }
    if (name.empty()) {
        name = "download";
    }
    return "attachment; filename=\"" + name + "\"";
}

// ========================================================================
// Lifecycle
// ========================================================================

ObjectStore::~ObjectStore() noexcept {
    if (open_) {
        (void)close();
    }
}

Status ObjectStore::open(const ObjectStoreConfig& cfg) noexcept {
    if (open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Status s = config_validate(cfg);
    if (!is_ok(s)) {
        return s;
    }

    try {
        s = create_directories(cfg.data_root);
        if (!is_ok(s)) {
            return s;
        }
        if (::chmod(cfg.data_root.c_str(), S_IRWXU) != 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }

        db::DbConfig db_cfg;
        db_cfg.path = cfg.db_path;
        db_cfg.journal_mode = cfg.db_journal_mode;
        s = db_.open(db_cfg);
        if (!is_ok(s)) {
            return s;
        }

        cfg_ = cfg;
        key_id_ = cfg.has_key ? security::key_id(cfg.key) : std::string{};
        quota_ = std::make_unique<QuotaLedger>(db_, cfg_.data_root, cfg_.max_owner_bytes);
    } catch (const std::bad_alloc&) {
        (void)db_.close();
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    open_ = true;
    spdlog::info("store: opened {} (compression {}, encryption {})",
        cfg_.data_root, cfg_.compression_enabled ? "on" : "off", cfg_.has_key ? key_id_ : "off");
    return ok_status();
}

Status ObjectStore::close() noexcept {
    if (!open_) {
        return not_open();
    }
    quota_.reset();
    open_ = false;
    return db_.close();
}

ReaderOptions ObjectStore::reader_options() const noexcept {
    ReaderOptions opts;
    opts.key = cfg_.has_key ? &cfg_.key : nullptr;
    opts.stream_threshold = cfg_.stream_threshold;
    opts.max_object_bytes = cfg_.max_object_bytes;
    return opts;
}

std::string ObjectStore::object_path(const StoredObject& obj) const {
    return layout_object_path(cfg_.data_root, obj.storage_name);
}

void ObjectStore::unlink_object(const std::string& storage_name) noexcept {
    try {
        const std::string path = layout_object_path(cfg_.data_root, storage_name);
        if (::unlink(path.c_str()) != 0) {
            if (errno == ENOENT) {
                spdlog::info("store: {} already missing", storage_name);
            } else {
                spdlog::warn("store: cannot remove {}: {}", storage_name, std::strerror(errno));
            }
        }
    } catch (const std::bad_alloc&) {
        spdlog::warn("store: cannot remove {}", storage_name);
    }
}

Status ObjectStore::load_authorized(OwnerId caller, ObjectId id, security::Right right, StoredObject* out) noexcept {
    if (!open_) {
        return not_open();
    }
    if (!id.is_valid()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Status s = db_.object_get(id, out);
    if (!is_ok(s)) {
        return s;
    }
    return security::authorize(caller, *out, right);
}

// ========================================================================
// Ingestion
// ========================================================================

// Caller holds the owner's lock
Status ObjectStore::write_locked(OwnerId owner,
    std::string_view extension,
    ByteSource& source,
    u64 released,
    WrittenObject* written,
    std::string* storage_name) noexcept {
    Status s = quota_->precheck(owner, released);
    if (!is_ok(s)) {
        return s;
    }

    s = layout_storage_name(extension, storage_name);
    if (!is_ok(s)) {
        return s;
    }

    try {
        WriterOptions opts;
        opts.max_bytes = cfg_.max_object_bytes;
        opts.compression_enabled = cfg_.compression_enabled;
        opts.compression_level = cfg_.compression_level;
        opts.key = cfg_.has_key ? &cfg_.key : nullptr;
        opts.allowed_mime_prefixes = cfg_.allowed_mime_prefixes;

        s = write_object(source, cfg_.data_root, *storage_name, opts, written);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    if (!is_ok(s)) {
        return s;
    }

    // The real cost is only known now
    s = quota_->postcheck(owner, written->size, released);
    if (!is_ok(s)) {
        unlink_object(*storage_name);
        spdlog::warn("store: rolled back {} for owner {} (quota)", *storage_name, owner.v);
        return s;
    }
    return ok_status();
}

Status ObjectStore::put(const ObjectPutParams& params, ObjectPutResult* result) noexcept {
    if (!result) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }
    if (!params.owner.is_valid() || !params.source || params.logical_name.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    try {
        const std::string extension = layout_extension(params.logical_name);
        if (!config_extension_allowed(cfg_, extension)) {
            spdlog::info("store: extension '{}' refused for owner {}", extension, params.owner.v);
            return make_rejection(StatusDomain::Storage, RejectReason::Extension);
        }
        if (params.declared_size > cfg_.max_object_bytes) {
            return make_rejection(StatusDomain::Storage, RejectReason::TooLarge);
        }

        if (params.group.is_valid()) {
            Group group;
            Status s = db_.group_get(params.group, &group);
            if (!is_ok(s)) {
                return s;
            }
            s = security::authorize_group(params.owner, group, security::Right::Write);
            if (!is_ok(s)) {
                return s;
            }
        }

        const std::shared_ptr<std::mutex> owner_lock = locks_.lock_for(params.owner);
        std::lock_guard<std::mutex> lock(*owner_lock);

        WrittenObject written;
        std::string storage_name;
        Status s = write_locked(params.owner, extension, *params.source, 0, &written, &storage_name);
        if (!is_ok(s)) {
            return s;
        }

        StoredObject obj;
        obj.owner = params.owner;
        obj.logical_name = params.logical_name;
        obj.storage_name = storage_name;
        obj.size = written.size;
        obj.size_known = true;
        obj.checksum = written.checksum;
        obj.content_type = written.content_type;
        obj.compressed = flag_from_bool(written.compressed);
        obj.encrypted = flag_from_bool(written.encrypted);
        obj.has_nonce = written.encrypted;
        obj.nonce = written.nonce;
        obj.key_id = written.encrypted ? key_id_ : std::string{};
        obj.visibility = params.visibility;
        obj.group = params.group;
        obj.created_at = static_cast<Timestamp>(std::time(nullptr));

        s = db_.object_insert(obj, &obj.id);
        if (!is_ok(s)) {
            unlink_object(storage_name);
            spdlog::error("store: metadata write failed, rolled back {}", storage_name);
            return s;
        }

        spdlog::info("store: committed object {} owner {} size {} compressed {} encrypted {}",
            obj.id.v, obj.owner.v, obj.size, written.compressed, written.encrypted);
        result->object = std::move(obj);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return ok_status();
}

Status ObjectStore::replace(OwnerId caller, ObjectId id, ByteSource& source, ObjectPutResult* result) noexcept {
    if (!result) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    try {
        StoredObject old;
        Status s = load_authorized(caller, id, security::Right::Write, &old);
        if (!is_ok(s)) {
            return s;
        }

        const std::shared_ptr<std::mutex> owner_lock = locks_.lock_for(old.owner);
        std::lock_guard<std::mutex> lock(*owner_lock);

        u64 released = old.size;
        if (!old.size_known) {
            struct stat st{};
            released = ::stat(object_path(old).c_str(), &st) == 0 ? static_cast<u64>(st.st_size) : 0;
        }

        WrittenObject written;
        std::string storage_name;
        s = write_locked(old.owner, layout_extension(old.logical_name), source, released, &written, &storage_name);
        if (!is_ok(s)) {
            return s;
        }

        StoredObject obj;
        obj.owner = old.owner;
        obj.logical_name = old.logical_name;
        obj.storage_name = storage_name;
        obj.size = written.size;
        obj.size_known = true;
        obj.checksum = written.checksum;
        obj.content_type = written.content_type;
        obj.compressed = flag_from_bool(written.compressed);
        obj.encrypted = flag_from_bool(written.encrypted);
        obj.has_nonce = written.encrypted;
        obj.nonce = written.nonce;
        obj.key_id = written.encrypted ? key_id_ : std::string{};
        obj.visibility = old.visibility;
        obj.group = old.group;
        obj.created_at = static_cast<Timestamp>(std::time(nullptr));

        s = db_.object_replace(old.id, obj, &obj.id);
        if (!is_ok(s)) {
            unlink_object(storage_name);
            spdlog::error("store: replace of object {} failed, rolled back {}", old.id.v, storage_name);
            return s;
        }
        unlink_object(old.storage_name);

        spdlog::info("store: replaced object {} with {} ({} bytes)", old.id.v, obj.id.v, obj.size);
        result->object = std::move(obj);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return ok_status();
}

// ========================================================================
// Retrieval
// ========================================================================

Status ObjectStore::read_into(const StoredObject& obj, const ChunkSink* sink, ObjectGetResult* result) noexcept {
    try {
        const std::string path = object_path(obj);
        Status s = sink ? read_object_chunked(path, obj, reader_options(), *sink)
                        : read_object(path, obj, reader_options(), &result->data);
        if (!is_ok(s)) {
            return map_read_status(obj, s);
        }

        result->content_type = obj.content_type;
        result->content_disposition = content_disposition_for(obj.logical_name);
        result->checksum_hex = hash_to_hex(obj.checksum);
        result->object = obj;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return ok_status();
}

Status ObjectStore::get(OwnerId caller, ObjectId id, ObjectGetResult* result) noexcept {
    if (!result) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Read, &obj);
    if (!is_ok(s)) {
        return s;
    }
    return read_into(obj, nullptr, result);
}

Status ObjectStore::get_stream(OwnerId caller, ObjectId id, const ChunkSink& sink, ObjectGetResult* result) noexcept {
    if (!result || !sink) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Read, &obj);
    if (!is_ok(s)) {
        return s;
    }
    return read_into(obj, &sink, result);
}

Status ObjectStore::stat(OwnerId caller, ObjectId id, StoredObject* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return load_authorized(caller, id, security::Right::Read, out);
}

Status ObjectStore::list(OwnerId owner, std::vector<StoredObject>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }
    return db_.object_list_by_owner(owner, out);
}

Status ObjectStore::verify(OwnerId caller, ObjectId id, bool* valid) noexcept {
    if (!valid) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *valid = false;

    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Read, &obj);
    if (!is_ok(s)) {
        return s;
    }

    try {
        s = verify_object(object_path(obj), obj, reader_options());
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    if (s.code == StatusCode::Corrupt || s.code == StatusCode::Crypto) {
        return ok_status();
    }
    if (!is_ok(s)) {
        return map_read_status(obj, s);
    }
    *valid = true;
    return ok_status();
}

// ========================================================================
// Mutation
// ========================================================================

Status ObjectStore::rename(OwnerId caller, ObjectId id, std::string_view new_name) noexcept {
    if (new_name.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Write, &obj);
    if (!is_ok(s)) {
        return s;
    }

    try {
        if (!config_extension_allowed(cfg_, layout_extension(new_name))) {
            return make_rejection(StatusDomain::Storage, RejectReason::Extension);
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return db_.object_rename(id, new_name);
}

Status ObjectStore::set_visibility(OwnerId caller, ObjectId id, Visibility visibility) noexcept {
    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Write, &obj);
    if (!is_ok(s)) {
        return s;
    }
    return db_.object_set_visibility(id, visibility);
}

Status ObjectStore::remove(OwnerId caller, ObjectId id) noexcept {
    StoredObject obj;
    Status s = load_authorized(caller, id, security::Right::Write, &obj);
    if (!is_ok(s)) {
        return s;
    }

    try {
        const std::shared_ptr<std::mutex> owner_lock = locks_.lock_for(obj.owner);
        std::lock_guard<std::mutex> lock(*owner_lock);

        s = db_.object_delete(id);
        if (!is_ok(s)) {
            return s;
        }
        unlink_object(obj.storage_name);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    spdlog::info("store: removed object {} owner {}", id.v, obj.owner.v);
    return ok_status();
}

// ========================================================================
// Quota and groups
// ========================================================================

Status ObjectStore::usage(OwnerId owner, u64* bytes) noexcept {
    if (!open_) {
        return not_open();
    }
    if (!owner.is_valid()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return quota_->usage(owner, bytes);
}

Status ObjectStore::create_group(OwnerId owner, std::string_view title, Visibility visibility, GroupId* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }

    try {
        Group group;
        group.owner = owner;
        group.title = std::string(title);
        group.visibility = visibility;
        group.created_at = static_cast<Timestamp>(std::time(nullptr));
        return db_.group_create(group, out);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
}

Status ObjectStore::remove_group(OwnerId caller, GroupId id) noexcept {
    if (!open_) {
        return not_open();
    }

    try {
        Group group;
        Status s = db_.group_get(id, &group);
        if (!is_ok(s)) {
            return s;
        }
        s = security::authorize_group(caller, group, security::Right::Write);
        if (!is_ok(s)) {
            return s;
        }

        const std::shared_ptr<std::mutex> owner_lock = locks_.lock_for(group.owner);
        std::lock_guard<std::mutex> lock(*owner_lock);

        std::vector<StoredObject> members;
        s = db_.object_list_by_group(id, &members);
        if (!is_ok(s)) {
            return s;
        }
        for (const StoredObject& obj : members) {
            s = db_.object_delete(obj.id);
            if (!is_ok(s) && s.code != StatusCode::NotFound) {
                return s;
            }
            unlink_object(obj.storage_name);
        }

        s = db_.group_delete(id);
        if (!is_ok(s)) {
            return s;
        }
        spdlog::info("store: removed group {} with {} objects", id.v, members.size());
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return ok_status();
}

} // namespace stash::storage
