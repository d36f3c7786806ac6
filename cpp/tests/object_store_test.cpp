#include <gtest/gtest.h>
#include <sqlite3.h>
#include "stash/storage/object_store.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace stash::storage;
using namespace stash::core;

namespace {
const std::string kHelloSha256 = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

std::vector<u8> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool file_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

// Makes every later insert into `objects` fail
void refuse_object_rows(const std::string& db_path) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    const int rc = sqlite3_exec(db,
        "CREATE TRIGGER refuse_objects BEFORE INSERT ON objects "
        "BEGIN SELECT RAISE(ABORT, 'refused'); END;",
        nullptr, nullptr, nullptr);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK);
}
} // namespace

// Test fixture for object store tests
class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir_.path().empty());
        config_.data_root = dir_.join("objects");
        config_.db_path = dir_.join("stash.db");

        Status s = store_.open(config_);
        ASSERT_TRUE(is_ok(s)) << "Failed to open object store";
    }

    void reopen(const ObjectStoreConfig& cfg) {
        ASSERT_TRUE(is_ok(store_.close()));
        config_ = cfg;
        ASSERT_TRUE(is_ok(store_.open(config_)));
    }

    Status put(u64 owner, const std::string& name, const std::vector<u8>& data, ObjectId* id,
        Visibility visibility = Visibility::Private, GroupId group = GroupId::invalid()) {
        MemorySource src({data.data(), static_cast<u32>(data.size())});
        ObjectPutParams params;
        params.owner = OwnerId{owner};
        params.logical_name = name;
        params.source = &src;
        params.visibility = visibility;
        params.group = group;
        ObjectPutResult result;
        const Status s = store_.put(params, &result);
        if (is_ok(s) && id) {
            *id = result.object.id;
        }
        return s;
    }

    void refuse_metadata_writes() {
        ASSERT_TRUE(is_ok(store_.close()));
        refuse_object_rows(config_.db_path);
        ASSERT_TRUE(is_ok(store_.open(config_)));
    }

    std::string disk_path(ObjectId id) {
        StoredObject obj;
        EXPECT_TRUE(is_ok(store_.stat(OwnerId{1}, id, &obj)));
        return layout_object_path(config_.data_root, obj.storage_name);
    }

    stash::test::TempDir dir_;
    ObjectStoreConfig config_;
    ObjectStore store_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ObjectStoreTest, OpenCreatesPrivateDataRoot) {
    struct stat st{};
    ASSERT_EQ(::stat(config_.data_root.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, 0700u);
    EXPECT_TRUE(store_.is_open());
    EXPECT_EQ(store_.open(config_).code, StatusCode::Invalid);
}

TEST(ObjectStore, ClosedStoreRefusesWork) {
    ObjectStore store;
    ObjectPutParams params;
    ObjectPutResult result;
    EXPECT_EQ(store.put(params, &result).code, StatusCode::Invalid);

    std::vector<StoredObject> list;
    EXPECT_EQ(store.list(OwnerId{1}, &list).code, StatusCode::Invalid);
}

TEST(ObjectStore, InvalidConfigIsRefused) {
    stash::test::TempDir dir;
    ObjectStoreConfig cfg;
    cfg.data_root = dir.join("objects");
    cfg.db_path = dir.join("stash.db");
    cfg.compression_level = 0;

    ObjectStore store;
    const Status s = store.open(cfg);
    EXPECT_EQ(s.domain, StatusDomain::Config);
    EXPECT_FALSE(store.is_open());
}

// ============================================================================
// Put and get
// ============================================================================

TEST_F(ObjectStoreTest, PrivateObjectIsOwnerOnly) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "notes.txt", stash::test::bytes_of("hello world"), &id)));

    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, id, &got)));
    EXPECT_EQ(std::string(got.data.begin(), got.data.end()), "hello world");
    EXPECT_EQ(got.checksum_hex, kHelloSha256);
    EXPECT_EQ(got.content_type, "text/plain");
    EXPECT_EQ(got.content_disposition, "attachment; filename=\"notes.txt\"");
    EXPECT_EQ(got.object.size, 11u);

    ObjectGetResult denied;
    const Status s = store_.get(OwnerId{2}, id, &denied);
    EXPECT_EQ(s.domain, StatusDomain::Security);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_TRUE(denied.data.empty());

    StoredObject meta;
    EXPECT_EQ(store_.stat(OwnerId{2}, id, &meta).code, StatusCode::PermissionDenied);
}

TEST_F(ObjectStoreTest, PublicObjectIsReadableButNotWritableByOthers) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "open.md", stash::test::bytes_of("# shared"), &id, Visibility::Public)));

    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{2}, id, &got)));
    ASSERT_TRUE(is_ok(store_.get(OwnerId::invalid(), id, &got)));
    EXPECT_EQ(std::string(got.data.begin(), got.data.end()), "# shared");

    EXPECT_EQ(store_.remove(OwnerId{2}, id).code, StatusCode::PermissionDenied);
    EXPECT_EQ(store_.rename(OwnerId{2}, id, "mine.md").code, StatusCode::PermissionDenied);
    EXPECT_EQ(store_.set_visibility(OwnerId{2}, id, Visibility::Private).code, StatusCode::PermissionDenied);
}

TEST_F(ObjectStoreTest, UnknownIdIsNotFound) {
    ObjectGetResult got;
    const Status s = store_.get(OwnerId{1}, ObjectId{4242}, &got);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(classify(s), ErrorClass::NotFound);
}

TEST_F(ObjectStoreTest, StorageNameIsIndependentOfLogicalName) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "../../etc/passwd.txt", stash::test::bytes_of("root:x"), &id)));

    StoredObject obj;
    ASSERT_TRUE(is_ok(store_.stat(OwnerId{1}, id, &obj)));
    EXPECT_EQ(obj.logical_name, "../../etc/passwd.txt");
    EXPECT_EQ(obj.storage_name.find("passwd"), std::string::npos);
    EXPECT_EQ(obj.storage_name.substr(obj.storage_name.size() - 4), ".txt");
    EXPECT_TRUE(layout_storage_name_valid(obj.storage_name));
    EXPECT_TRUE(file_exists(layout_object_path(config_.data_root, obj.storage_name)));

    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, id, &got)));
    EXPECT_EQ(got.content_disposition, "attachment; filename=\"passwd.txt\"");
}

TEST_F(ObjectStoreTest, StreamedGetDeliversChunks) {
    ObjectStoreConfig cfg = config_;
    cfg.stream_threshold = 0;
    reopen(cfg);

    const std::vector<u8> data = stash::test::text_bytes(150 * 1024);
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "long.txt", data, &id)));

    std::vector<u8> joined;
    size_t chunks = 0;
    ObjectGetResult meta;
    const ChunkSink sink = [&](BufferView b) {
        ++chunks;
        joined.insert(joined.end(), b.data, b.data + b.len);
        return ok_status();
    };
    ASSERT_TRUE(is_ok(store_.get_stream(OwnerId{1}, id, sink, &meta)));
    EXPECT_EQ(joined, data);
    EXPECT_EQ(chunks, 3u);
    EXPECT_TRUE(meta.data.empty());
    EXPECT_EQ(meta.checksum_hex.size(), 64u);
}

// ============================================================================
// Ingestion policy
// ============================================================================

TEST_F(ObjectStoreTest, DisallowedExtensionIsRejectedBeforeReading) {
    stash::test::FailingSource src(stash::test::bytes_of("MZ"), 2);
    ObjectPutParams params;
    params.owner = OwnerId{1};
    params.logical_name = "tool.exe";
    params.source = &src;
    ObjectPutResult result;

    const Status s = store_.put(params, &result);
    EXPECT_EQ(reject_reason(s), RejectReason::Extension);
    EXPECT_EQ(src.reads(), 0u);
    EXPECT_TRUE(stash::test::list_dir(config_.data_root).empty());

    params.logical_name = "no_extension";
    EXPECT_EQ(reject_reason(store_.put(params, &result)), RejectReason::Extension);
}

TEST_F(ObjectStoreTest, DeclaredSizeAboveCeilingIsRejected) {
    MemorySource src({nullptr, 0});
    ObjectPutParams params;
    params.owner = OwnerId{1};
    params.logical_name = "big.pdf";
    params.source = &src;
    params.declared_size = config_.max_object_bytes + 1;
    ObjectPutResult result;
    EXPECT_EQ(reject_reason(store_.put(params, &result)), RejectReason::TooLarge);
}

TEST_F(ObjectStoreTest, StreamAboveCeilingLeavesNothing) {
    ObjectStoreConfig cfg = config_;
    cfg.max_object_bytes = 64 * 1024;
    reopen(cfg);

    ObjectId id = ObjectId::invalid();
    const Status s = put(1, "big.txt", stash::test::text_bytes(200 * 1024), &id);
    EXPECT_EQ(reject_reason(s), RejectReason::TooLarge);
    EXPECT_TRUE(stash::test::list_dir(config_.data_root).empty());

    std::vector<StoredObject> list;
    ASSERT_TRUE(is_ok(store_.list(OwnerId{1}, &list)));
    EXPECT_TRUE(list.empty());
}

TEST_F(ObjectStoreTest, SniffedTypeMustBeAllowed) {
    ObjectId id = ObjectId::invalid();
    const Status s = put(1, "fake.png", stash::test::noise(2048), &id);
    EXPECT_EQ(reject_reason(s), RejectReason::ContentType);
    EXPECT_TRUE(stash::test::list_dir(config_.data_root).empty());
}

TEST_F(ObjectStoreTest, QuotaIsEnforcedPerOwner) {
    ObjectStoreConfig cfg = config_;
    cfg.max_owner_bytes = 1000;
    reopen(cfg);

    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "a.txt", stash::test::text_bytes(600), &id)));
    EXPECT_EQ(reject_reason(put(1, "b.txt", stash::test::text_bytes(600), &id)), RejectReason::Quota);
    EXPECT_TRUE(is_ok(put(2, "b.txt", stash::test::text_bytes(600), &id)));

    u64 used = 0;
    ASSERT_TRUE(is_ok(store_.usage(OwnerId{1}, &used)));
    EXPECT_EQ(used, 600u);
    EXPECT_EQ(stash::test::list_dir(config_.data_root).size(), 2u);
}

// ============================================================================
// Encryption at rest
// ============================================================================

TEST_F(ObjectStoreTest, EncryptedObjectsNeedTheKey) {
    ObjectStoreConfig cfg = config_;
    cfg.has_key = true;
    ASSERT_TRUE(stash::security::key_from_hex(std::string(64, '7'), &cfg.key));
    reopen(cfg);

    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "diary.txt", stash::test::bytes_of("hello world"), &id)));

    StoredObject obj;
    ASSERT_TRUE(is_ok(store_.stat(OwnerId{1}, id, &obj)));
    EXPECT_EQ(obj.encrypted, Flag::Yes);
    EXPECT_TRUE(obj.has_nonce);
    EXPECT_EQ(obj.key_id, stash::security::key_id(cfg.key));

    const std::vector<u8> disk = read_file(layout_object_path(config_.data_root, obj.storage_name));
    const std::string needle = "hello world";
    EXPECT_EQ(std::search(disk.begin(), disk.end(), needle.begin(), needle.end()), disk.end());

    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, id, &got)));
    EXPECT_EQ(got.checksum_hex, kHelloSha256);

    // Key removed: the object stays listed but cannot be opened
    cfg.has_key = false;
    reopen(cfg);
    const Status s = store_.get(OwnerId{1}, id, &got);
    EXPECT_EQ(s.code, StatusCode::Crypto);
    EXPECT_EQ(classify(s), ErrorClass::Confidentiality);

    bool valid = true;
    ASSERT_TRUE(is_ok(store_.verify(OwnerId{1}, id, &valid)));
    EXPECT_FALSE(valid);

    // New writes without a key are stored in the clear
    ObjectId plain = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "plain.txt", stash::test::bytes_of("hello world"), &plain)));
    ASSERT_TRUE(is_ok(store_.stat(OwnerId{1}, plain, &obj)));
    EXPECT_EQ(obj.encrypted, Flag::No);
}

// ============================================================================
// Integrity
// ============================================================================

TEST_F(ObjectStoreTest, VerifyDetectsDamage) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "v.txt", stash::test::bytes_of("hello world"), &id)));

    bool valid = false;
    ASSERT_TRUE(is_ok(store_.verify(OwnerId{1}, id, &valid)));
    EXPECT_TRUE(valid);

    const std::string path = disk_path(id);
    ASSERT_EQ(::chmod(path.c_str(), 0600), 0);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "hello worle";
    }
    ASSERT_TRUE(is_ok(store_.verify(OwnerId{1}, id, &valid)));
    EXPECT_FALSE(valid);

    ObjectGetResult got;
    const Status s = store_.get(OwnerId{1}, id, &got);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_TRUE(got.data.empty());
}

TEST_F(ObjectStoreTest, MissingFileIsStorageFailure) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "lost.txt", stash::test::bytes_of("hello"), &id)));
    ASSERT_EQ(::unlink(disk_path(id).c_str()), 0);

    ObjectGetResult got;
    const Status s = store_.get(OwnerId{1}, id, &got);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, static_cast<u32>(ENOENT));
    EXPECT_EQ(classify(s), ErrorClass::Storage);
}

// ============================================================================
// Mutation
// ============================================================================

TEST_F(ObjectStoreTest, RenameKeepsBytesAndChecksExtension) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "draft.txt", stash::test::bytes_of("hello world"), &id)));
    const std::string before = disk_path(id);

    ASSERT_TRUE(is_ok(store_.rename(OwnerId{1}, id, "final.md")));
    EXPECT_EQ(reject_reason(store_.rename(OwnerId{1}, id, "final.sh")), RejectReason::Extension);

    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, id, &got)));
    EXPECT_EQ(got.object.logical_name, "final.md");
    EXPECT_EQ(got.content_disposition, "attachment; filename=\"final.md\"");
    EXPECT_EQ(disk_path(id), before);
}

TEST_F(ObjectStoreTest, VisibilityChange) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "later.txt", stash::test::bytes_of("soon public"), &id)));

    ObjectGetResult got;
    EXPECT_EQ(store_.get(OwnerId{2}, id, &got).code, StatusCode::PermissionDenied);
    ASSERT_TRUE(is_ok(store_.set_visibility(OwnerId{1}, id, Visibility::Public)));
    EXPECT_TRUE(is_ok(store_.get(OwnerId{2}, id, &got)));
}

TEST_F(ObjectStoreTest, RemoveDeletesRowAndFile) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "bye.txt", stash::test::bytes_of("bye"), &id)));
    const std::string path = disk_path(id);

    ASSERT_TRUE(is_ok(store_.remove(OwnerId{1}, id)));
    EXPECT_FALSE(file_exists(path));

    ObjectGetResult got;
    EXPECT_EQ(store_.get(OwnerId{1}, id, &got).code, StatusCode::NotFound);
    EXPECT_EQ(store_.remove(OwnerId{1}, id).code, StatusCode::NotFound);
}

TEST_F(ObjectStoreTest, RemoveToleratesMissingFile) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "half.txt", stash::test::bytes_of("half"), &id)));
    ASSERT_EQ(::unlink(disk_path(id).c_str()), 0);

    EXPECT_TRUE(is_ok(store_.remove(OwnerId{1}, id)));
    std::vector<StoredObject> list;
    ASSERT_TRUE(is_ok(store_.list(OwnerId{1}, &list)));
    EXPECT_TRUE(list.empty());
}

TEST_F(ObjectStoreTest, ReplaceSwapsContentAndReleasesQuota) {
    ObjectStoreConfig cfg = config_;
    cfg.max_owner_bytes = 1000;
    reopen(cfg);

    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "doc.txt", stash::test::text_bytes(700), &id)));
    const std::string old_path = disk_path(id);

    // 700 + 800 would exceed the cap; replacing frees the old 700
    const std::vector<u8> next = stash::test::text_bytes(800);
    MemorySource src({next.data(), static_cast<u32>(next.size())});
    ObjectPutResult result;
    ASSERT_TRUE(is_ok(store_.replace(OwnerId{1}, id, src, &result)));
    EXPECT_NE(result.object.id, id);
    EXPECT_EQ(result.object.logical_name, "doc.txt");
    EXPECT_FALSE(file_exists(old_path));

    ObjectGetResult got;
    EXPECT_EQ(store_.get(OwnerId{1}, id, &got).code, StatusCode::NotFound);
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, result.object.id, &got)));
    EXPECT_EQ(got.data, next);

    u64 used = 0;
    ASSERT_TRUE(is_ok(store_.usage(OwnerId{1}, &used)));
    EXPECT_EQ(used, 800u);
}

TEST_F(ObjectStoreTest, ReplaceWorksForOwnerAtTheCap) {
    ObjectStoreConfig cfg = config_;
    cfg.max_owner_bytes = 1000;
    reopen(cfg);

    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "doc.txt", stash::test::text_bytes(1000), &id)));
    EXPECT_EQ(reject_reason(put(1, "more.txt", stash::test::bytes_of("x"), nullptr)), RejectReason::Quota);

    const std::vector<u8> smaller = stash::test::text_bytes(10);
    MemorySource src({smaller.data(), static_cast<u32>(smaller.size())});
    ObjectPutResult result;
    ASSERT_TRUE(is_ok(store_.replace(OwnerId{1}, id, src, &result)));

    u64 used = 0;
    ASSERT_TRUE(is_ok(store_.usage(OwnerId{1}, &used)));
    EXPECT_EQ(used, 10u);
    EXPECT_EQ(stash::test::list_dir(config_.data_root).size(), 1u);
}

TEST_F(ObjectStoreTest, FailedMetadataWriteRemovesCommittedFile) {
    refuse_metadata_writes();

    const Status s = put(1, "doc.txt", stash::test::bytes_of("hello world"), nullptr);
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_TRUE(stash::test::list_dir(config_.data_root).empty());

    u64 used = 1;
    ASSERT_TRUE(is_ok(store_.usage(OwnerId{1}, &used)));
    EXPECT_EQ(used, 0u);
}

TEST_F(ObjectStoreTest, FailedReplaceKeepsOriginalObject) {
    const std::vector<u8> original = stash::test::bytes_of("first draft");
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "doc.txt", original, &id)));
    refuse_metadata_writes();

    const std::vector<u8> next = stash::test::bytes_of("second draft");
    MemorySource src({next.data(), static_cast<u32>(next.size())});
    ObjectPutResult result;
    EXPECT_EQ(store_.replace(OwnerId{1}, id, src, &result).code, StatusCode::Conflict);

    // Only the original file is left, and it still reads back
    EXPECT_EQ(stash::test::list_dir(config_.data_root).size(), 1u);
    ObjectGetResult got;
    ASSERT_TRUE(is_ok(store_.get(OwnerId{1}, id, &got)));
    EXPECT_EQ(got.data, original);
}

TEST_F(ObjectStoreTest, ReplaceByOtherOwnerIsDenied) {
    ObjectId id = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "mine.txt", stash::test::bytes_of("mine"), &id, Visibility::Public)));

    const std::vector<u8> next = stash::test::bytes_of("yours");
    MemorySource src({next.data(), static_cast<u32>(next.size())});
    ObjectPutResult result;
    EXPECT_EQ(store_.replace(OwnerId{2}, id, src, &result).code, StatusCode::PermissionDenied);
}

// ============================================================================
// Groups
// ============================================================================

TEST_F(ObjectStoreTest, RemovingGroupRemovesItsObjects) {
    GroupId group = GroupId::invalid();
    ASSERT_TRUE(is_ok(store_.create_group(OwnerId{1}, "holiday", Visibility::Private, &group)));

    ObjectId a = ObjectId::invalid();
    ObjectId b = ObjectId::invalid();
    ObjectId loose = ObjectId::invalid();
    ASSERT_TRUE(is_ok(put(1, "a.txt", stash::test::bytes_of("a"), &a, Visibility::Private, group)));
    ASSERT_TRUE(is_ok(put(1, "b.txt", stash::test::bytes_of("b"), &b, Visibility::Private, group)));
    ASSERT_TRUE(is_ok(put(1, "c.txt", stash::test::bytes_of("c"), &loose)));
    EXPECT_EQ(stash::test::list_dir(config_.data_root).size(), 3u);

    EXPECT_EQ(store_.remove_group(OwnerId{2}, group).code, StatusCode::PermissionDenied);
    ASSERT_TRUE(is_ok(store_.remove_group(OwnerId{1}, group)));

    ObjectGetResult got;
    EXPECT_EQ(store_.get(OwnerId{1}, a, &got).code, StatusCode::NotFound);
    EXPECT_EQ(store_.get(OwnerId{1}, b, &got).code, StatusCode::NotFound);
    EXPECT_TRUE(is_ok(store_.get(OwnerId{1}, loose, &got)));
    EXPECT_EQ(stash::test::list_dir(config_.data_root).size(), 1u);
}

TEST_F(ObjectStoreTest, OnlyGroupOwnerCanAttachObjects) {
    GroupId group = GroupId::invalid();
    ASSERT_TRUE(is_ok(store_.create_group(OwnerId{1}, "shared", Visibility::Public, &group)));

    ObjectId id = ObjectId::invalid();
    EXPECT_EQ(put(2, "x.txt", stash::test::bytes_of("x"), &id, Visibility::Private, group).code,
              StatusCode::PermissionDenied);
    EXPECT_EQ(put(1, "x.txt", stash::test::bytes_of("x"), &id, Visibility::Private, GroupId{999}).code,
              StatusCode::NotFound);
}

// ============================================================================
// Response headers
// ============================================================================

TEST(ContentDisposition, SanitizesFilename) {
    EXPECT_EQ(content_disposition_for("report.pdf"), "attachment; filename=\"report.pdf\"");
    EXPECT_EQ(content_disposition_for("a/b\"c.txt"), "attachment; filename=\"b_c.txt\"");
    EXPECT_EQ(content_disposition_for("x\r\ny.txt"), "attachment; filename=\"x__y.txt\"");
    EXPECT_EQ(content_disposition_for("dir/"), "attachment; filename=\"download\"");
    EXPECT_STREQ(kChecksumHeader, "X-Checksum-SHA256");
}
