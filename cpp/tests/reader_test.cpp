#include <algorithm>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "stash/storage/codec.hpp"
#include "stash/storage/config.hpp"
#include "stash/storage/hashing.hpp"
#include "stash/storage/reader.hpp"
#include "stash/storage/writer.hpp"
#include "test_support.hpp"

using namespace stash::storage;
using stash::core::Flag;
using stash::core::Status;
using stash::core::StatusCode;
using stash::core::StoredObject;

namespace {
std::vector<u8> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::vector<u8>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void flip_byte(const std::string& path, size_t offset) {
    std::vector<u8> data = read_file(path);
    ASSERT_LT(offset, data.size());
    data[offset] ^= 0x5A;
    write_file(path, data);
}

stash::core::Hash256 digest_of(const std::vector<u8>& data) {
    stash::core::Hash256 h{};
    EXPECT_EQ(hash_compute({data.data(), static_cast<u32>(data.size())}, &h).code, StatusCode::Ok);
    return h;
}

stash::security::Key256 key_seq(u8 start) {
    stash::security::Key256 k{};
    for (size_t i = 0; i < sizeof(k.b); ++i) {
        k.b[i] = static_cast<u8>(start + i);
    }
    return k;
}

// Metadata row as the store would record it
StoredObject record_of(const WrittenObject& w, const std::string& name) {
    StoredObject obj;
    obj.id = stash::core::ObjectId{1};
    obj.owner = stash::core::OwnerId{1};
    obj.logical_name = name;
    obj.storage_name = name;
    obj.size = w.size;
    obj.size_known = true;
    obj.checksum = w.checksum;
    obj.content_type = w.content_type;
    obj.compressed = stash::core::flag_from_bool(w.compressed);
    obj.encrypted = stash::core::flag_from_bool(w.encrypted);
    obj.has_nonce = w.encrypted;
    obj.nonce = w.nonce;
    return obj;
}

// Row written before format metadata existed
StoredObject legacy_record(const std::vector<u8>& plaintext, const std::string& name) {
    StoredObject obj;
    obj.id = stash::core::ObjectId{2};
    obj.owner = stash::core::OwnerId{1};
    obj.logical_name = name;
    obj.storage_name = name;
    obj.size_known = false;
    obj.checksum = digest_of(plaintext);
    obj.content_type = "text/plain";
    obj.compressed = Flag::Unknown;
    obj.encrypted = Flag::Unknown;
    return obj;
}
} // namespace

class ObjectReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir_.path().empty());
        wopts_.max_bytes = 4 * kMiB;
        wopts_.allowed_mime_prefixes = {"image/", "text/", "application/pdf"};
        ropts_.stream_threshold = 1 * kMiB;
        ropts_.max_object_bytes = 4 * kMiB;
    }

    StoredObject store(const std::vector<u8>& data, const std::string& name) {
        MemorySource src({data.data(), static_cast<u32>(data.size())});
        WrittenObject w;
        EXPECT_EQ(write_object(src, dir_.path(), name, wopts_, &w).code, StatusCode::Ok);
        return record_of(w, name);
    }

    std::string path(const std::string& name) const { return dir_.join(name); }

    Status read(const StoredObject& obj, std::vector<u8>* out, ReadStats* stats = nullptr) {
        return read_object(path(obj.storage_name), obj, ropts_, out, stats);
    }

    stash::test::TempDir dir_;
    WriterOptions wopts_;
    ReaderOptions ropts_;
    stash::security::Key256 key_ = key_seq(1);
};

// ============================================================================
// Round trips through every format
// ============================================================================

TEST_F(ObjectReaderTest, PlainRoundTrip) {
    const std::vector<u8> data = stash::test::bytes_of("hello world");
    const StoredObject obj = store(data, "plain.txt");

    std::vector<u8> out;
    ReadStats stats;
    ASSERT_EQ(read(obj, &out, &stats).code, StatusCode::Ok);
    EXPECT_EQ(out, data);
    EXPECT_EQ(stats.format, OnDiskFormat::Plain);
    EXPECT_EQ(stats.size, data.size());
}

TEST_F(ObjectReaderTest, CompressedRoundTrip) {
    const std::vector<u8> data = stash::test::text_bytes(500 * 1024);
    const StoredObject obj = store(data, "comp.txt");
    ASSERT_EQ(obj.compressed, Flag::Yes);

    std::vector<u8> out;
    ReadStats stats;
    ASSERT_EQ(read(obj, &out, &stats).code, StatusCode::Ok);
    EXPECT_EQ(out, data);
    EXPECT_EQ(stats.format, OnDiskFormat::Compressed);
}

TEST_F(ObjectReaderTest, EncryptedRoundTrips) {
    wopts_.key = &key_;
    ropts_.key = &key_;

    const std::vector<u8> small = stash::test::bytes_of("hello world");
    const std::vector<u8> large = stash::test::text_bytes(300 * 1024);
    const StoredObject a = store(small, "enc.txt");
    const StoredObject b = store(large, "enccomp.txt");

    std::vector<u8> out;
    ReadStats stats;
    ASSERT_EQ(read(a, &out, &stats).code, StatusCode::Ok);
    EXPECT_EQ(out, small);
    EXPECT_EQ(stats.format, OnDiskFormat::Encrypted);

    ASSERT_EQ(read(b, &out, &stats).code, StatusCode::Ok);
    EXPECT_EQ(out, large);
    EXPECT_EQ(stats.format, OnDiskFormat::EncryptedCompressed);
}

TEST_F(ObjectReaderTest, EmptyAndCeilingSizedObjects) {
    wopts_.max_bytes = 256 * 1024;
    const StoredObject empty = store({}, "empty.txt");
    const std::vector<u8> full = stash::test::text_bytes(256 * 1024);
    const StoredObject ceiling = store(full, "full.txt");

    std::vector<u8> out{1};
    ASSERT_EQ(read(empty, &out).code, StatusCode::Ok);
    EXPECT_TRUE(out.empty());
    ASSERT_EQ(read(ceiling, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, full);
}

// ============================================================================
// Integrity and confidentiality failures
// ============================================================================

TEST_F(ObjectReaderTest, FlippedPlainByteIsCorrupt) {
    const StoredObject obj = store(stash::test::bytes_of("hello world"), "flip.txt");
    flip_byte(path(obj.storage_name), 3);

    std::vector<u8> out;
    const Status s = read(obj, &out);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_TRUE(out.empty());
}

TEST_F(ObjectReaderTest, FlippedCompressedByteIsCorrupt) {
    const StoredObject obj = store(stash::test::text_bytes(200 * 1024), "flipz.txt");
    ASSERT_EQ(obj.compressed, Flag::Yes);
    flip_byte(path(obj.storage_name), 40);

    std::vector<u8> out;
    EXPECT_EQ(read(obj, &out).code, StatusCode::Corrupt);
}

TEST_F(ObjectReaderTest, WrongChecksumIsCorrupt) {
    StoredObject obj = store(stash::test::bytes_of("hello world"), "sum.txt");
    obj.checksum.b[0] ^= 0x01;
    std::vector<u8> out;
    EXPECT_EQ(read(obj, &out).code, StatusCode::Corrupt);
    EXPECT_EQ(verify_object(path(obj.storage_name), obj, ropts_).code, StatusCode::Corrupt);
}

TEST_F(ObjectReaderTest, WrongOrMissingKeyIsCrypto) {
    wopts_.key = &key_;
    const StoredObject obj = store(stash::test::bytes_of("hello world"), "key.txt");

    std::vector<u8> out;
    Status s = read(obj, &out);
    EXPECT_EQ(s.code, StatusCode::Crypto);

    const stash::security::Key256 other = key_seq(2);
    ropts_.key = &other;
    s = read(obj, &out);
    EXPECT_EQ(s.domain, stash::core::StatusDomain::Security);
    EXPECT_EQ(s.code, StatusCode::Crypto);
}

TEST_F(ObjectReaderTest, TamperedCiphertextIsCrypto) {
    wopts_.key = &key_;
    ropts_.key = &key_;
    const StoredObject obj = store(stash::test::bytes_of("hello world"), "tamper.txt");
    flip_byte(path(obj.storage_name), stash::security::kNonceBytes + 1);

    std::vector<u8> out;
    EXPECT_EQ(read(obj, &out).code, StatusCode::Crypto);
}

TEST_F(ObjectReaderTest, NonceMismatchIsCorrupt) {
    wopts_.key = &key_;
    ropts_.key = &key_;
    StoredObject obj = store(stash::test::bytes_of("hello world"), "nonce.txt");
    obj.nonce.b[0] ^= 0xFF;

    std::vector<u8> out;
    EXPECT_EQ(read(obj, &out).code, StatusCode::Corrupt);
}

TEST_F(ObjectReaderTest, MissingFileIsNotFound) {
    const StoredObject obj = store(stash::test::bytes_of("gone"), "gone.txt");
    ASSERT_EQ(::unlink(path(obj.storage_name).c_str()), 0);

    std::vector<u8> out;
    const Status s = read(obj, &out);
    EXPECT_EQ(s.domain, stash::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, StatusCode::NotFound);
}

// ============================================================================
// Legacy rows
// ============================================================================

TEST_F(ObjectReaderTest, LegacyPlainFile) {
    const std::vector<u8> data = stash::test::bytes_of("written long ago");
    write_file(path("old.txt"), data);
    ropts_.key = &key_;

    std::vector<u8> out;
    ReadStats stats;
    ASSERT_EQ(read(legacy_record(data, "old.txt"), &out, &stats).code, StatusCode::Ok);
    EXPECT_EQ(out, data);
    EXPECT_EQ(stats.format, OnDiskFormat::LegacyUnknown);
}

TEST_F(ObjectReaderTest, LegacyCompressedFile) {
    const std::vector<u8> data = stash::test::text_bytes(20 * 1024);
    std::vector<u8> frame;
    ASSERT_EQ(compress_buffer({data.data(), static_cast<u32>(data.size())}, 6, &frame).code, StatusCode::Ok);
    write_file(path("oldz.txt"), frame);

    std::vector<u8> out;
    ASSERT_EQ(read(legacy_record(data, "oldz.txt"), &out).code, StatusCode::Ok);
    EXPECT_EQ(out, data);
}

TEST_F(ObjectReaderTest, LegacySealedFile) {
    const std::vector<u8> data = stash::test::bytes_of("sealed before metadata");
    std::vector<u8> sealed;
    stash::security::Nonce12 nonce{};
    ASSERT_EQ(stash::security::seal_box(key_, {data.data(), static_cast<u32>(data.size())}, &sealed, &nonce).code,
              StatusCode::Ok);
    write_file(path("olds.txt"), sealed);
    ropts_.key = &key_;

    std::vector<u8> out;
    ASSERT_EQ(read(legacy_record(data, "olds.txt"), &out).code, StatusCode::Ok);
    EXPECT_EQ(out, data);

    // Without the key the raw bytes are tried and fail the checksum
    ropts_.key = nullptr;
    EXPECT_EQ(read(legacy_record(data, "olds.txt"), &out).code, StatusCode::Corrupt);
}

TEST_F(ObjectReaderTest, LegacyDecodeIsBounded) {
    const std::vector<u8> data = stash::test::text_bytes(512 * 1024);
    std::vector<u8> frame;
    ASSERT_EQ(compress_buffer({data.data(), static_cast<u32>(data.size())}, 9, &frame).code, StatusCode::Ok);
    write_file(path("bomb.txt"), frame);
    ropts_.max_object_bytes = 64 * 1024;

    std::vector<u8> out;
    EXPECT_EQ(read(legacy_record(data, "bomb.txt"), &out).code, StatusCode::Corrupt);
}

// ============================================================================
// Chunked delivery
// ============================================================================

TEST_F(ObjectReaderTest, ChunkedDeliveryUsesFixedChunks) {
    const std::vector<u8> data = stash::test::text_bytes(200 * 1024);
    const StoredObject obj = store(data, "chunks.txt");
    ropts_.stream_threshold = 0;

    std::vector<u32> sizes;
    std::vector<u8> joined;
    const ChunkSink sink = [&](BufferView b) {
        sizes.push_back(b.len);
        joined.insert(joined.end(), b.data, b.data + b.len);
        return stash::core::ok_status();
    };
    ASSERT_EQ(read_object_chunked(path(obj.storage_name), obj, ropts_, sink).code, StatusCode::Ok);
    EXPECT_EQ(joined, data);
    ASSERT_EQ(sizes.size(), 4u);
    EXPECT_EQ(sizes[0], kChunkBytes);
    EXPECT_EQ(sizes[1], kChunkBytes);
    EXPECT_EQ(sizes[2], kChunkBytes);
    EXPECT_EQ(sizes[3], 200u * 1024u - 3u * kChunkBytes);
}

TEST_F(ObjectReaderTest, BufferedPathAlsoSlices) {
    const std::vector<u8> data = stash::test::text_bytes(100 * 1024);
    const StoredObject obj = store(data, "slices.txt");

    std::vector<u32> sizes;
    const ChunkSink sink = [&](BufferView b) {
        sizes.push_back(b.len);
        return stash::core::ok_status();
    };
    ASSERT_EQ(read_object_chunked(path(obj.storage_name), obj, ropts_, sink).code, StatusCode::Ok);
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_EQ(sizes[0], kChunkBytes);
}

TEST_F(ObjectReaderTest, CorruptObjectDeliversNothing) {
    const std::vector<u8> data = stash::test::text_bytes(200 * 1024);
    StoredObject obj = store(data, "nochunks.txt");
    obj.checksum.b[5] ^= 0x10;
    ropts_.stream_threshold = 0;

    size_t calls = 0;
    const ChunkSink sink = [&](BufferView) {
        ++calls;
        return stash::core::ok_status();
    };
    EXPECT_EQ(read_object_chunked(path(obj.storage_name), obj, ropts_, sink).code, StatusCode::Corrupt);
    EXPECT_EQ(calls, 0u);
}

TEST_F(ObjectReaderTest, BytesChangedAfterVerificationAreNotDelivered) {
    wopts_.compression_enabled = false;
    const std::vector<u8> data = stash::test::text_bytes(200 * 1024);
    const StoredObject obj = store(data, "inplace.txt");
    ASSERT_EQ(obj.compressed, Flag::No);
    ropts_.stream_threshold = 0;

    // Rewrites the last piece in place once delivery has started
    const size_t target = 3 * kChunkBytes + 100;
    std::vector<u8> delivered;
    const ChunkSink sink = [&](BufferView b) {
        if (delivered.empty()) {
            flip_byte(path(obj.storage_name), target);
        }
        delivered.insert(delivered.end(), b.data, b.data + b.len);
        return stash::core::ok_status();
    };
    EXPECT_EQ(read_object_chunked(path(obj.storage_name), obj, ropts_, sink).code, StatusCode::Corrupt);
    ASSERT_EQ(delivered.size(), 3u * kChunkBytes);
    EXPECT_TRUE(std::equal(delivered.begin(), delivered.end(), data.begin()));
}

TEST_F(ObjectReaderTest, SinkErrorStopsDelivery) {
    const std::vector<u8> data = stash::test::text_bytes(200 * 1024);
    const StoredObject obj = store(data, "stop.txt");
    ropts_.stream_threshold = 0;

    size_t calls = 0;
    const ChunkSink sink = [&](BufferView) {
        ++calls;
        return stash::core::make_status(stash::core::StatusDomain::Storage, StatusCode::Io, 32);
    };
    const Status s = read_object_chunked(path(obj.storage_name), obj, ropts_, sink);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(calls, 1u);
}

TEST_F(ObjectReaderTest, VerifyWithoutOutput) {
    const StoredObject obj = store(stash::test::text_bytes(70 * 1024), "verify.txt");
    ReadStats stats;
    ASSERT_EQ(verify_object(path(obj.storage_name), obj, ropts_, &stats).code, StatusCode::Ok);
    EXPECT_EQ(stats.size, 70u * 1024u);
}
