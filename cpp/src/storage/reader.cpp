#include "stash/storage/reader.hpp"
#include "stash/storage/codec.hpp"
#include "stash/storage/config.hpp"
#include "stash/storage/hashing.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <new>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace stash::storage {

using namespace stash::core;

namespace {
    [[nodiscard]] Status io_error() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    [[nodiscard]] Status corrupt() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Corrupt);
    }

    class FdCloser {
    public:
        explicit FdCloser(int fd) noexcept : fd_(fd) {}
        ~FdCloser() noexcept {
            if (fd_ >= 0) ::close(fd_);
        }
        FdCloser(const FdCloser&) = delete;
        FdCloser& operator=(const FdCloser&) = delete;

        [[nodiscard]] int get() const noexcept { return fd_; }

    private:
        int fd_;
    };

    // Stored bytes of one object, after the sealed box (if any) was opened
    struct Payload {
        OnDiskFormat format{OnDiskFormat::Plain};
        int fd{-1};
        bool in_memory{false};
        std::vector<u8> mem;
        bool compressed{false};
        u64 limit{0};
    };

    [[nodiscard]] Status open_file(const std::string& path, int* fd) noexcept {
        *fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (*fd < 0) {
            if (errno == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error();
        }
        return ok_status();
    }

    [[nodiscard]] Status read_file(int fd, std::vector<u8>* out) noexcept {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            return io_error();
        }
        if (static_cast<u64>(st.st_size) > std::numeric_limits<u32>::max()) {
            return corrupt();
        }
        try {
            out->resize(static_cast<size_t>(st.st_size));
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }

        size_t done = 0;
        while (done < out->size()) {
            const ssize_t n = ::pread(fd, out->data() + done, out->size() - done, static_cast<off_t>(done));
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error();
            }
            if (n == 0) {
                break;
            }
            done += static_cast<size_t>(n);
        }
        out->resize(done);
        return ok_status();
    }

    [[nodiscard]] Status open_sealed(const std::string& path,
        const StoredObject& obj,
        const ReaderOptions& opts,
        Payload* p) noexcept {
        if (opts.key == nullptr) {
            spdlog::warn("reader: object {} is encrypted (key {}) and no key is configured", obj.id.v, obj.key_id);
            return make_status(StatusDomain::Security, StatusCode::Crypto);
        }

        int raw_fd = -1;
        Status s = open_file(path, &raw_fd);
        if (!is_ok(s)) {
            return s;
        }
        FdCloser fd(raw_fd);

        std::vector<u8> sealed;
        s = read_file(fd.get(), &sealed);
        if (!is_ok(s)) {
            return s;
        }

        if (obj.has_nonce && sealed.size() >= security::kNonceBytes &&
            std::memcmp(sealed.data(), obj.nonce.b.data(), security::kNonceBytes) != 0) {
            spdlog::error("reader: object {} nonce does not match its metadata", obj.id.v);
            return corrupt();
        }

        s = security::open_box(*opts.key, BufferView{sealed.data(), static_cast<u32>(sealed.size())}, &p->mem);
        if (!is_ok(s)) {
            spdlog::warn("reader: cannot decrypt object {} (written with key {})", obj.id.v, obj.key_id);
            return s;
        }
        p->in_memory = true;
        return ok_status();
    }

    // Only rows without format metadata get here. The probe is bounded:
    // a failed open falls back to the raw bytes, and the checksum still
    // has to match afterwards.
    [[nodiscard]] Status open_legacy(const std::string& path,
        const StoredObject& obj,
        const ReaderOptions& opts,
        Payload* p) noexcept {
        int raw_fd = -1;
        Status s = open_file(path, &raw_fd);
        if (!is_ok(s)) {
            return s;
        }
        FdCloser fd(raw_fd);

        std::vector<u8> raw;
        s = read_file(fd.get(), &raw);
        if (!is_ok(s)) {
            return s;
        }

        bool opened = false;
        if (opts.key != nullptr && obj.encrypted != Flag::No) {
            std::vector<u8> plain;
            s = security::open_box(*opts.key, BufferView{raw.data(), static_cast<u32>(raw.size())}, &plain);
            if (is_ok(s)) {
                p->mem = std::move(plain);
                opened = true;
            } else if (obj.encrypted == Flag::Yes) {
                return s;
            }
        }
        if (!opened) {
            if (obj.encrypted == Flag::Unknown && opts.key != nullptr) {
                spdlog::info("reader: legacy object {} read as unencrypted", obj.id.v);
            }
            p->mem = std::move(raw);
        }
        p->in_memory = true;

        if (obj.compressed == Flag::Unknown) {
            p->compressed = codec_has_frame_signature(BufferView{p->mem.data(), static_cast<u32>(p->mem.size())});
        } else {
            p->compressed = obj.compressed == Flag::Yes;
        }
        return ok_status();
    }

    [[nodiscard]] Status prepare(const std::string& path,
        const StoredObject& obj,
        const ReaderOptions& opts,
        Payload* p) noexcept {
        p->format = layout_classify(obj.compressed, obj.encrypted);
        if (obj.size_known) {
            p->limit = obj.size;
        } else {
            p->limit = opts.max_object_bytes != 0 ? opts.max_object_bytes : std::numeric_limits<u64>::max();
        }

        switch (p->format) {
            case OnDiskFormat::Plain:
            case OnDiskFormat::Compressed:
                p->compressed = p->format == OnDiskFormat::Compressed;
                return open_file(path, &p->fd);
            case OnDiskFormat::Encrypted:
            case OnDiskFormat::EncryptedCompressed:
                p->compressed = p->format == OnDiskFormat::EncryptedCompressed;
                return open_sealed(path, obj, opts, p);
            case OnDiskFormat::LegacyUnknown:
                return open_legacy(path, obj, opts, p);
        }
        return make_status(StatusDomain::Storage, StatusCode::Unsupported);
    }

    // One full decode of the payload. Every plaintext byte is hashed and
    // counted; `emit` (optional) receives it afterwards.
    [[nodiscard]] Status decode_pass(Payload& p, const ChunkSink* emit, Hash256* digest, u64* produced) noexcept {
        Sha256 hash;
        Status s = hash.init();
        if (!is_ok(s)) {
            return s;
        }
        *produced = 0;

        const CodecSink deliver = [&](BufferView b) -> Status {
            if (b.len > p.limit - *produced) {
                return corrupt();
            }
            *produced += b.len;
            Status hs = hash.update(b);
            if (!is_ok(hs)) {
                return hs;
            }
            return emit ? (*emit)(b) : ok_status();
        };

        Decompressor inflater;
        if (p.compressed) {
            s = inflater.init(p.limit);
            if (!is_ok(s)) {
                return s;
            }
        }
        const auto feed = [&](BufferView b) -> Status {
            return p.compressed ? inflater.update(b, deliver) : deliver(b);
        };

        if (p.in_memory) {
            size_t pos = 0;
            while (pos < p.mem.size()) {
                const u32 n = static_cast<u32>(std::min<size_t>(kChunkBytes, p.mem.size() - pos));
                s = feed(BufferView{p.mem.data() + pos, n});
                if (!is_ok(s)) {
                    return s;
                }
                pos += n;
            }
        } else {
            if (::lseek(p.fd, 0, SEEK_SET) != 0) {
                return io_error();
            }
            std::vector<u8> buf;
            try {
                buf.resize(kChunkBytes);
            } catch (const std::bad_alloc&) {
                return make_status(StatusDomain::Storage, StatusCode::Unknown);
            }
            for (;;) {
                const ssize_t n = ::read(p.fd, buf.data(), buf.size());
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return io_error();
                }
                if (n == 0) {
                    break;
                }
                s = feed(BufferView{buf.data(), static_cast<u32>(n)});
                if (!is_ok(s)) {
                    return s;
                }
            }
        }

        if (p.compressed) {
            s = inflater.finish();
            if (!is_ok(s)) {
                return s;
            }
        }
        return hash.finish(digest);
    }

    [[nodiscard]] Status check_integrity(const StoredObject& obj, const Hash256& digest, u64 produced) noexcept {
        if ((obj.size_known && produced != obj.size) || !hash_equal(digest, obj.checksum)) {
            spdlog::error("reader: integrity check failed for object {} ({})", obj.id.v, obj.storage_name);
            return corrupt();
        }
        return ok_status();
    }

    // Regroups decoder output into fixed kChunkBytes pieces
    // Regroups plaintext into kChunkBytes pieces. In record mode the digest
    // of every piece is kept and nothing is delivered; with `expect`, each
    // piece must match its recorded digest before it reaches the sink.
    class Rechunker {
    public:
        explicit Rechunker(std::vector<Hash256>* record) : record_(record) { buf_.reserve(kChunkBytes); }
        Rechunker(const ChunkSink& sink, const std::vector<Hash256>& expect) : sink_(&sink), expect_(&expect) {
            buf_.reserve(kChunkBytes);
        }

        [[nodiscard]] Status push(BufferView b) noexcept {
            while (b.len > 0) {
                const u32 take = std::min<u32>(b.len, kChunkBytes - static_cast<u32>(buf_.size()));
                buf_.insert(buf_.end(), b.data, b.data + take);
                b.data += take;
                b.len -= take;
                if (buf_.size() == kChunkBytes) {
                    Status s = flush();
                    if (!is_ok(s)) {
                        return s;
                    }
                }
            }
            return ok_status();
        }

        [[nodiscard]] Status flush() noexcept {
            if (buf_.empty()) {
                return ok_status();
            }
            const BufferView piece{buf_.data(), static_cast<u32>(buf_.size())};
            Hash256 h{};
            Status s = hash_compute(piece, &h);
            if (is_ok(s)) {
                s = record_ ? keep(h) : deliver(piece, h);
            }
            buf_.clear();
            return s;
        }

        // Pieces seen so far match every recorded piece
        [[nodiscard]] bool complete() const noexcept { return !expect_ || next_ == expect_->size(); }

    private:
        [[nodiscard]] Status keep(const Hash256& h) noexcept {
            try {
                record_->push_back(h);
            } catch (const std::bad_alloc&) {
                return make_status(StatusDomain::Storage, StatusCode::Unknown);
            }
            return ok_status();
        }

        [[nodiscard]] Status deliver(BufferView piece, const Hash256& h) noexcept {
            if (next_ >= expect_->size() || !hash_equal(h, (*expect_)[next_])) {
                return corrupt();
            }
            ++next_;
            return (*sink_)(piece);
        }

        const ChunkSink* sink_{nullptr};
        std::vector<Hash256>* record_{nullptr};
        const std::vector<Hash256>* expect_{nullptr};
        size_t next_{0};
        std::vector<u8> buf_;
    };

    void fill_stats(const Payload& p, u64 produced, ReadStats* stats) noexcept {
        if (stats) {
            stats->size = produced;
            stats->format = p.format;
        }
    }
}

Status read_object(const std::string& path,
    const StoredObject& obj,
    const ReaderOptions& opts,
    std::vector<u8>* out,
    ReadStats* stats) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Payload p;
    Status s = prepare(path, obj, opts, &p);
    FdCloser fd(p.fd);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<u8> plain;
    try {
        if (obj.size_known) {
            plain.reserve(static_cast<size_t>(obj.size));
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    const ChunkSink append = [&plain](BufferView b) -> Status {
        try {
            plain.insert(plain.end(), b.data, b.data + b.len);
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        return ok_status();
    };

    Hash256 digest{};
    u64 produced = 0;
    s = decode_pass(p, &append, &digest, &produced);
    if (!is_ok(s)) {
        return s;
    }
    s = check_integrity(obj, digest, produced);
    if (!is_ok(s)) {
        return s;
    }

    *out = std::move(plain);
    fill_stats(p, produced, stats);
    return ok_status();
}

Status verify_object(const std::string& path,
    const StoredObject& obj,
    const ReaderOptions& opts,
    ReadStats* stats) noexcept {
    Payload p;
    Status s = prepare(path, obj, opts, &p);
    FdCloser fd(p.fd);
    if (!is_ok(s)) {
        return s;
    }

    Hash256 digest{};
    u64 produced = 0;
    s = decode_pass(p, nullptr, &digest, &produced);
    if (!is_ok(s)) {
        return s;
    }
    s = check_integrity(obj, digest, produced);
    if (!is_ok(s)) {
        return s;
    }
    fill_stats(p, produced, stats);
    return ok_status();
}

Status read_object_chunked(const std::string& path,
    const StoredObject& obj,
    const ReaderOptions& opts,
    const ChunkSink& sink,
    ReadStats* stats) noexcept {
    if (!sink) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Small objects: one buffered pass, then sliced delivery
    if (obj.size_known && obj.size <= opts.stream_threshold) {
        std::vector<u8> plain;
        Status s = read_object(path, obj, opts, &plain, stats);
        if (!is_ok(s)) {
            return s;
        }
        size_t pos = 0;
        while (pos < plain.size()) {
            const u32 n = static_cast<u32>(std::min<size_t>(kChunkBytes, plain.size() - pos));
            s = sink(BufferView{plain.data() + pos, n});
            if (!is_ok(s)) {
                return s;
            }
            pos += n;
        }
        return ok_status();
    }

    Payload p;
    Status s = prepare(path, obj, opts, &p);
    FdCloser fd(p.fd);
    if (!is_ok(s)) {
        return s;
    }

    // Verification pass: output discarded, per-piece digests kept
    std::vector<Hash256> pieces;
    Rechunker recorder(&pieces);
    const ChunkSink record = [&recorder](BufferView b) { return recorder.push(b); };
    Hash256 digest{};
    u64 produced = 0;
    s = decode_pass(p, &record, &digest, &produced);
    if (is_ok(s)) {
        s = recorder.flush();
    }
    if (!is_ok(s)) {
        return s;
    }
    s = check_integrity(obj, digest, produced);
    if (!is_ok(s)) {
        return s;
    }

    // Delivery pass: a piece reaches the sink only if it matches the
    // verified one, so bytes changed on disk in between are never delivered
    Rechunker chunks(sink, pieces);
    const ChunkSink forward = [&chunks](BufferView b) { return chunks.push(b); };
    Hash256 second{};
    u64 delivered = 0;
    s = decode_pass(p, &forward, &second, &delivered);
    if (is_ok(s) && (delivered != produced || !hash_equal(second, digest))) {
        s = corrupt();
    }
    if (is_ok(s)) {
        s = chunks.flush();
    }
    if (is_ok(s) && !chunks.complete()) {
        s = corrupt();
    }
    if (s.code == StatusCode::Corrupt) {
        spdlog::error("reader: object {} changed between verification and delivery", obj.id.v);
    }
    if (!is_ok(s)) {
        return s;
    }

    fill_stats(p, produced, stats);
    return ok_status();
}

} // namespace stash::storage
