#include "stash/storage/writer.hpp"
#include "stash/storage/config.hpp"
#include "stash/storage/layout.hpp"
#include "stash/storage/sniff.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <new>
#include <utility>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace stash::storage {

using namespace stash::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {
    [[nodiscard]] Status io_error() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    [[nodiscard]] Status write_all(int fd, const u8* data, size_t len) noexcept {
        size_t written = 0;
        while (written < len) {
            const ssize_t n = ::write(fd, data + written, len - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error();
            }
            written += static_cast<size_t>(n);
        }
        return ok_status();
    }

    [[nodiscard]] Status read_all_at(int fd, u8* data, size_t len) noexcept {
        size_t done = 0;
        while (done < len) {
            const ssize_t n = ::pread(fd, data + done, len - done, static_cast<off_t>(done));
            if (n < 0) {
                if (errno == EINTR) continue;
                return io_error();
            }
            if (n == 0) {
                return make_status(StatusDomain::Storage, StatusCode::Io, EIO);
            }
            done += static_cast<size_t>(n);
        }
        return ok_status();
    }

    // Makes the rename itself durable
    [[nodiscard]] Status fsync_dir(const std::string& dir) noexcept {
        const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0) {
            return io_error();
        }
        if (::fsync(fd) != 0) {
            const Status s = io_error();
            ::close(fd);
            return s;
        }
        ::close(fd);
        return ok_status();
    }
}

// ========================================================================
// TempFileGuard
// ========================================================================

TempFileGuard::~TempFileGuard() noexcept {
    discard();
}

Status TempFileGuard::create(const std::string& dir) noexcept {
    discard();
    try {
        std::string tmpl = layout_object_path(dir, kTempPrefix);
        tmpl += "XXXXXX";
        const int fd = ::mkstemp(tmpl.data());
        if (fd < 0) {
            return io_error();
        }
        path_ = std::move(tmpl);
        fd_ = fd;
        armed_ = true;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    return ok_status();
}

Status TempFileGuard::close_fd() noexcept {
    if (fd_ < 0) {
        return ok_status();
    }
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0 ? ok_status() : io_error();
}

void TempFileGuard::release() noexcept {
    armed_ = false;
    (void)close_fd();
    path_.clear();
}

void TempFileGuard::discard() noexcept {
    (void)close_fd();
    if (armed_ && !path_.empty()) {
        ::unlink(path_.c_str());
    }
    armed_ = false;
    path_.clear();
}

// ========================================================================
// ObjectWriter
// ========================================================================

Status ObjectWriter::open(const std::string& dir, std::string_view name, const WriterOptions& opts) noexcept {
    if (mode_ != Mode::Closed) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (dir.empty() || !layout_storage_name_valid(name) || opts.max_bytes == 0 ||
        opts.max_bytes > std::numeric_limits<u32>::max() - security::kSealedOverhead) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (opts.compression_level < 1 || opts.compression_level > 9) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    try {
        opts_ = opts;
        dir_ = dir;
        final_path_ = layout_object_path(dir, name);
        prefix_.clear();
        prefix_.reserve(kSniffPrefixBytes);
        head_.clear();
        head_.reserve(kChunkBytes);
        content_type_.clear();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    Status s = temp_.create(dir);
    if (!is_ok(s)) {
        return s;
    }
    s = hash_.init();
    if (!is_ok(s)) {
        temp_.discard();
        return s;
    }

    size_ = 0;
    disk_bytes_ = 0;
    compressed_ = false;
    mode_ = Mode::Buffering;
    return ok_status();
}

Status ObjectWriter::fail(Status s) noexcept {
    abort();
    return s;
}

void ObjectWriter::abort() noexcept {
    temp_.discard();
    head_.clear();
    mode_ = Mode::Closed;
}

Status ObjectWriter::write_disk(BufferView data) noexcept {
    const Status s = write_all(temp_.fd(), data.data, data.len);
    if (is_ok(s)) {
        disk_bytes_ += data.len;
    }
    return s;
}

// The head buffer overflowed: the object is larger than one chunk, so
// the codec decision is taken from the sniffed prefix alone.
Status ObjectWriter::decide_stream_mode() noexcept {
    content_type_ = std::string(sniff_content_type(BufferView{prefix_.data(), static_cast<u32>(prefix_.size())}));

    if (compression_eligible(opts_.compression_enabled, content_type_)) {
        Status s = compressor_.init(opts_.compression_level);
        if (!is_ok(s)) {
            return s;
        }
        mode_ = Mode::StreamCompressed;
        compressed_ = true;
    } else {
        mode_ = Mode::StreamPlain;
    }
    return flush_head();
}

Status ObjectWriter::flush_head() noexcept {
    const BufferView head{head_.data(), static_cast<u32>(head_.size())};
    Status s = ok_status();
    if (mode_ == Mode::StreamCompressed) {
        s = compressor_.update(head, [this](BufferView b) { return write_disk(b); });
    } else if (head.len > 0) {
        s = write_disk(head);
    }
    head_.clear();
    return s;
}

Status ObjectWriter::write(BufferView chunk) noexcept {
    if (mode_ == Mode::Closed || !buffer_ok(chunk)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (chunk.len == 0) {
        return ok_status();
    }

    if (size_ + chunk.len > opts_.max_bytes) {
        return fail(make_rejection(StatusDomain::Storage, RejectReason::TooLarge));
    }

    Status s = hash_.update(chunk);
    if (!is_ok(s)) {
        return fail(s);
    }
    size_ += chunk.len;

    try {
        if (prefix_.size() < kSniffPrefixBytes) {
            const size_t take = std::min<size_t>(kSniffPrefixBytes - prefix_.size(), chunk.len);
            prefix_.insert(prefix_.end(), chunk.data, chunk.data + take);
        }

        if (mode_ == Mode::Buffering) {
            if (head_.size() + chunk.len <= kChunkBytes) {
                head_.insert(head_.end(), chunk.data, chunk.data + chunk.len);
                return ok_status();
            }
            s = decide_stream_mode();
            if (!is_ok(s)) {
                return fail(s);
            }
        }
    } catch (const std::bad_alloc&) {
        return fail(make_status(StatusDomain::Storage, StatusCode::Unknown));
    }

    if (mode_ == Mode::StreamCompressed) {
        s = compressor_.update(chunk, [this](BufferView b) { return write_disk(b); });
    } else {
        s = write_disk(chunk);
    }
    if (!is_ok(s)) {
        return fail(s);
    }
    return ok_status();
}

// Second pass: the temp file becomes nonce || ciphertext || tag
Status ObjectWriter::encrypt_in_place(Nonce96* nonce_out) noexcept {
    if (disk_bytes_ > std::numeric_limits<u32>::max() - security::kSealedOverhead) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::vector<u8> plain;
    std::vector<u8> sealed;
    try {
        plain.resize(static_cast<size_t>(disk_bytes_));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    Status s = read_all_at(temp_.fd(), plain.data(), plain.size());
    if (!is_ok(s)) {
        return s;
    }

    s = security::seal_box(*opts_.key, BufferView{plain.data(), static_cast<u32>(plain.size())}, &sealed, nonce_out);
    if (!is_ok(s)) {
        return s;
    }

    if (::ftruncate(temp_.fd(), 0) != 0 || ::lseek(temp_.fd(), 0, SEEK_SET) != 0) {
        return io_error();
    }
    disk_bytes_ = 0;
    return write_disk(BufferView{sealed.data(), static_cast<u32>(sealed.size())});
}

Status ObjectWriter::commit(WrittenObject* out) noexcept {
    if (!out || mode_ == Mode::Closed) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Status s = ok_status();
    try {
        if (mode_ == Mode::Buffering) {
            content_type_ = std::string(sniff_content_type(BufferView{prefix_.data(), static_cast<u32>(prefix_.size())}));

            // Whole object is in memory: keep the frame only if it is smaller
            const BufferView head{head_.data(), static_cast<u32>(head_.size())};
            std::vector<u8> packed;
            if (head.len > 0 && compression_eligible(opts_.compression_enabled, content_type_)) {
                s = compress_buffer(head, opts_.compression_level, &packed);
                if (!is_ok(s)) {
                    return fail(s);
                }
            }
            if (!packed.empty() && packed.size() < head_.size()) {
                compressed_ = true;
                s = write_disk(BufferView{packed.data(), static_cast<u32>(packed.size())});
            } else if (head.len > 0) {
                s = write_disk(head);
            }
            head_.clear();
        } else if (mode_ == Mode::StreamCompressed) {
            s = compressor_.finish([this](BufferView b) { return write_disk(b); });
        }
    } catch (const std::bad_alloc&) {
        return fail(make_status(StatusDomain::Storage, StatusCode::Unknown));
    }
    if (!is_ok(s)) {
        return fail(s);
    }

    Hash256 checksum{};
    s = hash_.finish(&checksum);
    if (!is_ok(s)) {
        return fail(s);
    }

    Nonce96 nonce{};
    const bool encrypt = opts_.key != nullptr;
    if (encrypt) {
        s = encrypt_in_place(&nonce);
        if (!is_ok(s)) {
            return fail(s);
        }
    }

    if (::fsync(temp_.fd()) != 0) {
        return fail(io_error());
    }

    if (!content_type_allowed(content_type_, opts_.allowed_mime_prefixes)) {
        return fail(make_rejection(StatusDomain::Storage, RejectReason::ContentType));
    }

    s = temp_.close_fd();
    if (!is_ok(s)) {
        return fail(s);
    }

    if (::rename(temp_.path().c_str(), final_path_.c_str()) != 0) {
        return fail(io_error());
    }
    temp_.release();
    mode_ = Mode::Closed;

    if (::chmod(final_path_.c_str(), S_IRUSR | S_IWUSR) != 0) {
        s = io_error();
        ::unlink(final_path_.c_str());
        return s;
    }

    s = fsync_dir(dir_);
    if (!is_ok(s)) {
        ::unlink(final_path_.c_str());
        return s;
    }

    try {
        out->path = final_path_;
        out->content_type = content_type_;
    } catch (const std::bad_alloc&) {
        ::unlink(final_path_.c_str());
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }
    out->size = size_;
    out->stored_bytes = disk_bytes_;
    out->checksum = checksum;
    out->compressed = compressed_;
    out->encrypted = encrypt;
    out->nonce = nonce;

    spdlog::debug("writer: committed {} ({} bytes, {} on disk)", final_path_, size_, disk_bytes_);
    return ok_status();
}

// ========================================================================
// Source driver
// ========================================================================

Status write_object(ByteSource& src,
    const std::string& dir,
    std::string_view name,
    const WriterOptions& opts,
    WrittenObject* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    ObjectWriter writer;
    Status s = writer.open(dir, name, opts);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<u8> chunk;
    try {
        chunk.resize(kChunkBytes);
    } catch (const std::bad_alloc&) {
        writer.abort();
        return make_status(StatusDomain::Storage, StatusCode::Unknown);
    }

    for (;;) {
        u32 n = 0;
        s = src.read(BufferMut{chunk.data(), kChunkBytes}, &n);
        if (!is_ok(s)) {
            writer.abort();
            return s;
        }
        if (n == 0) {
            break;
        }
        // write() discards partial output itself on failure
        s = writer.write(BufferView{chunk.data(), n});
        if (!is_ok(s)) {
            return s;
        }
    }

    return writer.commit(out);
}

} // namespace stash::storage
