#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"
#include "stash/security/crypto.hpp"
#include "stash/storage/buffer.hpp"
#include "stash/storage/codec.hpp"
#include "stash/storage/hashing.hpp"
#include "stash/storage/source.hpp"

namespace stash::storage {

    struct WriterOptions {
        u64 max_bytes{0};
        bool compression_enabled{true};
        int compression_level{kDefaultCompressionLevel};
        // nullptr disables encryption for this write
        const stash::security::Key256* key{nullptr};
        std::vector<std::string> allowed_mime_prefixes;
    };

    // Descriptor of a committed file
    struct WrittenObject {
        std::string path;
        u64 size{0};
        u64 stored_bytes{0};
        stash::core::Hash256 checksum{};
        std::string content_type;
        bool compressed{false};
        bool encrypted{false};
        stash::core::Nonce96 nonce{};
    };

    // Owns a temporary file and unlinks it on destruction unless released
    // after the final rename succeeded.
    class TempFileGuard {
    public:
        TempFileGuard() noexcept = default;
        ~TempFileGuard() noexcept;

        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;

        // mkstemp() in `dir`
        [[nodiscard]] stash::core::Status create(const std::string& dir) noexcept;

        [[nodiscard]] int fd() const noexcept { return fd_; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        stash::core::Status close_fd() noexcept;
        // Cancels the unlink; the caller now owns the path
        void release() noexcept;
        // Closes and unlinks now
        void discard() noexcept;

    private:
        std::string path_;
        int fd_{-1};
        bool armed_{false};
    };

    // Streams one object into `dir/name`. Plaintext goes in through write();
    // nothing appears under the final name unless commit() succeeds.
    class ObjectWriter {
    public:
        ObjectWriter() noexcept = default;
        ~ObjectWriter() noexcept = default;

        ObjectWriter(const ObjectWriter&) = delete;
        ObjectWriter& operator=(const ObjectWriter&) = delete;

        [[nodiscard]] stash::core::Status open(const std::string& dir,
            std::string_view name,
            const WriterOptions& opts) noexcept;

        // Rejected(TooLarge) as soon as the running size passes max_bytes
        [[nodiscard]] stash::core::Status write(BufferView chunk) noexcept;

        [[nodiscard]] stash::core::Status commit(WrittenObject* out) noexcept;

        // Drops all partial output; safe to call more than once
        void abort() noexcept;

        [[nodiscard]] u64 bytes_in() const noexcept { return size_; }

    private:
        enum class Mode {
            Closed,
            Buffering,
            StreamPlain,
            StreamCompressed,
        };

        [[nodiscard]] stash::core::Status fail(stash::core::Status s) noexcept;
        [[nodiscard]] stash::core::Status decide_stream_mode() noexcept;
        [[nodiscard]] stash::core::Status write_disk(BufferView data) noexcept;
        [[nodiscard]] stash::core::Status flush_head() noexcept;
        [[nodiscard]] stash::core::Status encrypt_in_place(stash::core::Nonce96* nonce_out) noexcept;

        WriterOptions opts_;
        std::string dir_;
        std::string final_path_;
        TempFileGuard temp_;
        Mode mode_{Mode::Closed};

        Sha256 hash_;
        Compressor compressor_;
        std::vector<u8> prefix_;
        std::vector<u8> head_;
        std::string content_type_;
        u64 size_{0};
        u64 disk_bytes_{0};
        bool compressed_{false};
    };

    // Pulls `src` to end of stream in fixed-size chunks and commits.
    // Any failure, including one reported by `src`, leaves no artifact.
    [[nodiscard]] stash::core::Status write_object(ByteSource& src,
        const std::string& dir,
        std::string_view name,
        const WriterOptions& opts,
        WrittenObject* out) noexcept;

} // namespace stash::storage
