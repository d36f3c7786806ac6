#pragma once

#include <functional>
#include <vector>

#include <zlib.h>

#include "stash/core/errors.hpp"
#include "stash/core/types.hpp"
#include "stash/storage/buffer.hpp"

namespace stash::storage {
    using u64 = stash::core::u64;

    // Self-delimiting gzip member (DEFLATE + CRC32 + ISIZE trailer)
    inline constexpr u8 kFrameMagic[3] = {0x1f, 0x8b, 0x08};
    inline constexpr int kDefaultCompressionLevel = 6;

    // Receives codec output; a non-ok status aborts the transform
    using CodecSink = std::function<stash::core::Status(BufferView)>;

    [[nodiscard]] bool codec_has_frame_signature(BufferView prefix) noexcept;

    class Compressor {
    public:
        Compressor() noexcept = default;
        ~Compressor() noexcept;

        Compressor(const Compressor&) = delete;
        Compressor& operator=(const Compressor&) = delete;

        [[nodiscard]] stash::core::Status init(int level) noexcept;
        [[nodiscard]] stash::core::Status update(BufferView in, const CodecSink& sink) noexcept;
        // Flushes and closes the frame
        [[nodiscard]] stash::core::Status finish(const CodecSink& sink) noexcept;

        [[nodiscard]] u64 bytes_out() const noexcept { return bytes_out_; }

    private:
        [[nodiscard]] stash::core::Status pump(int flush, const CodecSink& sink) noexcept;
        void release() noexcept;

        z_stream strm_{};
        bool active_{false};
        std::vector<u8> out_;
        u64 bytes_out_{0};
    };

    class Decompressor {
    public:
        Decompressor() noexcept = default;
        ~Decompressor() noexcept;

        Decompressor(const Decompressor&) = delete;
        Decompressor& operator=(const Decompressor&) = delete;

        // Producing more than max_output bytes is reported as Corrupt
        [[nodiscard]] stash::core::Status init(u64 max_output) noexcept;
        [[nodiscard]] stash::core::Status update(BufferView in, const CodecSink& sink) noexcept;
        // Corrupt unless exactly one complete frame was consumed
        [[nodiscard]] stash::core::Status finish() noexcept;

        [[nodiscard]] u64 bytes_out() const noexcept { return bytes_out_; }

    private:
        void release() noexcept;

        z_stream strm_{};
        bool active_{false};
        std::vector<u8> out_;
        u64 max_output_{0};
        u64 bytes_out_{0};
        bool ended_{false};
    };

    // One-shot helper for small in-memory payloads
    stash::core::Status compress_buffer(BufferView in, int level, std::vector<u8>* out) noexcept;

} // namespace stash::storage
