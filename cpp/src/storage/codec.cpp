#include "stash/storage/codec.hpp"

#include <cstring>
#include <new>

#include <zlib.h>

namespace stash::storage {
    using stash::core::make_status;
    using stash::core::Status;
    using stash::core::StatusCode;
    using stash::core::StatusDomain;

    namespace {
        constexpr u32 kCodecChunkBytes = 64 * 1024;
        // 15-bit window, +16 selects the gzip wrapper
        constexpr int kGzipWindowBits = 15 + 16;
        constexpr int kMemLevel = 8;
    } // namespace

    bool codec_has_frame_signature(BufferView prefix) noexcept {
        if (!buffer_ok(prefix) || prefix.len < sizeof(kFrameMagic)) {
            return false;
        }
        return std::memcmp(prefix.data, kFrameMagic, sizeof(kFrameMagic)) == 0;
    }

    // ========================================================================
    // Compressor
    // ========================================================================

    Compressor::~Compressor() noexcept {
        release();
    }

    void Compressor::release() noexcept {
        if (active_) {
            deflateEnd(&strm_);
            active_ = false;
        }
    }

    Status Compressor::init(int level) noexcept {
        release();
        if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        try {
            out_.resize(kCodecChunkBytes);
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        strm_ = z_stream{};
        if (deflateInit2(&strm_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
            return make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
        active_ = true;
        bytes_out_ = 0;
        return stash::core::ok_status();
    }

    Status Compressor::pump(int flush, const CodecSink& sink) noexcept {
        int rc = Z_OK;
        do {
            strm_.next_out = out_.data();
            strm_.avail_out = static_cast<uInt>(out_.size());
            rc = deflate(&strm_, flush);
            if (rc == Z_STREAM_ERROR) {
                return make_status(StatusDomain::Storage, StatusCode::Unknown);
            }
            const u32 produced = static_cast<u32>(out_.size() - strm_.avail_out);
            if (produced > 0) {
                bytes_out_ += produced;
                const Status s = sink(BufferView{out_.data(), produced});
                if (!stash::core::is_ok(s)) {
                    return s;
                }
            }
        } while (strm_.avail_out == 0);

        if (flush == Z_FINISH && rc != Z_STREAM_END) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        return stash::core::ok_status();
    }

    Status Compressor::update(BufferView in, const CodecSink& sink) noexcept {
        if (!active_ || !buffer_ok(in)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (in.len == 0) {
            return stash::core::ok_status();
        }
        strm_.next_in = const_cast<Bytef*>(in.data);
        strm_.avail_in = static_cast<uInt>(in.len);
        return pump(Z_NO_FLUSH, sink);
    }

    Status Compressor::finish(const CodecSink& sink) noexcept {
        if (!active_) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        strm_.next_in = nullptr;
        strm_.avail_in = 0;
        const Status s = pump(Z_FINISH, sink);
        release();
        return s;
    }

    // ========================================================================
    // Decompressor
    // ========================================================================

    Decompressor::~Decompressor() noexcept {
        release();
    }

    void Decompressor::release() noexcept {
        if (active_) {
            inflateEnd(&strm_);
            active_ = false;
        }
    }

    Status Decompressor::init(u64 max_output) noexcept {
        release();
        try {
            out_.resize(kCodecChunkBytes);
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        strm_ = z_stream{};
        if (inflateInit2(&strm_, kGzipWindowBits) != Z_OK) {
            return make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
        active_ = true;
        max_output_ = max_output;
        bytes_out_ = 0;
        ended_ = false;
        return stash::core::ok_status();
    }

    Status Decompressor::update(BufferView in, const CodecSink& sink) noexcept {
        if (!active_ || !buffer_ok(in)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (in.len == 0) {
            return stash::core::ok_status();
        }
        if (ended_) {
            // Trailing bytes after the frame
            return make_status(StatusDomain::Storage, StatusCode::Corrupt);
        }

        strm_.next_in = const_cast<Bytef*>(in.data);
        strm_.avail_in = static_cast<uInt>(in.len);

        for (;;) {
            strm_.next_out = out_.data();
            strm_.avail_out = static_cast<uInt>(out_.size());
            const int rc = inflate(&strm_, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                return make_status(StatusDomain::Storage, StatusCode::Corrupt);
            }

            const u32 produced = static_cast<u32>(out_.size() - strm_.avail_out);
            if (produced > 0) {
                bytes_out_ += produced;
                if (bytes_out_ > max_output_) {
                    return make_status(StatusDomain::Storage, StatusCode::Corrupt);
                }
                const Status s = sink(BufferView{out_.data(), produced});
                if (!stash::core::is_ok(s)) {
                    return s;
                }
            }

            if (rc == Z_STREAM_END) {
                ended_ = true;
                if (strm_.avail_in > 0) {
                    return make_status(StatusDomain::Storage, StatusCode::Corrupt);
                }
                break;
            }
            if (rc == Z_BUF_ERROR || (strm_.avail_in == 0 && strm_.avail_out != 0)) {
                break;
            }
        }
        return stash::core::ok_status();
    }

    Status Decompressor::finish() noexcept {
        if (!active_) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        const bool ended = ended_;
        release();
        if (!ended) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt);
        }
        return stash::core::ok_status();
    }

    Status compress_buffer(BufferView in, int level, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        out->clear();

        Compressor c;
        Status s = c.init(level);
        if (!stash::core::is_ok(s)) {
            return s;
        }
        const CodecSink append = [out](BufferView chunk) {
            out->insert(out->end(), chunk.data, chunk.data + chunk.len);
            return stash::core::ok_status();
        };
        s = c.update(in, append);
        if (!stash::core::is_ok(s)) {
            return s;
        }
        return c.finish(append);
    }
} // namespace stash::storage
