#pragma once

#include <functional>
#include <string>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/security/crypto.hpp"
#include "stash/storage/buffer.hpp"
#include "stash/storage/layout.hpp"

namespace stash::storage {

    struct ReaderOptions {
        // nullptr: encrypted objects cannot be opened
        const stash::security::Key256* key{nullptr};
        // Objects above this size are verified, then delivered in chunks
        u64 stream_threshold{0};
        // Decode bound for legacy rows that carry no size
        u64 max_object_bytes{0};
    };

    using ChunkSink = std::function<stash::core::Status(BufferView)>;

    // Plaintext delivered to the caller, with the size actually produced
    struct ReadStats {
        u64 size{0};
        OnDiskFormat format{OnDiskFormat::Plain};
    };

    // Reconstructs the original plaintext into `out`. Checksum mismatch is
    // Corrupt, an unopenable sealed box is Crypto.
    [[nodiscard]] stash::core::Status read_object(const std::string& path,
        const stash::core::StoredObject& obj,
        const ReaderOptions& opts,
        std::vector<u8>* out,
        ReadStats* stats = nullptr) noexcept;

    // Same result delivered as kChunkBytes pieces. No byte reaches `sink`
    // before the checksum has been verified.
    [[nodiscard]] stash::core::Status read_object_chunked(const std::string& path,
        const stash::core::StoredObject& obj,
        const ReaderOptions& opts,
        const ChunkSink& sink,
        ReadStats* stats = nullptr) noexcept;

    // Decodes and checks the object without keeping any output
    [[nodiscard]] stash::core::Status verify_object(const std::string& path,
        const stash::core::StoredObject& obj,
        const ReaderOptions& opts,
        ReadStats* stats = nullptr) noexcept;

} // namespace stash::storage
