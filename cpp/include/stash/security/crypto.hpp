#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"
#include "stash/storage/buffer.hpp"

namespace stash::security {
    using u8 = stash::core::u8;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    using BufferView = stash::storage::BufferView;
    using BufferMut = stash::storage::BufferMut;

    struct Key256 {
        u8 b[32]{};
    };

    using Nonce12 = stash::core::Nonce96;

    struct Tag16 {
        u8 b[16]{};
    };

    enum class AeadId : u8 {
        ChaCha20Poly1305 = 1,
    };

    inline constexpr u32 kNonceBytes = 12;
    inline constexpr u32 kTagBytes = 16;
    // Sealed box layout: nonce || ciphertext || tag
    inline constexpr u32 kSealedOverhead = kNonceBytes + kTagBytes;

    // Nonce rules: caller supplies a unique nonce per (key, message)
    stash::core::Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept;

    stash::core::Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept;

    // Draws a fresh random nonce and writes nonce || ct || tag to `out`
    stash::core::Status seal_box(const Key256& key,
        BufferView pt,
        std::vector<u8>* out,
        Nonce12* nonce_out) noexcept;

    // Any authentication failure (wrong key, truncation, tampering) is Crypto
    stash::core::Status open_box(const Key256& key,
        BufferView sealed,
        std::vector<u8>* pt_out) noexcept;

    stash::core::Status random_bytes(BufferMut out) noexcept;

    // 64 hex characters -> 32-byte key
    [[nodiscard]] bool key_from_hex(std::string_view hex, Key256* out) noexcept;

    // Short public fingerprint of a key, recorded with each encrypted object
    [[nodiscard]] std::string key_id(const Key256& key);

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_trivially_copyable_v<Nonce12>);
    static_assert(std::is_trivially_copyable_v<Tag16>);

} // namespace stash::security
