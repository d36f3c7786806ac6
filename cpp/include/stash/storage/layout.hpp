#pragma once

#include <string>
#include <string_view>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"

namespace stash::storage {
    using u8 = stash::core::u8;
    using u32 = stash::core::u32;
    using u64 = stash::core::u64;

    // On-disk byte layouts. The four known formats are decoded
    // deterministically; only LegacyUnknown probes the bytes.
    enum class OnDiskFormat : u8 {
        Plain = 0,              // plaintext
        Compressed = 1,         // codec frame
        Encrypted = 2,          // nonce(12) || sealed(plaintext)
        EncryptedCompressed = 3,// nonce(12) || sealed(codec frame)
        LegacyUnknown = 4,      // written before format metadata existed
    };

    [[nodiscard]] constexpr OnDiskFormat layout_classify(stash::core::Flag compressed,
        stash::core::Flag encrypted) noexcept {
        using stash::core::Flag;
        if (compressed == Flag::Unknown || encrypted == Flag::Unknown) {
            return OnDiskFormat::LegacyUnknown;
        }
        if (encrypted == Flag::Yes) {
            return compressed == Flag::Yes ? OnDiskFormat::EncryptedCompressed : OnDiskFormat::Encrypted;
        }
        return compressed == Flag::Yes ? OnDiskFormat::Compressed : OnDiskFormat::Plain;
    }

    [[nodiscard]] const char* format_name(OnDiskFormat f) noexcept;

    // Random token bytes in a storage name (hex encoded)
    inline constexpr u32 kStorageTokenBytes = 16;
    inline constexpr const char* kTempPrefix = ".stash-tmp-";

    // Lower-cased extension including the dot, or empty
    [[nodiscard]] std::string layout_extension(std::string_view logical_name);

    // Unpredictable token + extension, independent of the logical name
    stash::core::Status layout_storage_name(std::string_view extension, std::string* out) noexcept;

    // A storage name is a single path component made of [0-9a-z._-]
    [[nodiscard]] bool layout_storage_name_valid(std::string_view name) noexcept;

    [[nodiscard]] std::string layout_object_path(const std::string& data_root, std::string_view storage_name);

} // namespace stash::storage
