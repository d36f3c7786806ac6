#pragma once
#include <array>
#include <string>
#include <string_view>
#include <type_traits>

#include "stash/core/types.hpp"

namespace stash::core {
    enum class Visibility : u8 {
        Private = 0,
        Public = 1,
        Unlisted = 2,
    };

    // Metadata flags written before encryption metadata existed are Unknown
    enum class Flag : u8 {
        No = 0,
        Yes = 1,
        Unknown = 2,
    };

    [[nodiscard]] constexpr Flag flag_from_bool(bool v) noexcept {
        return v ? Flag::Yes : Flag::No;
    }

    struct Nonce96 {
        std::array<u8, 12> b{};
        friend constexpr bool operator==(Nonce96, Nonce96) noexcept = default;
    };

    struct StoredObject {
        ObjectId id{ObjectId::invalid()};
        OwnerId owner{OwnerId::invalid()};
        std::string logical_name;
        std::string storage_name;
        u64 size{0};
        bool size_known{true};
        Hash256 checksum{};
        std::string content_type;
        Flag compressed{Flag::No};
        Flag encrypted{Flag::No};
        bool has_nonce{false};
        Nonce96 nonce{};
        std::string key_id;
        Visibility visibility{Visibility::Private};
        GroupId group{GroupId::invalid()};
        Timestamp created_at{0};
    };

    struct Group {
        GroupId id{GroupId::invalid()};
        OwnerId owner{OwnerId::invalid()};
        std::string title;
        Visibility visibility{Visibility::Private};
        Timestamp created_at{0};
    };

    // Unrecognised input maps to Private
    [[nodiscard]] Visibility parse_visibility(std::string_view text) noexcept;
    [[nodiscard]] const char* visibility_name(Visibility v) noexcept;

    static_assert(std::is_trivially_copyable_v<Nonce96>);
    static_assert(sizeof(Nonce96) == 12);
} // namespace stash::core
