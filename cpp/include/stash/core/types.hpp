#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace stash::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Timestamp = i64;

    // SHA-256 digest of an object's original plaintext
    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct OwnerIdTag {};
    using OwnerId = Id<OwnerIdTag, u64>;

    struct ObjectIdTag {};
    using ObjectId = Id<ObjectIdTag, u64>;

    // Higher-level container an object may belong to (e.g. a note)
    struct GroupIdTag {};
    using GroupId = Id<GroupIdTag, u64>;

    static_assert(std::is_trivially_copyable_v<OwnerId>);
    static_assert(std::is_trivially_copyable_v<ObjectId>);
    static_assert(std::is_trivially_copyable_v<GroupId>);

} // namespace stash::core
