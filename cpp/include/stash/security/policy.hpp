#pragma once

#include <type_traits>

#include "stash/core/errors.hpp"
#include "stash/core/models.hpp"
#include "stash/core/types.hpp"

namespace stash::security {
    using u32 = stash::core::u32;

    enum class Right : u32 {
        None = 0,
        Read = 1u << 0,
        // rename, delete, replace, visibility changes
        Write = 1u << 1,
    };

    [[nodiscard]] constexpr u32 right_mask(Right r) noexcept {
        return static_cast<u32>(r);
    }

    [[nodiscard]] constexpr bool has_right(u32 mask, Right r) noexcept {
        return (mask & right_mask(r)) != 0;
    }

    // Rights `caller` holds on a resource with the given owner and visibility.
    // Public grants Read to everyone; Write always requires ownership.
    [[nodiscard]] constexpr u32 rights_for(stash::core::OwnerId caller,
        stash::core::OwnerId owner,
        stash::core::Visibility visibility) noexcept {
        if (caller.is_valid() && caller == owner) {
            return right_mask(Right::Read) | right_mask(Right::Write);
        }
        if (visibility == stash::core::Visibility::Public) {
            return right_mask(Right::Read);
        }
        return right_mask(Right::None);
    }

    // Evaluated before any object bytes are read
    [[nodiscard]] stash::core::Status authorize(stash::core::OwnerId caller,
        const stash::core::StoredObject& object,
        Right right) noexcept;

    [[nodiscard]] stash::core::Status authorize_group(stash::core::OwnerId caller,
        const stash::core::Group& group,
        Right right) noexcept;

} // namespace stash::security
