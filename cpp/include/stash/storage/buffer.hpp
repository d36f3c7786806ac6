#pragma once

#include <type_traits>

#include "stash/core/types.hpp"

namespace stash::storage {
    using u8 = stash::core::u8;
    using u32 = stash::core::u32;
    using u64 = stash::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace stash::storage
