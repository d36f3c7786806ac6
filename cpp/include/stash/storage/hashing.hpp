#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "stash/core/errors.hpp"
#include "stash/core/types.hpp"
#include "stash/storage/buffer.hpp"

struct evp_md_ctx_st;

namespace stash::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const stash::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // Incremental SHA-256 over plaintext chunks
    class Sha256 {
    public:
        Sha256() noexcept = default;
        ~Sha256() noexcept;

        Sha256(const Sha256&) = delete;
        Sha256& operator=(const Sha256&) = delete;

        [[nodiscard]] stash::core::Status init() noexcept;
        [[nodiscard]] stash::core::Status update(BufferView data) noexcept;
        [[nodiscard]] stash::core::Status finish(stash::core::Hash256* out) noexcept;

    private:
        evp_md_ctx_st* ctx_{nullptr};
    };

    stash::core::Status hash_compute(BufferView data, stash::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const stash::core::Hash256& h);
    [[nodiscard]] bool hash_from_hex(std::string_view hex, stash::core::Hash256* out) noexcept;

    // Constant-time digest comparison
    [[nodiscard]] bool hash_equal(const stash::core::Hash256& a, const stash::core::Hash256& b) noexcept;

} // namespace stash::storage
