#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "stash/core/errors.hpp"
#include "stash/core/types.hpp"
#include "stash/db/db.hpp"

namespace stash::storage {

    // Idle entries are dropped once the registry holds more than this
    inline constexpr size_t kOwnerLockPruneThreshold = 256;

    // Per-owner exclusive sections, created on first use; unrelated owners
    // never contend. An entry no caller still holds is idle and is pruned
    // when the map grows past kOwnerLockPruneThreshold.
    class OwnerLockRegistry {
    public:
        [[nodiscard]] std::shared_ptr<std::mutex> lock_for(stash::core::OwnerId owner);
        [[nodiscard]] size_t size() const;

    private:
        void prune_idle_locked();

        mutable std::mutex mutex_;
        std::unordered_map<stash::core::u64, std::shared_ptr<std::mutex>> locks_;
    };

    // Sums an owner's stored plaintext sizes against the total cap.
    // Callers hold the owner's section from pre-check to metadata commit.
    class QuotaLedger {
    public:
        QuotaLedger(stash::db::Database& db, std::string data_root, stash::core::u64 max_owner_bytes);

        [[nodiscard]] stash::core::Status usage(stash::core::OwnerId owner, stash::core::u64* out) noexcept;

        // Rejected(Quota) when usage - released already meets the cap.
        // `released` is the size of an object the upload will supersede.
        [[nodiscard]] stash::core::Status precheck(stash::core::OwnerId owner,
            stash::core::u64 released = 0) noexcept;

        // Rejected(Quota) when usage - released + incoming exceeds the cap
        [[nodiscard]] stash::core::Status postcheck(stash::core::OwnerId owner,
            stash::core::u64 incoming,
            stash::core::u64 released = 0) noexcept;

        [[nodiscard]] stash::core::u64 cap() const noexcept { return max_owner_bytes_; }

    private:
        stash::db::Database& db_;
        std::string data_root_;
        stash::core::u64 max_owner_bytes_;
    };

} // namespace stash::storage
