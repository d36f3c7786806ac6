#include "stash/storage/quota.hpp"
#include "stash/storage/layout.hpp"

#include <cerrno>
#include <new>
#include <sys/stat.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace stash::storage {

using namespace stash::core;

// ========================================================================
// OwnerLockRegistry
// ========================================================================

std::shared_ptr<std::mutex> OwnerLockRegistry::lock_for(OwnerId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locks_.size() >= kOwnerLockPruneThreshold) {
        prune_idle_locked();
    }
    std::shared_ptr<std::mutex>& slot = locks_[owner.v];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

// Copies are only handed out under mutex_, so a use count of 1 means no
// caller holds the entry and none can obtain it while we erase
void OwnerLockRegistry::prune_idle_locked() {
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.use_count() == 1) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t OwnerLockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

// ========================================================================
// QuotaLedger
// ========================================================================

QuotaLedger::QuotaLedger(db::Database& db, std::string data_root, u64 max_owner_bytes)
    : db_(db), data_root_(std::move(data_root)), max_owner_bytes_(max_owner_bytes) {}

Status QuotaLedger::usage(OwnerId owner, u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    db::DbUsage recorded;
    Status s = db_.owner_usage(owner, &recorded);
    if (!is_ok(s)) {
        return s;
    }

    u64 total = recorded.recorded_bytes;
    // Rows without a recorded size count with their on-disk length
    for (const std::string& name : recorded.unsized_storage_names) {
        struct stat st{};
        try {
            if (::stat(layout_object_path(data_root_, name).c_str(), &st) == 0) {
                total += static_cast<u64>(st.st_size);
            }
        } catch (const std::bad_alloc&) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
    }

    *out = total;
    return ok_status();
}

Status QuotaLedger::precheck(OwnerId owner, u64 released) noexcept {
    u64 used = 0;
    Status s = usage(owner, &used);
    if (!is_ok(s)) {
        return s;
    }
    used = used > released ? used - released : 0;
    if (used >= max_owner_bytes_) {
        spdlog::warn("quota: owner {} at {} of {} bytes, upload refused", owner.v, used, max_owner_bytes_);
        return make_rejection(StatusDomain::Storage, RejectReason::Quota);
    }
    return ok_status();
}

Status QuotaLedger::postcheck(OwnerId owner, u64 incoming, u64 released) noexcept {
    u64 used = 0;
    Status s = usage(owner, &used);
    if (!is_ok(s)) {
        return s;
    }
    used = used > released ? used - released : 0;
    if (incoming > max_owner_bytes_ || used > max_owner_bytes_ - incoming) {
        spdlog::warn("quota: owner {} would reach {} of {} bytes", owner.v, used + incoming, max_owner_bytes_);
        return make_rejection(StatusDomain::Storage, RejectReason::Quota);
    }
    return ok_status();
}

} // namespace stash::storage
