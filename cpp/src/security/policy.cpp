#include "stash/security/policy.hpp"

namespace stash::security {
    namespace {
        [[nodiscard]] stash::core::Status check(stash::core::OwnerId caller,
            stash::core::OwnerId owner,
            stash::core::Visibility visibility,
            Right right) noexcept {
            if (right == Right::None) {
                return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
            }
            if (!owner.is_valid()) {
                return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
            }
            if (!has_right(rights_for(caller, owner, visibility), right)) {
                return stash::core::make_status(stash::core::StatusDomain::Security,
                    stash::core::StatusCode::PermissionDenied);
            }
            return stash::core::ok_status();
        }
    } // namespace

    stash::core::Status authorize(stash::core::OwnerId caller,
        const stash::core::StoredObject& object,
        Right right) noexcept {
        return check(caller, object.owner, object.visibility, right);
    }

    stash::core::Status authorize_group(stash::core::OwnerId caller,
        const stash::core::Group& group,
        Right right) noexcept {
        return check(caller, group.owner, group.visibility, right);
    }
} // namespace stash::security
