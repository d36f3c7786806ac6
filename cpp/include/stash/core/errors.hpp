#pragma once
#include <cstdint>
#include <type_traits>

namespace stash::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Crypto,
        Unsupported,
        Unavailable,
        Rejected,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Storage,
        Db,
        Security,
        Cli,
        Config,
    };

    // Carried in Status::aux when code == Rejected
    enum class RejectReason : u32 {
        None = 0,
        Extension = 1,
        ContentType = 2,
        TooLarge = 3,
        Quota = 4,
    };

    // Coarse classes callers of the store act on
    enum class ErrorClass : u16 {
        None = 0,
        InputRejected,
        Integrity,
        Confidentiality,
        Storage,
        AccessDenied,
        NotFound,
        Usage,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr Status make_rejection(StatusDomain domain, RejectReason reason) noexcept {
        return Status{StatusCode::Rejected, domain, static_cast<u32>(reason)};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr RejectReason reject_reason(Status s) noexcept {
        return s.code == StatusCode::Rejected ? static_cast<RejectReason>(s.aux) : RejectReason::None;
    }

    [[nodiscard]] ErrorClass classify(Status s) noexcept;

    // Short static description, safe to show to callers
    [[nodiscard]] const char* status_message(Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace stash::core
