#include "stash/core/errors.hpp"

namespace stash::core {
    ErrorClass classify(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Ok:
                return ErrorClass::None;
            case StatusCode::Rejected:
                return ErrorClass::InputRejected;
            case StatusCode::Corrupt:
                return ErrorClass::Integrity;
            case StatusCode::Crypto:
                return ErrorClass::Confidentiality;
            case StatusCode::PermissionDenied:
                return ErrorClass::AccessDenied;
            case StatusCode::NotFound:
                return ErrorClass::NotFound;
            case StatusCode::Invalid:
            case StatusCode::Unsupported:
                return ErrorClass::Usage;
            case StatusCode::Io:
            case StatusCode::Conflict:
            case StatusCode::Busy:
            case StatusCode::Unavailable:
            case StatusCode::Unknown:
                return ErrorClass::Storage;
        }
        return ErrorClass::Storage;
    }

    const char* status_message(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Ok:
                return "ok";
            case StatusCode::Rejected:
                switch (static_cast<RejectReason>(s.aux)) {
                    case RejectReason::Extension:
                        return "extension not allowed";
                    case RejectReason::ContentType:
                        return "content type not allowed";
                    case RejectReason::TooLarge:
                        return "file too large";
                    case RejectReason::Quota:
                        return "storage quota exceeded";
                    case RejectReason::None:
                        break;
                }
                return "rejected";
            case StatusCode::Corrupt:
                return "integrity check failed";
            case StatusCode::Crypto:
                return "cannot decrypt";
            case StatusCode::PermissionDenied:
                return "access denied";
            case StatusCode::NotFound:
                return "not found";
            case StatusCode::Invalid:
                return "invalid argument";
            case StatusCode::Unsupported:
                return "unsupported";
            case StatusCode::Conflict:
                return "conflict";
            case StatusCode::Busy:
                return "busy";
            case StatusCode::Unavailable:
                return "unavailable";
            case StatusCode::Io:
            case StatusCode::Unknown:
                return "storage failure";
        }
        return "storage failure";
    }
} // namespace stash::core
