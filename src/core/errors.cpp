#include "cop/core/errors.hpp"

namespace cop::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::Structural: return "StructuralError";
            case StatusCode::AuthFailure: return "AuthFailure";
            case StatusCode::UnwrapFailure: return "UnwrapFailure";
            case StatusCode::HashMismatch: return "HashMismatch";
            case StatusCode::SignatureInvalid: return "SignatureInvalid";
            case StatusCode::AccessDenied: return "AccessDenied";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Document: return "Document";
            case StatusDomain::Security: return "Security";
            case StatusDomain::Protocol: return "Protocol";
            case StatusDomain::Identity: return "Identity";
            case StatusDomain::Store: return "Store";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace cop::core
