#include "cop/identity/registry.hpp"

namespace cop::identity {
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    bool party_id_valid(std::string_view id) noexcept {
        if (id.empty() || id.size() > 64 || id.front() == '.') {
            return false;
        }
        for (char c : id) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                c == '.' || c == '_' || c == '-';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    Status MemoryRegistry::put(const PartyKeys& keys) noexcept {
        if (!party_id_valid(keys.id)) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        parties_[keys.id] = keys;
        return ok_status();
    }

    Status MemoryRegistry::get_public_keys(std::string_view party_id, PartyKeys* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        const auto it = parties_.find(party_id);
        if (it == parties_.end()) {
            return make_status(StatusDomain::Identity, StatusCode::NotFound);
        }
        *out = it->second;
        return ok_status();
    }
} // namespace cop::identity
