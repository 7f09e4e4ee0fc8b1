#include "cop/identity/vault.hpp"

#include "cop/security/crypto.hpp"

namespace cop::identity {
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    Status generate_party(std::string_view id, PartySecrets* out) noexcept {
        if (out == nullptr || !party_id_valid(id)) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        PartySecrets p{};
        Status s = cop::security::signing_keypair_generate(&p.signing);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = cop::security::enc_keypair_generate(&p.encryption);
        if (!cop::core::is_ok(s)) {
            scrub(&p);
            return s;
        }
        p.id = std::string(id);
        *out = p;
        scrub(&p);
        return ok_status();
    }

    PartyKeys public_keys_of(const PartySecrets& secrets) {
        PartyKeys k{};
        k.id = secrets.id;
        k.signing = secrets.signing.pub;
        k.encryption = secrets.encryption.pub;
        return k;
    }

    void scrub(PartySecrets* secrets) noexcept {
        if (secrets == nullptr) {
            return;
        }
        cop::security::secure_zero(&secrets->signing, sizeof(secrets->signing));
        cop::security::secure_zero(&secrets->encryption, sizeof(secrets->encryption));
    }

    MemoryVault::~MemoryVault() {
        for (auto& [id, secrets] : parties_) {
            scrub(&secrets);
        }
    }

    Status MemoryVault::put(const PartySecrets& secrets) noexcept {
        if (!party_id_valid(secrets.id)) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        auto it = parties_.find(secrets.id);
        if (it != parties_.end()) {
            scrub(&it->second);
            it->second = secrets;
            return ok_status();
        }
        parties_.emplace(secrets.id, secrets);
        return ok_status();
    }

    Status MemoryVault::get_signing_key(std::string_view party_id, cop::security::SigningPrivateKey* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        const auto it = parties_.find(party_id);
        if (it == parties_.end()) {
            return make_status(StatusDomain::Identity, StatusCode::NotFound);
        }
        *out = it->second.signing.priv;
        return ok_status();
    }

    Status MemoryVault::get_encryption_key(std::string_view party_id, cop::security::EncPrivateKey* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        const auto it = parties_.find(party_id);
        if (it == parties_.end()) {
            return make_status(StatusDomain::Identity, StatusCode::NotFound);
        }
        *out = it->second.encryption.priv;
        return ok_status();
    }
} // namespace cop::identity
