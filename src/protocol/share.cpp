#include "cop/protocol/share.hpp"

#include "cop/core/encoding.hpp"
#include "cop/document/hashing.hpp"
#include "cop/protocol/records.hpp"
#include "cop/security/crypto.hpp"

namespace cop::protocol {
    using cop::core::Hash256;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    Status new_share_id(std::string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        cop::core::u8 raw[16]{};
        const Status s = cop::security::random_fill(cop::core::BufferMut{raw, sizeof(raw)});
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = cop::core::hex_encode(cop::core::BufferView{raw, sizeof(raw)});
        return ok_status();
    }

    Status share_record_hash(const ShareRecord& record, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        return cop::document::hash_document(share_body_to_value(record), out);
    }

    Status sign_share_record(const cop::security::SigningPrivateKey& from_signing, ShareRecord* record) noexcept {
        if (record == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Hash256 h{};
        const Status s = share_record_hash(*record, &h);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        return cop::security::sign_hash(from_signing, h, &record->signature);
    }

    Status verify_share_record(const ShareRecord& record, const cop::identity::IdentityRegistry& registry) noexcept {
        cop::identity::PartyKeys from{};
        Status s = registry.get_public_keys(record.from_id, &from);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        Hash256 h{};
        s = share_record_hash(record, &h);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = cop::security::verify_hash(from.signing, h, record.signature);
        if (s.code == StatusCode::Invalid) {
            // An undecodable registry key cannot vouch for the record.
            return make_status(StatusDomain::Protocol, StatusCode::SignatureInvalid);
        }
        return s;
    }

    Status check_inbound_share(const ShareRecord& record,
        std::string_view party_id,
        std::string_view doc_id,
        std::optional<std::string_view> section,
        const cop::identity::IdentityRegistry& registry) noexcept {
        if (record.to_id != party_id || record.wrapped_key.recipient_id != party_id || record.doc_id != doc_id) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        if (record.section.has_value() != section.has_value()) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        if (section.has_value() && *record.section != *section) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        const Status s = verify_share_record(record, registry);
        if (s.code == StatusCode::SignatureInvalid) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        return s;
    }

    Status open_content_key(const KeyWrapMap& wraps,
        const WrapScope& scope,
        std::string_view party_id,
        const cop::security::EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        cop::security::Key256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        const auto direct = wraps.find(party_id);
        if (direct != wraps.end()) {
            return unwrap_from(direct->second, party_encryption, WrapPurpose::Content, scope, out);
        }
        if (share == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        if (registry == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        const Status s = check_inbound_share(*share, party_id, scope.doc_id, scope.section, *registry);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        return unwrap_from(share->wrapped_key, party_encryption, WrapPurpose::Share, share_scope(*share), out);
    }
} // namespace cop::protocol
