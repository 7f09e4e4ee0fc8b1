#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"
#include "cop/identity/registry.hpp"
#include "cop/protocol/keywrap.hpp"
#include "cop/security/asymmetric.hpp"

namespace cop::protocol {

    // Signed grant of a content key from one party to another.
    // No section means the whole document.
    struct ShareRecord {
        std::string share_id;
        std::string doc_id;
        std::optional<std::string> section;
        std::string from_id;
        std::string to_id;
        WrappedKeyEntry wrapped_key{};
        cop::core::Timestamp timestamp{0};
        // Content hash of the disclosed section (section-scoped shares only).
        std::optional<cop::core::Hash256> layer_hash;
        cop::security::Signature signature{};
    };

    // 16 random bytes, lowercase hex.
    cop::core::Status new_share_id(std::string* out) noexcept;

    // BLAKE3 over the canonical record with the signature field left out.
    cop::core::Status share_record_hash(const ShareRecord& record, cop::core::Hash256* out) noexcept;

    cop::core::Status sign_share_record(const cop::security::SigningPrivateKey& from_signing,
        ShareRecord* record) noexcept;

    // Looks up from_id in the registry; NotFound propagates.
    cop::core::Status verify_share_record(const ShareRecord& record,
        const cop::identity::IdentityRegistry& registry) noexcept;

    // Admits an inbound share for (party, doc, section): the signature must
    // verify and the record must name exactly this recipient, document and
    // scope. Anything else is AccessDenied, except an unknown discloser
    // (NotFound).
    cop::core::Status check_inbound_share(const ShareRecord& record,
        std::string_view party_id,
        std::string_view doc_id,
        std::optional<std::string_view> section,
        const cop::identity::IdentityRegistry& registry) noexcept;

    // Recovers a content key for party_id: its own entry in wraps when it has
    // one, otherwise the inbound share (checked with check_inbound_share).
    // AccessDenied when neither path applies.
    cop::core::Status open_content_key(const KeyWrapMap& wraps,
        const WrapScope& scope,
        std::string_view party_id,
        const cop::security::EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        cop::security::Key256* out) noexcept;

    [[nodiscard]] inline WrapScope share_scope(const ShareRecord& record) noexcept {
        WrapScope scope{record.doc_id, std::nullopt};
        if (record.section.has_value()) {
            scope.section = std::string_view(*record.section);
        }
        return scope;
    }

} // namespace cop::protocol
