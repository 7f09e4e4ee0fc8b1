#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"
#include "cop/document/value.hpp"
#include "cop/identity/registry.hpp"
#include "cop/protocol/keywrap.hpp"
#include "cop/protocol/share.hpp"
#include "cop/protocol/transaction.hpp"
#include "cop/security/asymmetric.hpp"
#include "cop/security/crypto.hpp"

namespace cop::protocol {

    // Section name -> top-level field names. Sections must not overlap.
    // Fields not named anywhere go to remainder_section when it is set;
    // otherwise they are a structural error.
    struct LayerPlan {
        std::map<std::string, std::vector<std::string>, std::less<>> sections;
        std::optional<std::string> remainder_section;
    };

    struct SectionEnvelope {
        cop::core::Bytes ciphertext;
        cop::security::Nonce12 nonce{};
        cop::security::Tag16 tag{};
        cop::core::Hash256 content_hash{};
        KeyWrapMap key_wraps;
    };

    using SectionMap = std::map<std::string, SectionEnvelope, std::less<>>;

    struct LayeredProtectedTransaction {
        std::string doc_id;
        std::string seller_id;
        std::string buyer_id;
        cop::core::Timestamp created_at{0};
        SectionMap sections;
        cop::core::Hash256 aggregate_hash{};
        cop::security::Signature sig_seller{};
        std::optional<cop::security::Signature> sig_buyer;
    };

    // BLAKE3 over doc id, section count and, per section in name order, the
    // name, section content hash and every key-wrap entry in recipient order.
    cop::core::Status compute_aggregate_hash(std::string_view doc_id,
        const SectionMap& sections,
        cop::core::Hash256* out) noexcept;

    // Splits an object document along the plan; each section is an object.
    cop::core::Status split_document(const cop::document::Value& document,
        const LayerPlan& plan,
        std::map<std::string, cop::document::Value, std::less<>>* out) noexcept;

    cop::core::Status protect_with_layers(const cop::document::Value& document,
        const LayerPlan& plan,
        std::string_view seller_id,
        const cop::security::SigningPrivateKey& seller_signing,
        const cop::security::EncPrivateKey& seller_encryption,
        std::string_view buyer_id,
        const cop::security::EncPublicKey& buyer_encryption_public,
        cop::core::Timestamp created_at,
        LayeredProtectedTransaction* out) noexcept;

    // Opens every section, checks each hash and the aggregate, checks the
    // seller signature over the aggregate and signs it.
    cop::core::Status counter_sign_layered(const LayeredProtectedTransaction& in,
        std::string_view buyer_id,
        const cop::security::SigningPrivateKey& buyer_signing,
        const cop::security::EncPrivateKey& buyer_encryption,
        const cop::security::SigningPublicKey& seller_signing_public,
        LayeredProtectedTransaction* out) noexcept;

    cop::core::Status verify_layered(const LayeredProtectedTransaction& tx,
        const cop::identity::IdentityRegistry& registry,
        const std::vector<ShareRecord>* shares,
        VerifyReport* out) noexcept;

    // One record per requested section, each scoped to that section. Either
    // every record is produced or none is. vias holds the discloser's own
    // inbound section shares when it is not a direct key holder.
    cop::core::Status create_layer_share_records(const LayeredProtectedTransaction& tx,
        std::string_view discloser_id,
        const cop::security::EncPrivateKey& discloser_encryption,
        const cop::security::SigningPrivateKey& discloser_signing,
        std::string_view recipient_id,
        const cop::security::EncPublicKey& recipient_encryption_public,
        const std::vector<std::string>& section_names,
        const std::vector<ShareRecord>* vias,
        const cop::identity::IdentityRegistry* registry,
        cop::core::Timestamp timestamp,
        std::vector<ShareRecord>* out) noexcept;

    // NotFound for an unknown section, HashMismatch when the recorded
    // aggregate no longer matches the sections present.
    cop::core::Status unprotect_layer(const LayeredProtectedTransaction& tx,
        std::string_view party_id,
        std::string_view section_name,
        const cop::security::EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        cop::document::Value* out) noexcept;

} // namespace cop::protocol
