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
#include "cop/security/asymmetric.hpp"
#include "cop/security/crypto.hpp"

namespace cop::protocol {

    // Draft -> SellerProtected (sig_buyer empty) -> BuyerCountersigned.
    struct ProtectedTransaction {
        std::string doc_id;
        std::string seller_id;
        std::string buyer_id;
        cop::core::Timestamp created_at{0};
        cop::core::Bytes ciphertext;
        cop::security::Nonce12 nonce{};
        cop::security::Tag16 tag{};
        KeyWrapMap key_wraps;
        cop::core::Hash256 content_hash{};
        cop::security::Signature sig_seller{};
        std::optional<cop::security::Signature> sig_buyer;
    };

    struct ShareCheck {
        std::string share_id;
        std::string from_id;
        bool valid{false};
        // Set for section-scoped shares checked against a layered record.
        std::optional<bool> layer_hash_ok;
    };

    struct VerifyReport {
        bool seller_ok{false};
        bool buyer_present{false};
        bool buyer_ok{false};
        // Always true for whole-document records.
        bool aggregate_ok{true};
        std::vector<ShareCheck> shares;
    };

    // The document's top-level "id" (string, or integer in decimal); otherwise
    // 16 random bytes in hex.
    cop::core::Status derive_doc_id(const cop::document::Value& document, std::string* out) noexcept;

    cop::core::Status protect(const cop::document::Value& document,
        std::string_view seller_id,
        const cop::security::SigningPrivateKey& seller_signing,
        const cop::security::EncPrivateKey& seller_encryption,
        std::string_view buyer_id,
        const cop::security::EncPublicKey& buyer_encryption_public,
        cop::core::Timestamp created_at,
        ProtectedTransaction* out) noexcept;

    // Buyer opens its own entry, re-hashes the plaintext, checks the seller
    // signature and attaches sig_buyer. The input is never modified.
    cop::core::Status counter_sign(const ProtectedTransaction& in,
        std::string_view buyer_id,
        const cop::security::SigningPrivateKey& buyer_signing,
        const cop::security::EncPrivateKey& buyer_encryption,
        const cop::security::SigningPublicKey& seller_signing_public,
        ProtectedTransaction* out) noexcept;

    // Signature checks over public material only; shares may be null.
    cop::core::Status verify(const ProtectedTransaction& tx,
        const cop::identity::IdentityRegistry& registry,
        const std::vector<ShareRecord>* shares,
        VerifyReport* out) noexcept;

    // Direct entry first, then the share (which then needs a registry).
    cop::core::Status unprotect(const ProtectedTransaction& tx,
        std::string_view party_id,
        const cop::security::EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        cop::document::Value* out) noexcept;

    // The discloser opens and hash-checks the content itself (directly or via
    // its own inbound share) before the key is wrapped for the recipient.
    cop::core::Status create_share_record(const ProtectedTransaction& tx,
        std::string_view discloser_id,
        const cop::security::EncPrivateKey& discloser_encryption,
        const cop::security::SigningPrivateKey& discloser_signing,
        std::string_view recipient_id,
        const cop::security::EncPublicKey& recipient_encryption_public,
        const ShareRecord* via,
        const cop::identity::IdentityRegistry* registry,
        cop::core::Timestamp timestamp,
        ShareRecord* out) noexcept;

} // namespace cop::protocol
