#include "cop/protocol/transaction.hpp"

#include <string>
#include <utility>

#include "cop/core/encoding.hpp"
#include "cop/document/canonical.hpp"
#include "cop/document/hashing.hpp"
#include "cop/protocol/transcript.hpp"

namespace cop::protocol {
    using cop::core::BufferMut;
    using cop::core::BufferView;
    using cop::core::Bytes;
    using cop::core::Hash256;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;
    using cop::document::Value;
    using namespace cop::security;

    namespace {
        constexpr char kContentAadLabel[] = "cop.content.v1";

        Transcript make_content_aad(std::string_view doc_id, const Hash256& content_hash) {
            Transcript t(kContentAadLabel);
            t.put_str(doc_id);
            t.put_hash(content_hash);
            return t;
        }

        // Opens the content and requires its hash to match the stored one.
        Status open_content(const ProtectedTransaction& tx, const Key256& key, ScrubbedBytes* plaintext) noexcept {
            plaintext->v.assign(tx.ciphertext.size(), 0);
            const Transcript aad = make_content_aad(tx.doc_id, tx.content_hash);
            Status s = aead_open(AeadId::ChaCha20Poly1305,
                key,
                tx.nonce,
                aad.view(),
                cop::core::view_of(tx.ciphertext),
                tx.tag,
                cop::core::mut_of(plaintext->v));
            if (!cop::core::is_ok(s)) {
                return s;
            }
            Hash256 h{};
            s = cop::document::hash_compute(cop::core::view_of(plaintext->v), &h);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            if (!cop::core::hash_equal_ct(h, tx.content_hash)) {
                return make_status(StatusDomain::Protocol, StatusCode::HashMismatch);
            }
            return ok_status();
        }

        [[nodiscard]] WrapScope whole_scope(const ProtectedTransaction& tx) noexcept {
            return WrapScope{tx.doc_id, std::nullopt};
        }

        // Direct key holders are the wrap-map entries; everyone else needs a share.
        Status open_tx_key(const ProtectedTransaction& tx,
            std::string_view party_id,
            const EncPrivateKey& party_encryption,
            const ShareRecord* share,
            const cop::identity::IdentityRegistry* registry,
            Key256* key) noexcept {
            return open_content_key(tx.key_wraps, whole_scope(tx), party_id, party_encryption, share, registry, key);
        }
    } // namespace

    Status derive_doc_id(const Value& document, std::string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        const Value* id = document.find("id");
        if (id != nullptr && id->is_string() && !id->as_string().empty()) {
            *out = id->as_string();
            return ok_status();
        }
        if (id != nullptr && id->is_int()) {
            *out = std::to_string(id->as_int());
            return ok_status();
        }
        cop::core::u8 raw[16]{};
        const Status s = random_fill(BufferMut{raw, sizeof(raw)});
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = cop::core::hex_encode(BufferView{raw, sizeof(raw)});
        return ok_status();
    }

    Status protect(const Value& document,
        std::string_view seller_id,
        const SigningPrivateKey& seller_signing,
        const EncPrivateKey& seller_encryption,
        std::string_view buyer_id,
        const EncPublicKey& buyer_encryption_public,
        cop::core::Timestamp created_at,
        ProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!cop::identity::party_id_valid(seller_id) || !cop::identity::party_id_valid(buyer_id) ||
            seller_id == buyer_id) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!document.is_object()) {
            return make_status(StatusDomain::Document, StatusCode::Structural);
        }

        ProtectedTransaction tx{};
        ScrubbedBytes canonical;
        Status s = cop::document::canonicalize_and_hash(document, &canonical.v, &tx.content_hash);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = derive_doc_id(document, &tx.doc_id);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        tx.seller_id = std::string(seller_id);
        tx.buyer_id = std::string(buyer_id);
        tx.created_at = created_at;

        Key256 content_key{};
        s = random_key(&content_key);
        if (cop::core::is_ok(s)) {
            s = random_nonce(&tx.nonce);
        }
        if (!cop::core::is_ok(s)) {
            secure_zero(&content_key, sizeof(content_key));
            return s;
        }

        tx.ciphertext.assign(canonical.v.size(), 0);
        const Transcript aad = make_content_aad(tx.doc_id, tx.content_hash);
        s = aead_seal(AeadId::ChaCha20Poly1305,
            content_key,
            tx.nonce,
            aad.view(),
            cop::core::view_of(canonical.v),
            cop::core::mut_of(tx.ciphertext),
            &tx.tag);

        EncPublicKey seller_public{};
        if (cop::core::is_ok(s)) {
            s = enc_public_from_private(seller_encryption, &seller_public);
        }
        WrappedKeyEntry seller_entry{};
        WrappedKeyEntry buyer_entry{};
        if (cop::core::is_ok(s)) {
            s = wrap_for(content_key, seller_public, nullptr, WrapPurpose::Content, whole_scope(tx), seller_id, &seller_entry);
        }
        if (cop::core::is_ok(s)) {
            s = wrap_for(content_key, buyer_encryption_public, nullptr, WrapPurpose::Content, whole_scope(tx), buyer_id,
                &buyer_entry);
        }
        secure_zero(&content_key, sizeof(content_key));
        if (!cop::core::is_ok(s)) {
            return s;
        }
        tx.key_wraps.emplace(seller_entry.recipient_id, std::move(seller_entry));
        tx.key_wraps.emplace(buyer_entry.recipient_id, std::move(buyer_entry));

        s = sign_hash(seller_signing, tx.content_hash, &tx.sig_seller);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        *out = std::move(tx);
        return ok_status();
    }

    Status counter_sign(const ProtectedTransaction& in,
        std::string_view buyer_id,
        const SigningPrivateKey& buyer_signing,
        const EncPrivateKey& buyer_encryption,
        const SigningPublicKey& seller_signing_public,
        ProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (buyer_id != in.buyer_id) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        if (in.sig_buyer.has_value()) {
            return make_status(StatusDomain::Protocol, StatusCode::Conflict);
        }
        const auto entry = in.key_wraps.find(buyer_id);
        if (entry == in.key_wraps.end()) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }

        Key256 key{};
        Status s = unwrap_from(entry->second, buyer_encryption, WrapPurpose::Content, whole_scope(in), &key);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ScrubbedBytes plaintext;
        s = open_content(in, key, &plaintext);
        secure_zero(&key, sizeof(key));
        if (!cop::core::is_ok(s)) {
            return s;
        }

        s = verify_hash(seller_signing_public, in.content_hash, in.sig_seller);
        if (s.code == StatusCode::Invalid) {
            return make_status(StatusDomain::Protocol, StatusCode::SignatureInvalid);
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }

        Signature sig{};
        s = sign_hash(buyer_signing, in.content_hash, &sig);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ProtectedTransaction signed_tx = in;
        signed_tx.sig_buyer = sig;
        *out = std::move(signed_tx);
        return ok_status();
    }

    Status verify(const ProtectedTransaction& tx,
        const cop::identity::IdentityRegistry& registry,
        const std::vector<ShareRecord>* shares,
        VerifyReport* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        VerifyReport report{};

        cop::identity::PartyKeys seller{};
        Status s = registry.get_public_keys(tx.seller_id, &seller);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        report.seller_ok = cop::core::is_ok(verify_hash(seller.signing, tx.content_hash, tx.sig_seller));

        if (tx.sig_buyer.has_value()) {
            cop::identity::PartyKeys buyer{};
            s = registry.get_public_keys(tx.buyer_id, &buyer);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            report.buyer_present = true;
            report.buyer_ok = cop::core::is_ok(verify_hash(buyer.signing, tx.content_hash, *tx.sig_buyer));
        }

        if (shares != nullptr) {
            for (const ShareRecord& r : *shares) {
                ShareCheck c{};
                c.share_id = r.share_id;
                c.from_id = r.from_id;
                if (r.doc_id == tx.doc_id && !r.section.has_value()) {
                    s = verify_share_record(r, registry);
                    if (s.code == StatusCode::NotFound) {
                        return s;
                    }
                    c.valid = cop::core::is_ok(s);
                }
                report.shares.push_back(std::move(c));
            }
        }

        *out = std::move(report);
        return ok_status();
    }

    Status unprotect(const ProtectedTransaction& tx,
        std::string_view party_id,
        const EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        Value* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Key256 key{};
        Status s = open_tx_key(tx, party_id, party_encryption, share, registry, &key);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ScrubbedBytes plaintext;
        s = open_content(tx, key, &plaintext);
        secure_zero(&key, sizeof(key));
        if (!cop::core::is_ok(s)) {
            return s;
        }
        return cop::document::parse_json(cop::core::view_of(plaintext.v), out);
    }

    Status create_share_record(const ProtectedTransaction& tx,
        std::string_view discloser_id,
        const EncPrivateKey& discloser_encryption,
        const SigningPrivateKey& discloser_signing,
        std::string_view recipient_id,
        const EncPublicKey& recipient_encryption_public,
        const ShareRecord* via,
        const cop::identity::IdentityRegistry* registry,
        cop::core::Timestamp timestamp,
        ShareRecord* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!cop::identity::party_id_valid(recipient_id) || recipient_id == discloser_id) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }

        Key256 key{};
        Status s = open_tx_key(tx, discloser_id, discloser_encryption, via, registry, &key);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        {
            ScrubbedBytes plaintext;
            s = open_content(tx, key, &plaintext);
        }
        if (!cop::core::is_ok(s)) {
            secure_zero(&key, sizeof(key));
            return s;
        }

        ShareRecord r{};
        s = new_share_id(&r.share_id);
        if (cop::core::is_ok(s)) {
            r.doc_id = tx.doc_id;
            r.from_id = std::string(discloser_id);
            r.to_id = std::string(recipient_id);
            r.timestamp = timestamp;
            s = wrap_for(key, recipient_encryption_public, nullptr, WrapPurpose::Share, share_scope(r), recipient_id,
                &r.wrapped_key);
        }
        secure_zero(&key, sizeof(key));
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = sign_share_record(discloser_signing, &r);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = std::move(r);
        return ok_status();
    }
} // namespace cop::protocol
