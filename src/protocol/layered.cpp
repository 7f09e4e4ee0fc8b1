#include "cop/protocol/layered.hpp"

#include <set>
#include <utility>

#include "cop/document/canonical.hpp"
#include "cop/document/hashing.hpp"
#include "cop/protocol/transcript.hpp"

namespace cop::protocol {
    using cop::core::BufferView;
    using cop::core::Hash256;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;
    using cop::document::Value;
    using namespace cop::security;

    namespace {
        constexpr char kAggregateLabel[] = "cop.aggregate.v1";
        constexpr char kSectionAadLabel[] = "cop.section.v1";

        Transcript make_section_aad(std::string_view doc_id,
            std::string_view section,
            const Hash256& section_hash,
            const Hash256& aggregate) {
            Transcript t(kSectionAadLabel);
            t.put_str(doc_id);
            t.put_str(section);
            t.put_hash(section_hash);
            t.put_hash(aggregate);
            return t;
        }

        [[nodiscard]] WrapScope section_scope(std::string_view doc_id, std::string_view section) noexcept {
            return WrapScope{doc_id, section};
        }

        Status check_aggregate(const LayeredProtectedTransaction& tx) noexcept {
            Hash256 h{};
            const Status s = compute_aggregate_hash(tx.doc_id, tx.sections, &h);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            if (!cop::core::hash_equal_ct(h, tx.aggregate_hash)) {
                return make_status(StatusDomain::Protocol, StatusCode::HashMismatch);
            }
            return ok_status();
        }

        Status open_section(const LayeredProtectedTransaction& tx,
            std::string_view name,
            const SectionEnvelope& env,
            const Key256& key,
            ScrubbedBytes* plaintext) noexcept {
            plaintext->v.assign(env.ciphertext.size(), 0);
            const Transcript aad = make_section_aad(tx.doc_id, name, env.content_hash, tx.aggregate_hash);
            Status s = aead_open(AeadId::ChaCha20Poly1305,
                key,
                env.nonce,
                aad.view(),
                cop::core::view_of(env.ciphertext),
                env.tag,
                cop::core::mut_of(plaintext->v));
            if (!cop::core::is_ok(s)) {
                return s;
            }
            Hash256 h{};
            s = cop::document::hash_compute(cop::core::view_of(plaintext->v), &h);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            if (!cop::core::hash_equal_ct(h, env.content_hash)) {
                return make_status(StatusDomain::Protocol, StatusCode::HashMismatch);
            }
            return ok_status();
        }

        // Section key and plaintext held between wrapping and sealing.
        struct PendingSection {
            Key256 key{};
            ScrubbedBytes plaintext;
            ~PendingSection() { secure_zero(&key, sizeof(key)); }
        };

        // The discloser's own inbound share for this document and section.
        const ShareRecord* find_via(const std::vector<ShareRecord>* vias,
            std::string_view doc_id,
            std::string_view holder_id,
            std::string_view section) noexcept {
            if (vias == nullptr) {
                return nullptr;
            }
            for (const ShareRecord& r : *vias) {
                if (r.doc_id == doc_id && r.to_id == holder_id && r.section.has_value() && *r.section == section) {
                    return &r;
                }
            }
            return nullptr;
        }
    } // namespace

    Status compute_aggregate_hash(std::string_view doc_id, const SectionMap& sections, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Transcript t(kAggregateLabel);
        t.put_str(doc_id);
        t.put_u32(static_cast<u32>(sections.size()));
        for (const auto& [name, env] : sections) {
            t.put_str(name);
            t.put_hash(env.content_hash);
            t.put_u32(static_cast<u32>(env.key_wraps.size()));
            for (const auto& [recipient, entry] : env.key_wraps) {
                t.put_str(recipient);
                t.put_bytes(BufferView{entry.sender_public.b, sizeof(entry.sender_public.b)});
                t.put_bytes(BufferView{entry.nonce.b, sizeof(entry.nonce.b)});
                t.put_bytes(BufferView{entry.wrapped_key.b, sizeof(entry.wrapped_key.b)});
                t.put_bytes(BufferView{entry.tag.b, sizeof(entry.tag.b)});
            }
        }
        return cop::document::hash_compute(t.view(), out);
    }

    Status split_document(const Value& document,
        const LayerPlan& plan,
        std::map<std::string, Value, std::less<>>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!document.is_object()) {
            return make_status(StatusDomain::Document, StatusCode::Structural);
        }
        if (plan.sections.empty() || (plan.remainder_section.has_value() && plan.remainder_section->empty())) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }

        std::map<std::string, Value, std::less<>> parts;
        std::set<std::string, std::less<>> assigned;
        for (const auto& [name, fields] : plan.sections) {
            if (name.empty() || fields.empty()) {
                return make_status(StatusDomain::Protocol, StatusCode::Invalid);
            }
            Value part = cop::document::make_object();
            for (const std::string& field : fields) {
                if (!assigned.insert(field).second) {
                    return make_status(StatusDomain::Document, StatusCode::Structural);
                }
                const Value* v = document.find(field);
                if (v == nullptr) {
                    return make_status(StatusDomain::Document, StatusCode::Structural);
                }
                part.set(field, *v);
            }
            parts.emplace(name, std::move(part));
        }

        for (const cop::document::Member& m : document.as_object()) {
            if (assigned.count(m.key) != 0) {
                continue;
            }
            if (!plan.remainder_section.has_value()) {
                return make_status(StatusDomain::Document, StatusCode::Structural);
            }
            auto it = parts.find(*plan.remainder_section);
            if (it == parts.end()) {
                it = parts.emplace(*plan.remainder_section, cop::document::make_object()).first;
            }
            it->second.set(m.key, m.value);
        }

        *out = std::move(parts);
        return ok_status();
    }

    Status protect_with_layers(const Value& document,
        const LayerPlan& plan,
        std::string_view seller_id,
        const SigningPrivateKey& seller_signing,
        const EncPrivateKey& seller_encryption,
        std::string_view buyer_id,
        const EncPublicKey& buyer_encryption_public,
        cop::core::Timestamp created_at,
        LayeredProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!cop::identity::party_id_valid(seller_id) || !cop::identity::party_id_valid(buyer_id) ||
            seller_id == buyer_id) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }

        // The whole document must be canonicalizable, not only its sections.
        Hash256 whole_hash{};
        Status s = cop::document::hash_document(document, &whole_hash);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        std::map<std::string, Value, std::less<>> parts;
        s = split_document(document, plan, &parts);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        LayeredProtectedTransaction tx{};
        s = derive_doc_id(document, &tx.doc_id);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        tx.seller_id = std::string(seller_id);
        tx.buyer_id = std::string(buyer_id);
        tx.created_at = created_at;

        EncPublicKey seller_public{};
        s = enc_public_from_private(seller_encryption, &seller_public);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        std::map<std::string, PendingSection, std::less<>> pending;
        for (const auto& [name, part] : parts) {
            PendingSection& p = pending[name];
            SectionEnvelope env{};
            s = cop::document::canonicalize_and_hash(part, &p.plaintext.v, &env.content_hash);
            if (cop::core::is_ok(s)) {
                s = random_key(&p.key);
            }
            WrappedKeyEntry seller_entry{};
            WrappedKeyEntry buyer_entry{};
            if (cop::core::is_ok(s)) {
                s = wrap_for(p.key, seller_public, nullptr, WrapPurpose::Content, section_scope(tx.doc_id, name), seller_id,
                    &seller_entry);
            }
            if (cop::core::is_ok(s)) {
                s = wrap_for(p.key, buyer_encryption_public, nullptr, WrapPurpose::Content, section_scope(tx.doc_id, name),
                    buyer_id, &buyer_entry);
            }
            if (!cop::core::is_ok(s)) {
                return s;
            }
            env.key_wraps.emplace(seller_entry.recipient_id, std::move(seller_entry));
            env.key_wraps.emplace(buyer_entry.recipient_id, std::move(buyer_entry));
            tx.sections.emplace(name, std::move(env));
        }

        s = compute_aggregate_hash(tx.doc_id, tx.sections, &tx.aggregate_hash);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        for (auto& [name, env] : tx.sections) {
            PendingSection& p = pending.find(name)->second;
            s = random_nonce(&env.nonce);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            env.ciphertext.assign(p.plaintext.v.size(), 0);
            const Transcript aad = make_section_aad(tx.doc_id, name, env.content_hash, tx.aggregate_hash);
            s = aead_seal(AeadId::ChaCha20Poly1305,
                p.key,
                env.nonce,
                aad.view(),
                cop::core::view_of(p.plaintext.v),
                cop::core::mut_of(env.ciphertext),
                &env.tag);
            if (!cop::core::is_ok(s)) {
                return s;
            }
        }

        s = sign_hash(seller_signing, tx.aggregate_hash, &tx.sig_seller);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = std::move(tx);
        return ok_status();
    }

    Status counter_sign_layered(const LayeredProtectedTransaction& in,
        std::string_view buyer_id,
        const SigningPrivateKey& buyer_signing,
        const EncPrivateKey& buyer_encryption,
        const SigningPublicKey& seller_signing_public,
        LayeredProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (buyer_id != in.buyer_id) {
            return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
        }
        if (in.sig_buyer.has_value()) {
            return make_status(StatusDomain::Protocol, StatusCode::Conflict);
        }
        Status s = check_aggregate(in);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        for (const auto& [name, env] : in.sections) {
            const auto entry = env.key_wraps.find(buyer_id);
            if (entry == env.key_wraps.end()) {
                return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
            }
            Key256 key{};
            s = unwrap_from(entry->second, buyer_encryption, WrapPurpose::Content, section_scope(in.doc_id, name), &key);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            ScrubbedBytes plaintext;
            s = open_section(in, name, env, key, &plaintext);
            secure_zero(&key, sizeof(key));
            if (!cop::core::is_ok(s)) {
                return s;
            }
        }

        s = verify_hash(seller_signing_public, in.aggregate_hash, in.sig_seller);
        if (s.code == StatusCode::Invalid) {
            return make_status(StatusDomain::Protocol, StatusCode::SignatureInvalid);
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }

        Signature sig{};
        s = sign_hash(buyer_signing, in.aggregate_hash, &sig);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        LayeredProtectedTransaction signed_tx = in;
        signed_tx.sig_buyer = sig;
        *out = std::move(signed_tx);
        return ok_status();
    }

    Status verify_layered(const LayeredProtectedTransaction& tx,
        const cop::identity::IdentityRegistry& registry,
        const std::vector<ShareRecord>* shares,
        VerifyReport* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        VerifyReport report{};

        Hash256 recomputed{};
        Status s = compute_aggregate_hash(tx.doc_id, tx.sections, &recomputed);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        report.aggregate_ok = cop::core::hash_equal_ct(recomputed, tx.aggregate_hash);

        cop::identity::PartyKeys seller{};
        s = registry.get_public_keys(tx.seller_id, &seller);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        report.seller_ok = cop::core::is_ok(verify_hash(seller.signing, tx.aggregate_hash, tx.sig_seller));

        if (tx.sig_buyer.has_value()) {
            cop::identity::PartyKeys buyer{};
            s = registry.get_public_keys(tx.buyer_id, &buyer);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            report.buyer_present = true;
            report.buyer_ok = cop::core::is_ok(verify_hash(buyer.signing, tx.aggregate_hash, *tx.sig_buyer));
        }

        if (shares != nullptr) {
            for (const ShareRecord& r : *shares) {
                ShareCheck c{};
                c.share_id = r.share_id;
                c.from_id = r.from_id;
                const auto section = r.section.has_value() ? tx.sections.find(*r.section) : tx.sections.end();
                if (r.doc_id == tx.doc_id && section != tx.sections.end()) {
                    s = verify_share_record(r, registry);
                    if (s.code == StatusCode::NotFound) {
                        return s;
                    }
                    c.valid = cop::core::is_ok(s);
                    c.layer_hash_ok =
                        r.layer_hash.has_value() && cop::core::hash_equal_ct(*r.layer_hash, section->second.content_hash);
                }
                report.shares.push_back(std::move(c));
            }
        }

        *out = std::move(report);
        return ok_status();
    }

    Status create_layer_share_records(const LayeredProtectedTransaction& tx,
        std::string_view discloser_id,
        const EncPrivateKey& discloser_encryption,
        const SigningPrivateKey& discloser_signing,
        std::string_view recipient_id,
        const EncPublicKey& recipient_encryption_public,
        const std::vector<std::string>& section_names,
        const std::vector<ShareRecord>* vias,
        const cop::identity::IdentityRegistry* registry,
        cop::core::Timestamp timestamp,
        std::vector<ShareRecord>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!cop::identity::party_id_valid(recipient_id) || recipient_id == discloser_id || section_names.empty()) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        std::set<std::string_view> seen;
        for (const std::string& name : section_names) {
            if (!seen.insert(name).second) {
                return make_status(StatusDomain::Protocol, StatusCode::Invalid);
            }
            if (tx.sections.find(name) == tx.sections.end()) {
                return make_status(StatusDomain::Protocol, StatusCode::NotFound);
            }
        }
        Status s = check_aggregate(tx);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        std::vector<ShareRecord> records;
        records.reserve(section_names.size());
        for (const std::string& name : section_names) {
            const SectionEnvelope& env = tx.sections.find(name)->second;

            Key256 key{};
            s = open_content_key(env.key_wraps, section_scope(tx.doc_id, name), discloser_id, discloser_encryption,
                find_via(vias, tx.doc_id, discloser_id, name), registry, &key);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            {
                ScrubbedBytes plaintext;
                s = open_section(tx, name, env, key, &plaintext);
            }
            if (!cop::core::is_ok(s)) {
                secure_zero(&key, sizeof(key));
                return s;
            }

            ShareRecord r{};
            s = new_share_id(&r.share_id);
            if (cop::core::is_ok(s)) {
                r.doc_id = tx.doc_id;
                r.section = name;
                r.from_id = std::string(discloser_id);
                r.to_id = std::string(recipient_id);
                r.timestamp = timestamp;
                r.layer_hash = env.content_hash;
                s = wrap_for(key, recipient_encryption_public, nullptr, WrapPurpose::Share, share_scope(r), recipient_id,
                    &r.wrapped_key);
            }
            secure_zero(&key, sizeof(key));
            if (cop::core::is_ok(s)) {
                s = sign_share_record(discloser_signing, &r);
            }
            if (!cop::core::is_ok(s)) {
                return s;
            }
            records.push_back(std::move(r));
        }

        *out = std::move(records);
        return ok_status();
    }

    Status unprotect_layer(const LayeredProtectedTransaction& tx,
        std::string_view party_id,
        std::string_view section_name,
        const EncPrivateKey& party_encryption,
        const ShareRecord* share,
        const cop::identity::IdentityRegistry* registry,
        Value* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        const auto section = tx.sections.find(section_name);
        if (section == tx.sections.end()) {
            return make_status(StatusDomain::Protocol, StatusCode::NotFound);
        }
        Status s = check_aggregate(tx);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        Key256 key{};
        s = open_content_key(section->second.key_wraps, section_scope(tx.doc_id, section->first), party_id,
            party_encryption, share, registry, &key);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ScrubbedBytes plaintext;
        s = open_section(tx, section->first, section->second, key, &plaintext);
        secure_zero(&key, sizeof(key));
        if (!cop::core::is_ok(s)) {
            return s;
        }
        return cop::document::parse_json(cop::core::view_of(plaintext.v), out);
    }
} // namespace cop::protocol
