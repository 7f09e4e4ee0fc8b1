#include "cop/protocol/records.hpp"

#include <cstring>
#include <string>
#include <utility>

#include "cop/core/encoding.hpp"
#include "cop/document/canonical.hpp"

namespace cop::protocol {
    using cop::core::BufferMut;
    using cop::core::BufferView;
    using cop::core::Bytes;
    using cop::core::Hash256;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::u32;
    using cop::core::u8;
    using cop::core::StatusDomain;
    using cop::document::Value;

    namespace {
        constexpr char kHashAlg[] = "BLAKE3";
        constexpr char kCipher[] = "ChaCha20-Poly1305";
        constexpr char kWrap[] = "X25519-HKDF-SHA256";
        constexpr char kSig[] = "Ed25519";

        [[nodiscard]] Status structural() noexcept {
            return make_status(StatusDomain::Protocol, StatusCode::Structural);
        }

        Value b64(const u8* data, std::size_t len) {
            return Value(cop::core::base64url_encode(BufferView{data, static_cast<u32>(len)}));
        }

        Value b64(const Hash256& h) {
            return b64(h.b.data(), h.b.size());
        }

        Value meta_value() {
            Value m = cop::document::make_object();
            m.set("hash_alg", kHashAlg);
            m.set("cipher", kCipher);
            m.set("wrap", kWrap);
            m.set("sig", kSig);
            return m;
        }

        Status check_meta(const Value& record) noexcept {
            const Value* m = record.find("meta");
            if (m == nullptr || !m->is_object()) {
                return structural();
            }
            const char* const keys[] = {"hash_alg", "cipher", "wrap", "sig"};
            const char* const expected[] = {kHashAlg, kCipher, kWrap, kSig};
            for (std::size_t i = 0; i < 4; ++i) {
                const Value* f = m->find(keys[i]);
                if (f == nullptr || !f->is_string()) {
                    return structural();
                }
                if (f->as_string() != expected[i]) {
                    return make_status(StatusDomain::Protocol, StatusCode::Unsupported);
                }
            }
            return ok_status();
        }

        Status get_string(const Value& obj, std::string_view key, std::string* out) noexcept {
            const Value* f = obj.find(key);
            if (f == nullptr || !f->is_string()) {
                return structural();
            }
            *out = f->as_string();
            return ok_status();
        }

        Status get_id(const Value& obj, std::string_view key, std::string* out) noexcept {
            const Status s = get_string(obj, key, out);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            return out->empty() ? structural() : ok_status();
        }

        Status get_int(const Value& obj, std::string_view key, cop::core::i64* out) noexcept {
            const Value* f = obj.find(key);
            if (f == nullptr || !f->is_int()) {
                return structural();
            }
            *out = f->as_int();
            return ok_status();
        }

        Status get_fixed(const Value& obj, std::string_view key, u8* data, std::size_t len) noexcept {
            const Value* f = obj.find(key);
            if (f == nullptr || !f->is_string()) {
                return structural();
            }
            const Status s = cop::core::base64url_decode_exact(f->as_string(), BufferMut{data, static_cast<u32>(len)});
            return cop::core::is_ok(s) ? ok_status() : structural();
        }

        Status get_hash(const Value& obj, std::string_view key, Hash256* out) noexcept {
            return get_fixed(obj, key, out->b.data(), out->b.size());
        }

        Status get_bytes(const Value& obj, std::string_view key, Bytes* out) noexcept {
            const Value* f = obj.find(key);
            if (f == nullptr || !f->is_string()) {
                return structural();
            }
            const Status s = cop::core::base64url_decode(f->as_string(), out);
            return cop::core::is_ok(s) ? ok_status() : structural();
        }

        // Absent and null both read as "not set".
        [[nodiscard]] const Value* optional_field(const Value& obj, std::string_view key) noexcept {
            const Value* f = obj.find(key);
            return (f == nullptr || f->is_null()) ? nullptr : f;
        }

        Status check_kind(const Value& v, RecordKind expected) noexcept {
            if (!v.is_object()) {
                return structural();
            }
            RecordKind kind{};
            const Status s = record_kind_of(v, &kind);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            if (kind != expected) {
                return structural();
            }
            return check_meta(v);
        }

        // The recipient id is the map key (or the share's to_id), not a field.
        Value entry_to_value(const WrappedKeyEntry& e) {
            Value v = cop::document::make_object();
            v.set("sender_public", b64(e.sender_public.b, sizeof(e.sender_public.b)));
            v.set("nonce", b64(e.nonce.b, sizeof(e.nonce.b)));
            v.set("wrapped_key", b64(e.wrapped_key.b, sizeof(e.wrapped_key.b)));
            v.set("tag", b64(e.tag.b, sizeof(e.tag.b)));
            return v;
        }

        Status entry_from_value(const Value& v, std::string_view recipient_id, WrappedKeyEntry* out) noexcept {
            if (!v.is_object()) {
                return structural();
            }
            WrappedKeyEntry e{};
            e.recipient_id = std::string(recipient_id);
            Status s = get_fixed(v, "sender_public", e.sender_public.b, sizeof(e.sender_public.b));
            if (cop::core::is_ok(s)) {
                s = get_fixed(v, "nonce", e.nonce.b, sizeof(e.nonce.b));
            }
            if (cop::core::is_ok(s)) {
                s = get_fixed(v, "wrapped_key", e.wrapped_key.b, sizeof(e.wrapped_key.b));
            }
            if (cop::core::is_ok(s)) {
                s = get_fixed(v, "tag", e.tag.b, sizeof(e.tag.b));
            }
            if (!cop::core::is_ok(s)) {
                return s;
            }
            *out = std::move(e);
            return ok_status();
        }

        Value wraps_to_value(const KeyWrapMap& wraps) {
            Value v = cop::document::make_object();
            for (const auto& [recipient, entry] : wraps) {
                v.set(recipient, entry_to_value(entry));
            }
            return v;
        }

        Status wraps_from_value(const Value& obj, KeyWrapMap* out) noexcept {
            const Value* v = obj.find("key_wraps");
            if (v == nullptr || !v->is_object() || v->as_object().empty()) {
                return structural();
            }
            KeyWrapMap wraps;
            for (const cop::document::Member& m : v->as_object()) {
                if (!cop::identity::party_id_valid(m.key)) {
                    return structural();
                }
                WrappedKeyEntry e{};
                const Status s = entry_from_value(m.value, m.key, &e);
                if (!cop::core::is_ok(s)) {
                    return s;
                }
                if (!wraps.emplace(m.key, std::move(e)).second) {
                    return structural();
                }
            }
            *out = std::move(wraps);
            return ok_status();
        }

        void put_signatures(Value* v,
            const cop::security::Signature& seller,
            const std::optional<cop::security::Signature>& buyer) {
            v->set("sig_seller", b64(seller.b, sizeof(seller.b)));
            if (buyer.has_value()) {
                v->set("sig_buyer", b64(buyer->b, sizeof(buyer->b)));
            }
        }

        Status get_signatures(const Value& v,
            cop::security::Signature* seller,
            std::optional<cop::security::Signature>* buyer) noexcept {
            Status s = get_fixed(v, "sig_seller", seller->b, sizeof(seller->b));
            if (!cop::core::is_ok(s)) {
                return s;
            }
            buyer->reset();
            if (optional_field(v, "sig_buyer") != nullptr) {
                cop::security::Signature sig{};
                s = get_fixed(v, "sig_buyer", sig.b, sizeof(sig.b));
                if (!cop::core::is_ok(s)) {
                    return s;
                }
                *buyer = sig;
            }
            return ok_status();
        }

        Status get_parties(const Value& v, std::string* doc_id, std::string* seller, std::string* buyer,
            cop::core::Timestamp* created_at) noexcept {
            Status s = get_id(v, "doc_id", doc_id);
            if (cop::core::is_ok(s)) {
                s = get_id(v, "seller_id", seller);
            }
            if (cop::core::is_ok(s)) {
                s = get_id(v, "buyer_id", buyer);
            }
            if (cop::core::is_ok(s)) {
                s = get_int(v, "created_at", created_at);
            }
            return s;
        }
    } // namespace

    const char* record_kind_name(RecordKind kind) noexcept {
        switch (kind) {
            case RecordKind::Plain: return "plain";
            case RecordKind::Layered: return "layered";
            case RecordKind::Share: return "share";
        }
        return "unknown";
    }

    Status record_kind_of(const Value& v, RecordKind* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        const Value* k = v.find("kind");
        if (k == nullptr || !k->is_string()) {
            return structural();
        }
        for (RecordKind kind : {RecordKind::Plain, RecordKind::Layered, RecordKind::Share}) {
            if (k->as_string() == record_kind_name(kind)) {
                *out = kind;
                return ok_status();
            }
        }
        return structural();
    }

    Value to_value(const ProtectedTransaction& tx) {
        Value v = cop::document::make_object();
        v.set("kind", record_kind_name(RecordKind::Plain));
        v.set("doc_id", tx.doc_id);
        v.set("seller_id", tx.seller_id);
        v.set("buyer_id", tx.buyer_id);
        v.set("created_at", tx.created_at);
        v.set("ciphertext", b64(tx.ciphertext.data(), tx.ciphertext.size()));
        v.set("nonce", b64(tx.nonce.b, sizeof(tx.nonce.b)));
        v.set("tag", b64(tx.tag.b, sizeof(tx.tag.b)));
        v.set("content_hash", b64(tx.content_hash));
        v.set("key_wraps", wraps_to_value(tx.key_wraps));
        put_signatures(&v, tx.sig_seller, tx.sig_buyer);
        v.set("meta", meta_value());
        return v;
    }

    Value to_value(const LayeredProtectedTransaction& tx) {
        Value v = cop::document::make_object();
        v.set("kind", record_kind_name(RecordKind::Layered));
        v.set("doc_id", tx.doc_id);
        v.set("seller_id", tx.seller_id);
        v.set("buyer_id", tx.buyer_id);
        v.set("created_at", tx.created_at);
        Value sections = cop::document::make_object();
        for (const auto& [name, env] : tx.sections) {
            Value s = cop::document::make_object();
            s.set("ciphertext", b64(env.ciphertext.data(), env.ciphertext.size()));
            s.set("nonce", b64(env.nonce.b, sizeof(env.nonce.b)));
            s.set("tag", b64(env.tag.b, sizeof(env.tag.b)));
            s.set("content_hash", b64(env.content_hash));
            s.set("key_wraps", wraps_to_value(env.key_wraps));
            sections.set(name, std::move(s));
        }
        v.set("sections", std::move(sections));
        v.set("aggregate_hash", b64(tx.aggregate_hash));
        put_signatures(&v, tx.sig_seller, tx.sig_buyer);
        v.set("meta", meta_value());
        return v;
    }

    Value share_body_to_value(const ShareRecord& r) {
        Value v = cop::document::make_object();
        v.set("kind", record_kind_name(RecordKind::Share));
        v.set("share_id", r.share_id);
        v.set("doc_id", r.doc_id);
        if (r.section.has_value()) {
            v.set("section", *r.section);
        }
        v.set("from_id", r.from_id);
        v.set("to_id", r.to_id);
        v.set("wrapped_key", entry_to_value(r.wrapped_key));
        v.set("timestamp", r.timestamp);
        if (r.layer_hash.has_value()) {
            v.set("layer_hash", b64(*r.layer_hash));
        }
        v.set("meta", meta_value());
        return v;
    }

    Value to_value(const ShareRecord& r) {
        Value v = share_body_to_value(r);
        v.set("signature", b64(r.signature.b, sizeof(r.signature.b)));
        return v;
    }

    Status from_value(const Value& v, ProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Status s = check_kind(v, RecordKind::Plain);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ProtectedTransaction tx{};
        s = get_parties(v, &tx.doc_id, &tx.seller_id, &tx.buyer_id, &tx.created_at);
        if (cop::core::is_ok(s)) {
            s = get_bytes(v, "ciphertext", &tx.ciphertext);
        }
        if (cop::core::is_ok(s)) {
            s = get_fixed(v, "nonce", tx.nonce.b, sizeof(tx.nonce.b));
        }
        if (cop::core::is_ok(s)) {
            s = get_fixed(v, "tag", tx.tag.b, sizeof(tx.tag.b));
        }
        if (cop::core::is_ok(s)) {
            s = get_hash(v, "content_hash", &tx.content_hash);
        }
        if (cop::core::is_ok(s)) {
            s = wraps_from_value(v, &tx.key_wraps);
        }
        if (cop::core::is_ok(s)) {
            s = get_signatures(v, &tx.sig_seller, &tx.sig_buyer);
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = std::move(tx);
        return ok_status();
    }

    Status from_value(const Value& v, LayeredProtectedTransaction* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Status s = check_kind(v, RecordKind::Layered);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        LayeredProtectedTransaction tx{};
        s = get_parties(v, &tx.doc_id, &tx.seller_id, &tx.buyer_id, &tx.created_at);
        if (cop::core::is_ok(s)) {
            s = get_hash(v, "aggregate_hash", &tx.aggregate_hash);
        }
        if (cop::core::is_ok(s)) {
            s = get_signatures(v, &tx.sig_seller, &tx.sig_buyer);
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }

        const Value* sections = v.find("sections");
        if (sections == nullptr || !sections->is_object() || sections->as_object().empty()) {
            return structural();
        }
        for (const cop::document::Member& m : sections->as_object()) {
            if (m.key.empty() || !m.value.is_object()) {
                return structural();
            }
            SectionEnvelope env{};
            s = get_bytes(m.value, "ciphertext", &env.ciphertext);
            if (cop::core::is_ok(s)) {
                s = get_fixed(m.value, "nonce", env.nonce.b, sizeof(env.nonce.b));
            }
            if (cop::core::is_ok(s)) {
                s = get_fixed(m.value, "tag", env.tag.b, sizeof(env.tag.b));
            }
            if (cop::core::is_ok(s)) {
                s = get_hash(m.value, "content_hash", &env.content_hash);
            }
            if (cop::core::is_ok(s)) {
                s = wraps_from_value(m.value, &env.key_wraps);
            }
            if (!cop::core::is_ok(s)) {
                return s;
            }
            if (!tx.sections.emplace(m.key, std::move(env)).second) {
                return structural();
            }
        }

        *out = std::move(tx);
        return ok_status();
    }

    Status from_value(const Value& v, ShareRecord* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Status s = check_kind(v, RecordKind::Share);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        ShareRecord r{};
        s = get_id(v, "share_id", &r.share_id);
        if (cop::core::is_ok(s)) {
            s = get_id(v, "doc_id", &r.doc_id);
        }
        if (cop::core::is_ok(s)) {
            s = get_id(v, "from_id", &r.from_id);
        }
        if (cop::core::is_ok(s)) {
            s = get_id(v, "to_id", &r.to_id);
        }
        if (cop::core::is_ok(s)) {
            s = get_int(v, "timestamp", &r.timestamp);
        }
        if (cop::core::is_ok(s)) {
            const Value* wk = v.find("wrapped_key");
            s = wk == nullptr ? structural() : entry_from_value(*wk, r.to_id, &r.wrapped_key);
        }
        if (cop::core::is_ok(s)) {
            s = get_fixed(v, "signature", r.signature.b, sizeof(r.signature.b));
        }
        if (cop::core::is_ok(s) && optional_field(v, "section") != nullptr) {
            std::string section;
            s = get_id(v, "section", &section);
            r.section = std::move(section);
        }
        if (cop::core::is_ok(s) && optional_field(v, "layer_hash") != nullptr) {
            Hash256 h{};
            s = get_hash(v, "layer_hash", &h);
            r.layer_hash = h;
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }
        *out = std::move(r);
        return ok_status();
    }

    template <typename Record>
    Status encode_record(const Record& record, Bytes* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        return cop::document::canonicalize(to_value(record), out);
    }

    template <typename Record>
    Status decode_record(BufferView in, Record* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Value v;
        const Status s = cop::document::parse_json(in, &v);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        return from_value(v, out);
    }

    template Status encode_record<ProtectedTransaction>(const ProtectedTransaction&, Bytes*) noexcept;
    template Status encode_record<LayeredProtectedTransaction>(const LayeredProtectedTransaction&, Bytes*) noexcept;
    template Status encode_record<ShareRecord>(const ShareRecord&, Bytes*) noexcept;
    template Status decode_record<ProtectedTransaction>(BufferView, ProtectedTransaction*) noexcept;
    template Status decode_record<LayeredProtectedTransaction>(BufferView, LayeredProtectedTransaction*) noexcept;
    template Status decode_record<ShareRecord>(BufferView, ShareRecord*) noexcept;

    Status encode_share_list(const std::vector<ShareRecord>& records, Bytes* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Value list = cop::document::make_array();
        for (const ShareRecord& r : records) {
            list.as_array().push_back(to_value(r));
        }
        return cop::document::canonicalize(list, out);
    }

    Status decode_share_list(BufferView in, std::vector<ShareRecord>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        Value v;
        Status s = cop::document::parse_json(in, &v);
        if (!cop::core::is_ok(s)) {
            return s;
        }
        std::vector<ShareRecord> records;
        if (v.is_object()) {
            ShareRecord r{};
            s = from_value(v, &r);
            if (!cop::core::is_ok(s)) {
                return s;
            }
            records.push_back(std::move(r));
        } else if (v.is_array()) {
            for (const Value& item : v.as_array()) {
                ShareRecord r{};
                s = from_value(item, &r);
                if (!cop::core::is_ok(s)) {
                    return s;
                }
                records.push_back(std::move(r));
            }
        } else {
            return structural();
        }
        *out = std::move(records);
        return ok_status();
    }

    Value to_value(const LayerPlan& plan) {
        Value sections = cop::document::make_object();
        for (const auto& [name, fields] : plan.sections) {
            Value list = cop::document::make_array();
            for (const std::string& f : fields) {
                list.as_array().push_back(Value(f));
            }
            sections.set(name, std::move(list));
        }
        Value v = cop::document::make_object();
        v.set("sections", std::move(sections));
        if (plan.remainder_section.has_value()) {
            v.set("remainder", *plan.remainder_section);
        }
        return v;
    }

    Status from_value(const Value& v, LayerPlan* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }
        if (!v.is_object()) {
            return structural();
        }
        const Value* sections = v.find("sections");
        if (sections == nullptr || !sections->is_object()) {
            return structural();
        }
        LayerPlan plan;
        for (const cop::document::Member& m : sections->as_object()) {
            if (!m.value.is_array()) {
                return structural();
            }
            std::vector<std::string> fields;
            for (const Value& f : m.value.as_array()) {
                if (!f.is_string()) {
                    return structural();
                }
                fields.push_back(f.as_string());
            }
            if (!plan.sections.emplace(m.key, std::move(fields)).second) {
                return structural();
            }
        }
        if (const Value* r = optional_field(v, "remainder")) {
            if (!r->is_string()) {
                return structural();
            }
            plan.remainder_section = r->as_string();
        }
        *out = std::move(plan);
        return ok_status();
    }
} // namespace cop::protocol
