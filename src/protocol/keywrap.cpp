#include "cop/protocol/keywrap.hpp"

#include <array>
#include <cstring>
#include <utility>

#include "cop/protocol/transcript.hpp"

namespace cop::protocol {
    using cop::core::BufferMut;
    using cop::core::BufferView;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;
    using namespace cop::security;

    namespace {
        constexpr char kWrapAadLabel[] = "cop.keywrap.v1";

        Transcript make_wrap_aad(WrapPurpose purpose,
            const WrapScope& scope,
            std::string_view recipient_id,
            const EncPublicKey& sender_public) {
            Transcript t(kWrapAadLabel);
            t.put_u8(static_cast<u8>(purpose));
            t.put_str(scope.doc_id);
            t.put_u8(scope.section.has_value() ? 1 : 0);
            if (scope.section.has_value()) {
                t.put_str(*scope.section);
            }
            t.put_str(recipient_id);
            t.put_bytes(BufferView{sender_public.b, sizeof(sender_public.b)});
            return t;
        }

        // HKDF binding: sender public || recipient public.
        Status derive_wrap_key(const SharedSecret& secret,
            WrapPurpose purpose,
            const EncPublicKey& sender_public,
            const EncPublicKey& recipient_public,
            Key256* out) noexcept {
            std::array<u8, 64> binding{};
            std::memcpy(binding.data(), sender_public.b, 32);
            std::memcpy(binding.data() + 32, recipient_public.b, 32);
            return kdf_derive(BufferView{secret.b, sizeof(secret.b)},
                wrap_kdf_context(purpose),
                BufferView{binding.data(), static_cast<u32>(binding.size())},
                out);
        }

        [[nodiscard]] bool purpose_ok(WrapPurpose p) noexcept {
            return p == WrapPurpose::Content || p == WrapPurpose::Share;
        }
    } // namespace

    KdfContext wrap_kdf_context(WrapPurpose purpose) noexcept {
        return purpose == WrapPurpose::Share ? KdfContext::ShareWrap : KdfContext::ContentWrap;
    }

    Status wrap_for(const Key256& content_key,
        const EncPublicKey& recipient_public,
        const EncPrivateKey* sender_static,
        WrapPurpose purpose,
        const WrapScope& scope,
        std::string_view recipient_id,
        WrappedKeyEntry* out) noexcept {
        if (out == nullptr || recipient_id.empty() || scope.doc_id.empty() || !purpose_ok(purpose)) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }

        EncKeyPair sender{};
        Status s;
        if (sender_static != nullptr) {
            sender.priv = *sender_static;
            s = enc_public_from_private(sender.priv, &sender.pub);
        } else {
            s = enc_keypair_generate(&sender);
        }
        if (!cop::core::is_ok(s)) {
            secure_zero(&sender, sizeof(sender));
            return s;
        }

        SharedSecret secret{};
        s = derive_shared_secret(sender.priv, recipient_public, &secret);
        secure_zero(&sender.priv, sizeof(sender.priv));
        if (!cop::core::is_ok(s)) {
            return s;
        }

        Key256 wrap_key{};
        s = derive_wrap_key(secret, purpose, sender.pub, recipient_public, &wrap_key);
        secure_zero(&secret, sizeof(secret));
        if (!cop::core::is_ok(s)) {
            return s;
        }

        WrappedKeyEntry e{};
        e.recipient_id = std::string(recipient_id);
        e.sender_public = sender.pub;
        s = random_nonce(&e.nonce);
        if (!cop::core::is_ok(s)) {
            secure_zero(&wrap_key, sizeof(wrap_key));
            return s;
        }

        const Transcript aad = make_wrap_aad(purpose, scope, recipient_id, e.sender_public);
        s = aead_seal(AeadId::ChaCha20Poly1305,
            wrap_key,
            e.nonce,
            aad.view(),
            BufferView{content_key.b, sizeof(content_key.b)},
            BufferMut{e.wrapped_key.b, sizeof(e.wrapped_key.b)},
            &e.tag);
        secure_zero(&wrap_key, sizeof(wrap_key));
        if (!cop::core::is_ok(s)) {
            return s;
        }

        *out = std::move(e);
        return ok_status();
    }

    Status unwrap_from(const WrappedKeyEntry& entry,
        const EncPrivateKey& my_private,
        WrapPurpose purpose,
        const WrapScope& scope,
        Key256* content_key_out) noexcept {
        if (content_key_out == nullptr || scope.doc_id.empty() || !purpose_ok(purpose)) {
            return make_status(StatusDomain::Protocol, StatusCode::Invalid);
        }

        EncPublicKey my_public{};
        Status s = enc_public_from_private(my_private, &my_public);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        // A sender key that yields no usable secret is a damaged entry.
        SharedSecret secret{};
        s = derive_shared_secret(my_private, entry.sender_public, &secret);
        if (!cop::core::is_ok(s)) {
            return make_status(StatusDomain::Protocol, StatusCode::UnwrapFailure);
        }

        Key256 wrap_key{};
        s = derive_wrap_key(secret, purpose, entry.sender_public, my_public, &wrap_key);
        secure_zero(&secret, sizeof(secret));
        if (!cop::core::is_ok(s)) {
            return s;
        }

        const Transcript aad = make_wrap_aad(purpose, scope, entry.recipient_id, entry.sender_public);
        Key256 key{};
        s = aead_open(AeadId::ChaCha20Poly1305,
            wrap_key,
            entry.nonce,
            aad.view(),
            BufferView{entry.wrapped_key.b, sizeof(entry.wrapped_key.b)},
            entry.tag,
            BufferMut{key.b, sizeof(key.b)});
        secure_zero(&wrap_key, sizeof(wrap_key));
        if (s.code == StatusCode::AuthFailure) {
            return make_status(StatusDomain::Protocol, StatusCode::UnwrapFailure);
        }
        if (!cop::core::is_ok(s)) {
            return s;
        }

        *content_key_out = key;
        secure_zero(&key, sizeof(key));
        return ok_status();
    }

    bool entry_equal(const WrappedKeyEntry& a, const WrappedKeyEntry& b) noexcept {
        return a.recipient_id == b.recipient_id &&
            std::memcmp(a.sender_public.b, b.sender_public.b, sizeof(a.sender_public.b)) == 0 &&
            std::memcmp(a.nonce.b, b.nonce.b, sizeof(a.nonce.b)) == 0 &&
            std::memcmp(a.wrapped_key.b, b.wrapped_key.b, sizeof(a.wrapped_key.b)) == 0 &&
            std::memcmp(a.tag.b, b.tag.b, sizeof(a.tag.b)) == 0;
    }
} // namespace cop::protocol
