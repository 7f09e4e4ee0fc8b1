#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "cop/core/errors.hpp"
#include "cop/security/asymmetric.hpp"
#include "cop/security/crypto.hpp"
#include "cop/security/kdf.hpp"

namespace cop::protocol {

    enum class WrapPurpose : cop::core::u8 {
        Content = 1, // seller/buyer entries written at protect time
        Share = 2,   // entries carried by a ShareRecord
    };

    [[nodiscard]] cop::security::KdfContext wrap_kdf_context(WrapPurpose purpose) noexcept;

    // A content key wrapped for one recipient.
    struct WrappedKeyEntry {
        std::string recipient_id;
        cop::security::EncPublicKey sender_public{};
        cop::security::Nonce12 nonce{};
        cop::security::Key256 wrapped_key{};
        cop::security::Tag16 tag{};
    };

    // Recipient id -> entry.
    using KeyWrapMap = std::map<std::string, WrappedKeyEntry, std::less<>>;

    // What the wrapped key unlocks. An empty section means the whole document.
    struct WrapScope {
        std::string_view doc_id;
        std::optional<std::string_view> section;
    };

    // X25519(sender, recipient) -> HKDF(label(purpose), sender_pub || recipient_pub)
    // -> ChaCha20-Poly1305 over the content key. A null sender_static draws a
    // fresh ephemeral key pair for this entry.
    cop::core::Status wrap_for(const cop::security::Key256& content_key,
        const cop::security::EncPublicKey& recipient_public,
        const cop::security::EncPrivateKey* sender_static,
        WrapPurpose purpose,
        const WrapScope& scope,
        std::string_view recipient_id,
        WrappedKeyEntry* out) noexcept;

    // Fails with UnwrapFailure when the entry does not open under my_private
    // (wrong recipient, tampered entry or wrong key).
    cop::core::Status unwrap_from(const WrappedKeyEntry& entry,
        const cop::security::EncPrivateKey& my_private,
        WrapPurpose purpose,
        const WrapScope& scope,
        cop::security::Key256* content_key_out) noexcept;

    [[nodiscard]] bool entry_equal(const WrappedKeyEntry& a, const WrappedKeyEntry& b) noexcept;

} // namespace cop::protocol
