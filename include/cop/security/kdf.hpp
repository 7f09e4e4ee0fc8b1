#pragma once

#include <type_traits>

#include "cop/core/errors.hpp"
#include "cop/security/crypto.hpp"

namespace cop::security {

    // Each wrap purpose gets its own label, so a key derived for one purpose
    // is never accepted for another.
    enum class KdfContext : u8 {
        ContentWrap = 1,
        ShareWrap = 2,
    };

    [[nodiscard]] const char* kdf_label(KdfContext ctx) noexcept;

    cop::core::Status hmac_sha256(BufferView key, BufferView msg, Key256* out) noexcept;

    // RFC 5869 HKDF-SHA256. An empty salt means HashLen zero bytes.
    cop::core::Status hkdf_extract(BufferView salt, BufferView ikm, Key256* prk_out) noexcept;

    // out.len must be at most 255 * 32.
    cop::core::Status hkdf_expand(const Key256& prk, BufferView info, BufferMut out) noexcept;

    // Extract-then-expand with info = label(ctx) || binding.
    cop::core::Status kdf_derive(BufferView secret,
        KdfContext ctx,
        BufferView binding,
        Key256* out_key) noexcept;

    static_assert(std::is_trivially_copyable_v<KdfContext>);

} // namespace cop::security
