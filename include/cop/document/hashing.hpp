#pragma once

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"
#include "cop/document/value.hpp"

namespace cop::document {
    // BLAKE3-256 over raw bytes.
    cop::core::Status hash_compute(cop::core::BufferView data, cop::core::Hash256* out) noexcept;

    // BLAKE3-256 over canonicalize(v). Structural errors propagate.
    cop::core::Status hash_document(const Value& v, cop::core::Hash256* out) noexcept;

    // Canonical bytes and their hash in one pass; both outputs are written only on success.
    cop::core::Status canonicalize_and_hash(const Value& v,
        cop::core::Bytes* canonical_out,
        cop::core::Hash256* hash_out) noexcept;

} // namespace cop::document
