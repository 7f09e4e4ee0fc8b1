#pragma once

#include <string>

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/document/value.hpp"

namespace cop::document {
    using u32 = cop::core::u32;

    // Nesting limit shared by the encoder and the parser.
    inline constexpr u32 kMaxDepth = 64;

    // Canonical JSON encoding:
    // - object keys sorted by unsigned byte order at every level
    // - no insignificant whitespace
    // - integers in plain decimal; floats finite, shortest round-trip form
    // - strings UTF-8, escaping only '"', '\' and control characters
    // Fails with Structural on Binary values, NaN/Inf, duplicate keys,
    // invalid UTF-8 or excessive nesting. *out is untouched on failure.
    cop::core::Status canonicalize(const Value& v, cop::core::Bytes* out) noexcept;

    // Reads standard JSON (whitespace allowed) into a Value.
    // Member order is preserved; duplicate keys and trailing bytes are rejected.
    cop::core::Status parse_json(cop::core::BufferView in, Value* out) noexcept;

    // Human-oriented rendering (two-space indent, members in stored order).
    // Used by tooling only; never hashed.
    cop::core::Status to_pretty_json(const Value& v, std::string* out) noexcept;

} // namespace cop::document
