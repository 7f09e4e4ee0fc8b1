#pragma once

#include <string>
#include <string_view>

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"

namespace cop::core {
    // Lowercase hex, used for identifiers and diagnostics.
    [[nodiscard]] std::string hex_encode(BufferView in);

    // URL-safe base64 without padding; the decoder also accepts '=' padding.
    [[nodiscard]] std::string base64url_encode(BufferView in);
    Status base64url_decode(std::string_view in, Bytes* out) noexcept;

    // Decode into a fixed-width field; the decoded length must match exactly.
    Status base64url_decode_exact(std::string_view in, BufferMut out) noexcept;
} // namespace cop::core
