#include "cop/document/hashing.hpp"

#include <cstddef>
#include <utility>

#include <blake3.h>

#include "cop/document/canonical.hpp"

namespace cop::document {
    using namespace cop::core;

    Status hash_compute(BufferView data, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        if (!buffer_ok(data)) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    Status canonicalize_and_hash(const Value& v, Bytes* canonical_out, Hash256* hash_out) noexcept {
        if (canonical_out == nullptr || hash_out == nullptr) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        Bytes bytes;
        Status s = canonicalize(v, &bytes);
        if (!is_ok(s)) {
            return s;
        }
        Hash256 h{};
        s = hash_compute(view_of(bytes), &h);
        if (!is_ok(s)) {
            return s;
        }
        *canonical_out = std::move(bytes);
        *hash_out = h;
        return ok_status();
    }

    Status hash_document(const Value& v, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        Bytes bytes;
        return canonicalize_and_hash(v, &bytes, out);
    }
} // namespace cop::document
