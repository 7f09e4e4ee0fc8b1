#pragma once

#include <string_view>
#include <vector>

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/document/value.hpp"
#include "cop/protocol/layered.hpp"
#include "cop/protocol/share.hpp"
#include "cop/protocol/transaction.hpp"

namespace cop::protocol {

    // Exchange shape for the storage/relay side. Binary fields are unpadded
    // base64url; every record carries "kind" and a "meta" suite description.
    enum class RecordKind : cop::core::u8 {
        Plain = 1,
        Layered = 2,
        Share = 3,
    };

    [[nodiscard]] const char* record_kind_name(RecordKind kind) noexcept;

    // Reads "kind" without validating the rest. Structural when absent or unknown.
    cop::core::Status record_kind_of(const cop::document::Value& v, RecordKind* out) noexcept;

    [[nodiscard]] cop::document::Value to_value(const ProtectedTransaction& tx);
    [[nodiscard]] cop::document::Value to_value(const LayeredProtectedTransaction& tx);
    [[nodiscard]] cop::document::Value to_value(const ShareRecord& record);

    // The signed portion of a share record (everything except "signature").
    [[nodiscard]] cop::document::Value share_body_to_value(const ShareRecord& record);

    // Structural on missing or mistyped fields, Unsupported on a foreign suite.
    cop::core::Status from_value(const cop::document::Value& v, ProtectedTransaction* out) noexcept;
    cop::core::Status from_value(const cop::document::Value& v, LayeredProtectedTransaction* out) noexcept;
    cop::core::Status from_value(const cop::document::Value& v, ShareRecord* out) noexcept;

    // Canonical JSON bytes of a record, and back.
    template <typename Record>
    cop::core::Status encode_record(const Record& record, cop::core::Bytes* out) noexcept;

    template <typename Record>
    cop::core::Status decode_record(cop::core::BufferView in, Record* out) noexcept;

    // Layer plans as supplied by tooling:
    //   {"sections": {"<name>": ["<field>", ...]}, "remainder": "<name>"}
    // "remainder" is optional. Plan validation happens in protect_with_layers.
    [[nodiscard]] cop::document::Value to_value(const LayerPlan& plan);
    cop::core::Status from_value(const cop::document::Value& v, LayerPlan* out) noexcept;

    // A JSON array of share records.
    cop::core::Status encode_share_list(const std::vector<ShareRecord>& records, cop::core::Bytes* out) noexcept;
    cop::core::Status decode_share_list(cop::core::BufferView in, std::vector<ShareRecord>* out) noexcept;

} // namespace cop::protocol
