#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cop/core/errors.hpp"
#include "cop/identity/registry.hpp"
#include "cop/protocol/layered.hpp"
#include "cop/protocol/records.hpp"
#include "cop/protocol/share.hpp"
#include "cop/protocol/transaction.hpp"

struct sqlite3;

namespace cop::store {

    // Local SQLite ledger: party public keys, protected records by doc id and
    // the disclosure (share record) history. Records are stored as their
    // canonical JSON bytes.
    class RecordStore final : public cop::identity::IdentityRegistry {
    public:
        RecordStore() = default;
        RecordStore(const RecordStore&) = delete;
        RecordStore& operator=(const RecordStore&) = delete;
        ~RecordStore() override;

        // ":memory:" opens a private in-memory database. Journal mode comes from
        // COP_DB_JOURNAL_MODE (default WAL).
        cop::core::Status open(const std::string& path) noexcept;
        void close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Insert or replace.
        cop::core::Status put_party(const cop::identity::PartyKeys& keys) noexcept;
        cop::core::Status get_public_keys(std::string_view party_id,
            cop::identity::PartyKeys* out) const noexcept override;
        cop::core::Status list_parties(std::vector<std::string>* out) const noexcept;

        // Insert or replace (a counter-signed record supersedes the earlier one).
        cop::core::Status put_transaction(const cop::protocol::ProtectedTransaction& tx) noexcept;
        cop::core::Status put_transaction(const cop::protocol::LayeredProtectedTransaction& tx) noexcept;

        cop::core::Status get_transaction_kind(std::string_view doc_id, cop::protocol::RecordKind* out) const noexcept;
        // Invalid when the stored record is of the other kind.
        cop::core::Status get_transaction(std::string_view doc_id, cop::protocol::ProtectedTransaction* out) const noexcept;
        cop::core::Status get_transaction(std::string_view doc_id,
            cop::protocol::LayeredProtectedTransaction* out) const noexcept;

        // Conflict when the share id is already recorded.
        cop::core::Status put_share(const cop::protocol::ShareRecord& record) noexcept;

        // Ordered by timestamp, then share id. A section filter matches only
        // shares scoped to that section.
        cop::core::Status list_shares(std::string_view doc_id,
            std::optional<std::string_view> section,
            std::vector<cop::protocol::ShareRecord>* out) const noexcept;

    private:
        cop::core::Status put_transaction_bytes(const std::string& doc_id,
            cop::protocol::RecordKind kind,
            cop::core::Timestamp created_at,
            const cop::core::Bytes& record) noexcept;
        cop::core::Status get_transaction_bytes(std::string_view doc_id,
            cop::protocol::RecordKind* kind,
            cop::core::Bytes* record) const noexcept;

        sqlite3* db_{nullptr};
        mutable std::mutex mutex_;
    };

} // namespace cop::store
