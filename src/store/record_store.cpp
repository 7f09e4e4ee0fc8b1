#include "cop/store/record_store.hpp"

#include <sqlite3.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

namespace cop::store {

using namespace cop::core;
using cop::protocol::RecordKind;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS parties (
            id TEXT PRIMARY KEY,
            signing_public BLOB NOT NULL,
            encryption_public BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS transactions (
            doc_id TEXT PRIMARY KEY,
            kind INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            record BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS disclosures (
            share_id TEXT PRIMARY KEY,
            doc_id TEXT NOT NULL,
            section TEXT,
            from_id TEXT NOT NULL,
            to_id TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            record BLOB NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_disclosures_doc ON disclosures(doc_id);
        CREATE INDEX IF NOT EXISTS idx_disclosures_doc_section ON disclosures(doc_id, section);
    )SQL";

    // Finalizes the statement on every exit path.
    struct Stmt {
        sqlite3_stmt* p{nullptr};
        ~Stmt() {
            if (p) sqlite3_finalize(p);
        }
    };

    [[nodiscard]] bool journal_mode_ok(const char* mode) noexcept {
        if (mode == nullptr || mode[0] == '\0' || std::strlen(mode) > 16) {
            return false;
        }
        for (const char* c = mode; *c != '\0'; ++c) {
            const bool alpha = (*c >= 'a' && *c <= 'z') || (*c >= 'A' && *c <= 'Z');
            if (!alpha) {
                return false;
            }
        }
        return true;
    }

    void bind_text(sqlite3_stmt* stmt, int idx, std::string_view s) noexcept {
        sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }

    void bind_blob(sqlite3_stmt* stmt, int idx, const void* data, std::size_t len) noexcept {
        sqlite3_bind_blob(stmt, idx, data, static_cast<int>(len), SQLITE_TRANSIENT);
    }

    Bytes column_bytes(sqlite3_stmt* stmt, int col) {
        const auto* data = static_cast<const u8*>(sqlite3_column_blob(stmt, col));
        const int len = sqlite3_column_bytes(stmt, col);
        if (data == nullptr || len <= 0) {
            return Bytes{};
        }
        return Bytes(data, data + len);
    }

    [[nodiscard]] Status db_error() noexcept {
        return make_status(StatusDomain::Store, StatusCode::Unknown);
    }
} // namespace

RecordStore::~RecordStore() {
    close();
}

Status RecordStore::open(const std::string& path) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    const char* p = path.empty() ? ":memory:" : path.c_str();
    int rc = sqlite3_open(p, &db_);
    if (rc != SQLITE_OK) {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return make_status(StatusDomain::Store, StatusCode::Io);
    }

    const char* journal_mode = std::getenv("COP_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    if (!journal_mode_ok(journal_mode)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    char* err_msg = nullptr;
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    rc = sqlite3_exec(db_, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        // In-memory databases refuse WAL; the default journal still works.
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }
    if (sqlite3_exec(db_, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr) != SQLITE_OK ||
        sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }

    rc = sqlite3_exec(db_, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }
    return ok_status();
}

void RecordStore::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool RecordStore::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

// ============================================================================
// Parties
// ============================================================================

Status RecordStore::put_party(const cop::identity::PartyKeys& keys) noexcept {
    if (!cop::identity::party_id_valid(keys.id)) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO parties (id, signing_public, encryption_public) VALUES (?, ?, ?) "
                      "ON CONFLICT(id) DO UPDATE SET signing_public = excluded.signing_public, "
                      "encryption_public = excluded.encryption_public";
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.p, nullptr) != SQLITE_OK) {
        return db_error();
    }
    bind_text(stmt.p, 1, keys.id);
    bind_blob(stmt.p, 2, keys.signing.b, sizeof(keys.signing.b));
    bind_blob(stmt.p, 3, keys.encryption.b, sizeof(keys.encryption.b));

    if (sqlite3_step(stmt.p) != SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }
    return ok_status();
}

Status RecordStore::get_public_keys(std::string_view party_id, cop::identity::PartyKeys* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    Stmt stmt;
    if (sqlite3_prepare_v2(db_, "SELECT signing_public, encryption_public FROM parties WHERE id = ?", -1, &stmt.p,
            nullptr) != SQLITE_OK) {
        return db_error();
    }
    bind_text(stmt.p, 1, party_id);

    const int rc = sqlite3_step(stmt.p);
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Identity, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }

    const Bytes signing = column_bytes(stmt.p, 0);
    const Bytes encryption = column_bytes(stmt.p, 1);
    cop::identity::PartyKeys keys{};
    if (signing.size() != sizeof(keys.signing.b) || encryption.size() != sizeof(keys.encryption.b)) {
        return make_status(StatusDomain::Store, StatusCode::Structural);
    }
    keys.id = std::string(party_id);
    std::memcpy(keys.signing.b, signing.data(), signing.size());
    std::memcpy(keys.encryption.b, encryption.data(), encryption.size());
    *out = std::move(keys);
    return ok_status();
}

Status RecordStore::list_parties(std::vector<std::string>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    Stmt stmt;
    if (sqlite3_prepare_v2(db_, "SELECT id FROM parties ORDER BY id", -1, &stmt.p, nullptr) != SQLITE_OK) {
        return db_error();
    }
    std::vector<std::string> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.p)) == SQLITE_ROW) {
        const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.p, 0));
        ids.emplace_back(id ? id : "");
    }
    if (rc != SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }
    *out = std::move(ids);
    return ok_status();
}

// ============================================================================
// Transactions
// ============================================================================

Status RecordStore::put_transaction_bytes(const std::string& doc_id,
    RecordKind kind,
    Timestamp created_at,
    const Bytes& record) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO transactions (doc_id, kind, created_at, record) VALUES (?, ?, ?, ?) "
                      "ON CONFLICT(doc_id) DO UPDATE SET kind = excluded.kind, "
                      "created_at = excluded.created_at, record = excluded.record";
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.p, nullptr) != SQLITE_OK) {
        return db_error();
    }
    bind_text(stmt.p, 1, doc_id);
    sqlite3_bind_int(stmt.p, 2, static_cast<int>(kind));
    sqlite3_bind_int64(stmt.p, 3, created_at);
    bind_blob(stmt.p, 4, record.data(), record.size());

    if (sqlite3_step(stmt.p) != SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }
    return ok_status();
}

Status RecordStore::get_transaction_bytes(std::string_view doc_id, RecordKind* kind, Bytes* record) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    Stmt stmt;
    if (sqlite3_prepare_v2(db_, "SELECT kind, record FROM transactions WHERE doc_id = ?", -1, &stmt.p, nullptr) !=
        SQLITE_OK) {
        return db_error();
    }
    bind_text(stmt.p, 1, doc_id);

    const int rc = sqlite3_step(stmt.p);
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }
    *kind = static_cast<RecordKind>(sqlite3_column_int(stmt.p, 0));
    if (record != nullptr) {
        *record = column_bytes(stmt.p, 1);
    }
    return ok_status();
}

Status RecordStore::put_transaction(const cop::protocol::ProtectedTransaction& tx) noexcept {
    Bytes bytes;
    const Status s = cop::protocol::encode_record(tx, &bytes);
    if (!is_ok(s)) {
        return s;
    }
    return put_transaction_bytes(tx.doc_id, RecordKind::Plain, tx.created_at, bytes);
}

Status RecordStore::put_transaction(const cop::protocol::LayeredProtectedTransaction& tx) noexcept {
    Bytes bytes;
    const Status s = cop::protocol::encode_record(tx, &bytes);
    if (!is_ok(s)) {
        return s;
    }
    return put_transaction_bytes(tx.doc_id, RecordKind::Layered, tx.created_at, bytes);
}

Status RecordStore::get_transaction_kind(std::string_view doc_id, RecordKind* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    return get_transaction_bytes(doc_id, out, nullptr);
}

Status RecordStore::get_transaction(std::string_view doc_id, cop::protocol::ProtectedTransaction* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    RecordKind kind{};
    Bytes bytes;
    const Status s = get_transaction_bytes(doc_id, &kind, &bytes);
    if (!is_ok(s)) {
        return s;
    }
    if (kind != RecordKind::Plain) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    return cop::protocol::decode_record(view_of(bytes), out);
}

Status RecordStore::get_transaction(std::string_view doc_id,
    cop::protocol::LayeredProtectedTransaction* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    RecordKind kind{};
    Bytes bytes;
    const Status s = get_transaction_bytes(doc_id, &kind, &bytes);
    if (!is_ok(s)) {
        return s;
    }
    if (kind != RecordKind::Layered) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }
    return cop::protocol::decode_record(view_of(bytes), out);
}

// ============================================================================
// Disclosures
// ============================================================================

Status RecordStore::put_share(const cop::protocol::ShareRecord& record) noexcept {
    Bytes bytes;
    const Status s = cop::protocol::encode_record(record, &bytes);
    if (!is_ok(s)) {
        return s;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO disclosures (share_id, doc_id, section, from_id, to_id, timestamp, record) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?)";
    Stmt stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.p, nullptr) != SQLITE_OK) {
        return db_error();
    }
    bind_text(stmt.p, 1, record.share_id);
    bind_text(stmt.p, 2, record.doc_id);
    if (record.section.has_value()) {
        bind_text(stmt.p, 3, *record.section);
    } else {
        sqlite3_bind_null(stmt.p, 3);
    }
    bind_text(stmt.p, 4, record.from_id);
    bind_text(stmt.p, 5, record.to_id);
    sqlite3_bind_int64(stmt.p, 6, record.timestamp);
    bind_blob(stmt.p, 7, bytes.data(), bytes.size());

    const int rc = sqlite3_step(stmt.p);
    if (rc == SQLITE_CONSTRAINT) {
        return make_status(StatusDomain::Store, StatusCode::Conflict);
    }
    if (rc != SQLITE_DONE) {
        return make_status(StatusDomain::Store, StatusCode::Io);
    }
    return ok_status();
}

Status RecordStore::list_shares(std::string_view doc_id,
    std::optional<std::string_view> section,
    std::vector<cop::protocol::ShareRecord>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Store, StatusCode::Invalid);
    }

    std::vector<Bytes> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }

        const char* sql = section.has_value()
            ? "SELECT record FROM disclosures WHERE doc_id = ? AND section = ? ORDER BY timestamp, share_id"
            : "SELECT record FROM disclosures WHERE doc_id = ? ORDER BY timestamp, share_id";
        Stmt stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt.p, nullptr) != SQLITE_OK) {
            return db_error();
        }
        bind_text(stmt.p, 1, doc_id);
        if (section.has_value()) {
            bind_text(stmt.p, 2, *section);
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.p)) == SQLITE_ROW) {
            rows.push_back(column_bytes(stmt.p, 0));
        }
        if (rc != SQLITE_DONE) {
            return make_status(StatusDomain::Store, StatusCode::Io);
        }
    }

    std::vector<cop::protocol::ShareRecord> records;
    records.reserve(rows.size());
    for (const Bytes& row : rows) {
        cop::protocol::ShareRecord r{};
        const Status s = cop::protocol::decode_record(view_of(row), &r);
        if (!is_ok(s)) {
            return s;
        }
        records.push_back(std::move(r));
    }
    *out = std::move(records);
    return ok_status();
}

} // namespace cop::store
