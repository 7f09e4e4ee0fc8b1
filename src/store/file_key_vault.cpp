#include "cop/store/file_key_vault.hpp"

#include <string>
#include <utility>

#include "cop/core/encoding.hpp"
#include "cop/document/canonical.hpp"
#include "cop/document/value.hpp"
#include "cop/security/crypto.hpp"
#include "cop/store/file_io.hpp"

namespace cop::store {
    using namespace cop::core;
    using cop::document::Value;
    using cop::identity::PartySecrets;

    namespace {
        constexpr char kSuffix[] = ".json";
        constexpr u32 kDirMode = 0700;
        constexpr u32 kFileMode = 0600;

        Value key_pair_value(const u8* priv, const u8* pub) {
            Value v = cop::document::make_object();
            v.set("private", base64url_encode(BufferView{priv, 32}));
            v.set("public", base64url_encode(BufferView{pub, 32}));
            return v;
        }

        Status read_key_pair(const Value& file, std::string_view name, u8* priv, u8* pub) noexcept {
            const Value* pair = file.find(name);
            if (pair == nullptr || !pair->is_object()) {
                return make_status(StatusDomain::Store, StatusCode::Structural);
            }
            const Value* p = pair->find("private");
            const Value* q = pair->find("public");
            if (p == nullptr || q == nullptr || !p->is_string() || !q->is_string()) {
                return make_status(StatusDomain::Store, StatusCode::Structural);
            }
            if (!is_ok(base64url_decode_exact(p->as_string(), BufferMut{priv, 32})) ||
                !is_ok(base64url_decode_exact(q->as_string(), BufferMut{pub, 32}))) {
                return make_status(StatusDomain::Store, StatusCode::Structural);
            }
            return ok_status();
        }
    } // namespace

    FileKeyVault::FileKeyVault(std::string dir) : dir_(std::move(dir)) {}

    std::string FileKeyVault::path_for(std::string_view party_id) const {
        std::string p = dir_;
        p += '/';
        p += party_id;
        p += kSuffix;
        return p;
    }

    Status FileKeyVault::save(const PartySecrets& secrets, bool overwrite) noexcept {
        if (!cop::identity::party_id_valid(secrets.id)) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        Status s = create_directories(dir_, kDirMode);
        if (!is_ok(s)) {
            return s;
        }

        Value file = cop::document::make_object();
        file.set("id", secrets.id);
        file.set("signing", key_pair_value(secrets.signing.priv.b, secrets.signing.pub.b));
        file.set("encryption", key_pair_value(secrets.encryption.priv.b, secrets.encryption.pub.b));

        std::string text;
        s = cop::document::to_pretty_json(file, &text);
        if (!is_ok(s)) {
            return s;
        }
        s = write_file(path_for(secrets.id), view_of(text), kFileMode, !overwrite);
        cop::security::secure_zero(text.data(), text.size());
        return s;
    }

    Status FileKeyVault::load(std::string_view party_id, PartySecrets* out) const noexcept {
        if (out == nullptr || !cop::identity::party_id_valid(party_id)) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        cop::security::ScrubbedBytes raw;
        Status s = read_file(path_for(party_id), &raw.v);
        if (s.code == StatusCode::NotFound) {
            return make_status(StatusDomain::Identity, StatusCode::NotFound);
        }
        if (!is_ok(s)) {
            return s;
        }

        Value file;
        s = cop::document::parse_json(view_of(raw.v), &file);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Store, StatusCode::Structural);
        }
        const Value* id = file.find("id");
        if (id == nullptr || !id->is_string() || id->as_string() != party_id) {
            return make_status(StatusDomain::Store, StatusCode::Structural);
        }

        PartySecrets p{};
        p.id = std::string(party_id);
        s = read_key_pair(file, "signing", p.signing.priv.b, p.signing.pub.b);
        if (is_ok(s)) {
            s = read_key_pair(file, "encryption", p.encryption.priv.b, p.encryption.pub.b);
        }
        // The stored public halves must be the ones the private keys imply.
        cop::security::SigningPublicKey sig_pub{};
        cop::security::EncPublicKey enc_pub{};
        if (is_ok(s)) {
            s = cop::security::signing_public_from_private(p.signing.priv, &sig_pub);
        }
        if (is_ok(s)) {
            s = cop::security::enc_public_from_private(p.encryption.priv, &enc_pub);
        }
        if (is_ok(s) && (!cop::security::key_equal(sig_pub, p.signing.pub) ||
                            !cop::security::key_equal(enc_pub, p.encryption.pub))) {
            s = make_status(StatusDomain::Store, StatusCode::Structural);
        }
        if (!is_ok(s)) {
            cop::identity::scrub(&p);
            return s;
        }

        *out = p;
        cop::identity::scrub(&p);
        return ok_status();
    }

    Status FileKeyVault::list_parties(std::vector<std::string>* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        std::vector<std::string> stems;
        const Status s = list_files(dir_, kSuffix, &stems);
        if (!is_ok(s)) {
            return s;
        }
        std::vector<std::string> ids;
        for (std::string& stem : stems) {
            if (cop::identity::party_id_valid(stem)) {
                ids.push_back(std::move(stem));
            }
        }
        *out = std::move(ids);
        return ok_status();
    }

    Status FileKeyVault::get_signing_key(std::string_view party_id, cop::security::SigningPrivateKey* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        PartySecrets p{};
        const Status s = load(party_id, &p);
        if (!is_ok(s)) {
            return s;
        }
        *out = p.signing.priv;
        cop::identity::scrub(&p);
        return ok_status();
    }

    Status FileKeyVault::get_encryption_key(std::string_view party_id, cop::security::EncPrivateKey* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        PartySecrets p{};
        const Status s = load(party_id, &p);
        if (!is_ok(s)) {
            return s;
        }
        *out = p.encryption.priv;
        cop::identity::scrub(&p);
        return ok_status();
    }
} // namespace cop::store
