#include "cop/cli/app.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cop/cli/commands.hpp"
#include "cop/core/encoding.hpp"
#include "cop/document/canonical.hpp"
#include "cop/identity/vault.hpp"
#include "cop/protocol/layered.hpp"
#include "cop/protocol/records.hpp"
#include "cop/protocol/transaction.hpp"
#include "cop/security/crypto.hpp"
#include "cop/store/file_io.hpp"
#include "cop/store/file_key_vault.hpp"
#include "cop/store/record_store.hpp"

namespace cop::cli {
    using cop::core::Bytes;
    using cop::core::is_ok;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;
    using cop::core::Timestamp;
    using cop::document::Value;
    using cop::protocol::LayeredProtectedTransaction;
    using cop::protocol::ProtectedTransaction;
    using cop::protocol::RecordKind;
    using cop::protocol::ShareRecord;

    namespace {
        constexpr u32 kDirMode = 0700;
        constexpr u32 kRecordMode = 0644;
        constexpr u32 kPlaintextMode = 0600;

        constexpr OptionSpec kGlobalOptions[] = {
            {OptionId::KeysDir, OptionType::String, "keys-dir", 'k'},
            {OptionId::Db, OptionType::String, "db", 'd'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        };

        constexpr OptionSpec kKeygenOptions[] = {
            {OptionId::Force, OptionType::Flag, "force", 'f'},
        };
        constexpr OptionSpec kProtectOptions[] = {
            {OptionId::Layers, OptionType::String, "layers", 'l'},
            {OptionId::At, OptionType::I64, "at", '\0'},
        };
        constexpr OptionSpec kCheckOptions[] = {
            {OptionId::Shares, OptionType::String, "shares", 's'},
        };
        constexpr OptionSpec kUnprotectOptions[] = {
            {OptionId::Share, OptionType::String, "share", 's'},
            {OptionId::Section, OptionType::String, "section", '\0'},
        };
        constexpr OptionSpec kShareOptions[] = {
            {OptionId::Sections, OptionType::String, "sections", '\0'},
            {OptionId::Via, OptionType::String, "via", '\0'},
            {OptionId::At, OptionType::I64, "at", '\0'},
        };
        constexpr OptionSpec kDisclosuresOptions[] = {
            {OptionId::Section, OptionType::String, "section", '\0'},
        };

        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help", 0},
            {CommandId::Keygen, "keygen", 1},
            {CommandId::Protect, "protect", 4},
            {CommandId::Countersign, "countersign", 4},
            {CommandId::Check, "check", 1},
            {CommandId::Unprotect, "unprotect", 3},
            {CommandId::Share, "share", 4},
            {CommandId::Disclosures, "disclosures", 1},
        };

        template <std::size_t N>
        constexpr u32 count_of(const OptionSpec (&)[N]) noexcept {
            return static_cast<u32>(N);
        }

        const OptionSpec* options_for(CommandId id, u32* count) noexcept {
            switch (id) {
                case CommandId::Keygen:
                    *count = count_of(kKeygenOptions);
                    return kKeygenOptions;
                case CommandId::Protect:
                    *count = count_of(kProtectOptions);
                    return kProtectOptions;
                case CommandId::Check:
                    *count = count_of(kCheckOptions);
                    return kCheckOptions;
                case CommandId::Unprotect:
                    *count = count_of(kUnprotectOptions);
                    return kUnprotectOptions;
                case CommandId::Share:
                    *count = count_of(kShareOptions);
                    return kShareOptions;
                case CommandId::Disclosures:
                    *count = count_of(kDisclosuresOptions);
                    return kDisclosuresOptions;
                case CommandId::None:
                case CommandId::Help:
                case CommandId::Countersign:
                    break;
            }
            *count = 0;
            return nullptr;
        }

        void print_usage(std::FILE* f) noexcept {
            std::fprintf(f, "usage: cop [--keys-dir D] [--db P] <command> [args...]\n");
            std::fprintf(f, "Commands:\n");
            std::fprintf(f, "  keygen <party> [--force]\n");
            std::fprintf(f, "  protect <doc.json> <seller> <buyer> <out.json> [--layers plan.json] [--at T]\n");
            std::fprintf(f, "  countersign <in.json> <seller> <buyer> <out.json>\n");
            std::fprintf(f, "  check <in.json> [--shares shares.json]\n");
            std::fprintf(f, "  unprotect <in.json> <party> <out.json> [--share s.json] [--section name]\n");
            std::fprintf(f, "  share <in.json> <from> <to> <out.json> [--sections a,b] [--via s.json] [--at T]\n");
            std::fprintf(f, "  disclosures <doc_id> [--section name]\n");
            std::fprintf(f, "  help\n");
        }

        void print_status_error(const char* context, Status s) noexcept {
            std::fprintf(stderr, "error: %s: %s (%s)\n",
                context,
                cop::core::status_code_name(s.code),
                cop::core::status_domain_name(s.domain));
            if (s.code == StatusCode::Io && s.aux != 0) {
                std::fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
            }
        }

        // Private keys for the duration of one command.
        struct SecretsGuard {
            cop::identity::PartySecrets p{};
            SecretsGuard() = default;
            SecretsGuard(const SecretsGuard&) = delete;
            SecretsGuard& operator=(const SecretsGuard&) = delete;
            ~SecretsGuard() { cop::identity::scrub(&p); }
        };

        struct Session {
            Session(const CliConfig& c, const Invocation& inv)
                : cfg(c), vault(c.keys_dir), opts(inv.options), pos(inv.pos) {}

            CliConfig cfg;
            cop::store::FileKeyVault vault;
            cop::store::RecordStore store;
            const ParsedOptions& opts;
            const char* const* pos;

            [[nodiscard]] const char* option_str(OptionId id) const noexcept {
                const ParsedOption* o = find_option(opts, id);
                return o != nullptr ? o->value.str : nullptr;
            }
        };

        Status open_store(Session* session) noexcept {
            const std::string& path = session->cfg.db_path;
            if (path != ":memory:") {
                const std::size_t slash = path.find_last_of('/');
                if (slash != std::string::npos && slash > 0) {
                    const Status s = cop::store::create_directories(path.substr(0, slash), kDirMode);
                    if (!is_ok(s)) {
                        return s;
                    }
                }
            }
            return session->store.open(path);
        }

        Timestamp timestamp_of(const Session& session) noexcept {
            if (const ParsedOption* at = find_option(session.opts, OptionId::At)) {
                return at->value.i64v;
            }
            return static_cast<Timestamp>(std::time(nullptr));
        }

        Status load_json(const char* path, Value* out) noexcept {
            Bytes raw;
            const Status s = cop::store::read_file(path, &raw);
            if (!is_ok(s)) {
                return s;
            }
            return cop::document::parse_json(cop::core::view_of(raw), out);
        }

        Status load_shares(const char* path, std::vector<ShareRecord>* out) noexcept {
            out->clear();
            if (path == nullptr) {
                return ok_status();
            }
            Bytes raw;
            const Status s = cop::store::read_file(path, &raw);
            if (!is_ok(s)) {
                return s;
            }
            return cop::protocol::decode_share_list(cop::core::view_of(raw), out);
        }

        struct LoadedTransaction {
            RecordKind kind{RecordKind::Plain};
            ProtectedTransaction plain;
            LayeredProtectedTransaction layered;
        };

        Status load_transaction(const char* path, LoadedTransaction* out) noexcept {
            Value v;
            Status s = load_json(path, &v);
            if (!is_ok(s)) {
                return s;
            }
            s = cop::protocol::record_kind_of(v, &out->kind);
            if (!is_ok(s)) {
                return s;
            }
            switch (out->kind) {
                case RecordKind::Plain:
                    return cop::protocol::from_value(v, &out->plain);
                case RecordKind::Layered:
                    return cop::protocol::from_value(v, &out->layered);
                case RecordKind::Share:
                    break;
            }
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        template <typename Record>
        Status save_record(const char* path, const Record& record) noexcept {
            Bytes bytes;
            const Status s = cop::protocol::encode_record(record, &bytes);
            if (!is_ok(s)) {
                return s;
            }
            return cop::store::write_file(path, cop::core::view_of(bytes), kRecordMode, false);
        }

        Status save_plaintext(const char* path, const Value& doc) noexcept {
            std::string text;
            Status s = cop::document::to_pretty_json(doc, &text);
            if (is_ok(s)) {
                text.push_back('\n');
                s = cop::store::write_file(path, cop::core::view_of(text), kPlaintextMode, false);
            }
            cop::security::secure_zero(text.data(), text.size());
            return s;
        }

        const ShareRecord* pick_share(const std::vector<ShareRecord>& shares,
            std::string_view party_id,
            std::string_view doc_id,
            std::optional<std::string_view> section) noexcept {
            for (const ShareRecord& r : shares) {
                if (r.to_id != party_id || r.doc_id != doc_id) {
                    continue;
                }
                const bool same_scope = section.has_value()
                    ? (r.section.has_value() && *r.section == *section)
                    : !r.section.has_value();
                if (same_scope) {
                    return &r;
                }
            }
            return nullptr;
        }

        std::vector<std::string> split_list(std::string_view csv) {
            std::vector<std::string> out;
            std::size_t start = 0;
            for (;;) {
                const std::size_t comma = csv.find(',', start);
                if (comma == std::string_view::npos) {
                    out.emplace_back(csv.substr(start));
                    return out;
                }
                out.emplace_back(csv.substr(start, comma - start));
                start = comma + 1;
            }
        }

        Status handle_keygen(Session* session) noexcept {
            const char* party = session->pos[0];
            SecretsGuard secrets;
            Status s = cop::identity::generate_party(party, &secrets.p);
            if (!is_ok(s)) {
                return s;
            }
            s = session->vault.save(secrets.p, find_option(session->opts, OptionId::Force) != nullptr);
            if (!is_ok(s)) {
                return s;
            }
            const cop::identity::PartyKeys keys = cop::identity::public_keys_of(secrets.p);
            s = session->store.put_party(keys);
            if (!is_ok(s)) {
                return s;
            }
            std::printf("%s\n", keys.id.c_str());
            std::printf("  signing:    %s\n", cop::core::base64url_encode({keys.signing.b, 32}).c_str());
            std::printf("  encryption: %s\n", cop::core::base64url_encode({keys.encryption.b, 32}).c_str());
            std::fprintf(stderr, "info: key file %s\n", session->vault.path_for(party).c_str());
            return ok_status();
        }

        Status handle_protect(Session* session) noexcept {
            const char* doc_path = session->pos[0];
            const std::string_view seller = session->pos[1];
            const std::string_view buyer = session->pos[2];
            const char* out_path = session->pos[3];

            Value doc;
            Status s = load_json(doc_path, &doc);
            if (!is_ok(s)) {
                return s;
            }
            SecretsGuard seller_keys;
            s = session->vault.load(seller, &seller_keys.p);
            if (!is_ok(s)) {
                return s;
            }
            cop::identity::PartyKeys buyer_keys;
            s = session->store.get_public_keys(buyer, &buyer_keys);
            if (!is_ok(s)) {
                return s;
            }
            const Timestamp now = timestamp_of(*session);

            if (const char* layers_path = session->option_str(OptionId::Layers)) {
                Value plan_value;
                s = load_json(layers_path, &plan_value);
                if (!is_ok(s)) {
                    return s;
                }
                cop::protocol::LayerPlan plan;
                s = cop::protocol::from_value(plan_value, &plan);
                if (!is_ok(s)) {
                    return s;
                }
                LayeredProtectedTransaction tx;
                s = cop::protocol::protect_with_layers(doc, plan, seller, seller_keys.p.signing.priv,
                    seller_keys.p.encryption.priv, buyer, buyer_keys.encryption, now, &tx);
                if (is_ok(s)) s = save_record(out_path, tx);
                if (is_ok(s)) s = session->store.put_transaction(tx);
                if (is_ok(s)) std::printf("%s\n", tx.doc_id.c_str());
                return s;
            }

            ProtectedTransaction tx;
            s = cop::protocol::protect(doc, seller, seller_keys.p.signing.priv, seller_keys.p.encryption.priv,
                buyer, buyer_keys.encryption, now, &tx);
            if (is_ok(s)) s = save_record(out_path, tx);
            if (is_ok(s)) s = session->store.put_transaction(tx);
            if (is_ok(s)) std::printf("%s\n", tx.doc_id.c_str());
            return s;
        }

        Status handle_countersign(Session* session) noexcept {
            const std::string_view seller = session->pos[1];
            const std::string_view buyer = session->pos[2];
            const char* out_path = session->pos[3];

            LoadedTransaction in;
            Status s = load_transaction(session->pos[0], &in);
            if (!is_ok(s)) {
                return s;
            }
            const std::string& recorded_seller =
                in.kind == RecordKind::Plain ? in.plain.seller_id : in.layered.seller_id;
            if (recorded_seller != seller) {
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            cop::identity::PartyKeys seller_keys;
            s = session->store.get_public_keys(seller, &seller_keys);
            if (!is_ok(s)) {
                return s;
            }
            SecretsGuard buyer_keys;
            s = session->vault.load(buyer, &buyer_keys.p);
            if (!is_ok(s)) {
                return s;
            }

            if (in.kind == RecordKind::Layered) {
                LayeredProtectedTransaction out;
                s = cop::protocol::counter_sign_layered(in.layered, buyer, buyer_keys.p.signing.priv,
                    buyer_keys.p.encryption.priv, seller_keys.signing, &out);
                if (is_ok(s)) s = save_record(out_path, out);
                if (is_ok(s)) s = session->store.put_transaction(out);
                return s;
            }
            ProtectedTransaction out;
            s = cop::protocol::counter_sign(in.plain, buyer, buyer_keys.p.signing.priv,
                buyer_keys.p.encryption.priv, seller_keys.signing, &out);
            if (is_ok(s)) s = save_record(out_path, out);
            if (is_ok(s)) s = session->store.put_transaction(out);
            return s;
        }

        const char* verdict(bool ok) noexcept {
            return ok ? "ok" : "FAILED";
        }

        Status handle_check(Session* session) noexcept {
            LoadedTransaction in;
            Status s = load_transaction(session->pos[0], &in);
            if (!is_ok(s)) {
                return s;
            }
            std::vector<ShareRecord> shares;
            s = load_shares(session->option_str(OptionId::Shares), &shares);
            if (!is_ok(s)) {
                return s;
            }

            cop::protocol::VerifyReport report;
            if (in.kind == RecordKind::Layered) {
                s = cop::protocol::verify_layered(in.layered, session->store, &shares, &report);
            } else {
                s = cop::protocol::verify(in.plain, session->store, &shares, &report);
            }
            if (!is_ok(s)) {
                return s;
            }

            std::printf("seller signature: %s\n", verdict(report.seller_ok));
            std::printf("buyer signature:  %s\n", report.buyer_present ? verdict(report.buyer_ok) : "absent");
            if (in.kind == RecordKind::Layered) {
                std::printf("aggregate hash:   %s\n", verdict(report.aggregate_ok));
            }
            bool all_ok = report.seller_ok && report.aggregate_ok && (!report.buyer_present || report.buyer_ok);
            for (const cop::protocol::ShareCheck& c : report.shares) {
                std::printf("share %s from %s: %s", c.share_id.c_str(), c.from_id.c_str(), verdict(c.valid));
                if (c.layer_hash_ok.has_value()) {
                    std::printf(" (layer hash %s)", verdict(*c.layer_hash_ok));
                    all_ok = all_ok && *c.layer_hash_ok;
                }
                std::printf("\n");
                all_ok = all_ok && c.valid;
            }
            if (!all_ok) {
                return make_status(StatusDomain::Cli, StatusCode::SignatureInvalid);
            }
            return ok_status();
        }

        Status unprotect_all_sections(Session* session,
            const LayeredProtectedTransaction& tx,
            std::string_view party,
            const cop::security::EncPrivateKey& enc,
            const std::vector<ShareRecord>& shares,
            Value* out) noexcept {
            Value merged = cop::document::make_object();
            u32 opened = 0;
            for (const auto& entry : tx.sections) {
                const std::string& name = entry.first;
                const ShareRecord* share = pick_share(shares, party, tx.doc_id, std::string_view(name));
                Value section;
                const Status s = cop::protocol::unprotect_layer(tx, party, name, enc, share, &session->store, &section);
                if (s.code == StatusCode::AccessDenied) {
                    continue;
                }
                if (!is_ok(s)) {
                    return s;
                }
                for (cop::document::Member& m : section.as_object()) {
                    merged.set(std::move(m.key), std::move(m.value));
                }
                ++opened;
                std::fprintf(stderr, "info: opened section %s\n", name.c_str());
            }
            if (opened == 0) {
                return make_status(StatusDomain::Protocol, StatusCode::AccessDenied);
            }
            *out = std::move(merged);
            return ok_status();
        }

        Status handle_unprotect(Session* session) noexcept {
            const std::string_view party = session->pos[1];
            const char* out_path = session->pos[2];

            LoadedTransaction in;
            Status s = load_transaction(session->pos[0], &in);
            if (!is_ok(s)) {
                return s;
            }
            std::vector<ShareRecord> shares;
            s = load_shares(session->option_str(OptionId::Share), &shares);
            if (!is_ok(s)) {
                return s;
            }
            SecretsGuard keys;
            s = session->vault.load(party, &keys.p);
            if (!is_ok(s)) {
                return s;
            }
            const char* section = session->option_str(OptionId::Section);

            Value doc;
            if (in.kind == RecordKind::Plain) {
                if (section != nullptr) {
                    return make_status(StatusDomain::Cli, StatusCode::Invalid);
                }
                const ShareRecord* share = pick_share(shares, party, in.plain.doc_id, std::nullopt);
                s = cop::protocol::unprotect(in.plain, party, keys.p.encryption.priv, share, &session->store, &doc);
            } else if (section != nullptr) {
                const ShareRecord* share = pick_share(shares, party, in.layered.doc_id, std::string_view(section));
                s = cop::protocol::unprotect_layer(in.layered, party, section, keys.p.encryption.priv, share,
                    &session->store, &doc);
            } else {
                s = unprotect_all_sections(session, in.layered, party, keys.p.encryption.priv, shares, &doc);
            }
            if (!is_ok(s)) {
                return s;
            }
            return save_plaintext(out_path, doc);
        }

        Status handle_share(Session* session) noexcept {
            const std::string_view from = session->pos[1];
            const std::string_view to = session->pos[2];
            const char* out_path = session->pos[3];

            LoadedTransaction in;
            Status s = load_transaction(session->pos[0], &in);
            if (!is_ok(s)) {
                return s;
            }
            std::vector<ShareRecord> vias;
            s = load_shares(session->option_str(OptionId::Via), &vias);
            if (!is_ok(s)) {
                return s;
            }
            SecretsGuard discloser;
            s = session->vault.load(from, &discloser.p);
            if (!is_ok(s)) {
                return s;
            }
            cop::identity::PartyKeys recipient;
            s = session->store.get_public_keys(to, &recipient);
            if (!is_ok(s)) {
                return s;
            }
            const Timestamp now = timestamp_of(*session);
            const char* sections = session->option_str(OptionId::Sections);

            std::vector<ShareRecord> records;
            if (in.kind == RecordKind::Plain) {
                if (sections != nullptr) {
                    return make_status(StatusDomain::Cli, StatusCode::Invalid);
                }
                const ShareRecord* via = pick_share(vias, from, in.plain.doc_id, std::nullopt);
                ShareRecord record;
                s = cop::protocol::create_share_record(in.plain, from, discloser.p.encryption.priv,
                    discloser.p.signing.priv, to, recipient.encryption, via, &session->store, now, &record);
                if (!is_ok(s)) {
                    return s;
                }
                records.push_back(std::move(record));
            } else {
                std::vector<std::string> names;
                if (sections != nullptr) {
                    names = split_list(sections);
                } else {
                    for (const auto& entry : in.layered.sections) {
                        names.push_back(entry.first);
                    }
                }
                s = cop::protocol::create_layer_share_records(in.layered, from, discloser.p.encryption.priv,
                    discloser.p.signing.priv, to, recipient.encryption, names, vias.empty() ? nullptr : &vias,
                    &session->store, now, &records);
                if (!is_ok(s)) {
                    return s;
                }
            }

            Bytes bytes;
            s = cop::protocol::encode_share_list(records, &bytes);
            if (is_ok(s)) {
                s = cop::store::write_file(out_path, cop::core::view_of(bytes), kRecordMode, false);
            }
            if (!is_ok(s)) {
                return s;
            }
            for (const ShareRecord& r : records) {
                s = session->store.put_share(r);
                if (!is_ok(s)) {
                    return s;
                }
                std::printf("%s\n", r.share_id.c_str());
            }
            return ok_status();
        }

        Status handle_disclosures(Session* session) noexcept {
            std::optional<std::string_view> section;
            if (const char* name = session->option_str(OptionId::Section)) {
                section = name;
            }
            std::vector<ShareRecord> records;
            const Status s = session->store.list_shares(session->pos[0], section, &records);
            if (!is_ok(s)) {
                return s;
            }
            for (const ShareRecord& r : records) {
                std::printf("%s %lld %s -> %s %s\n",
                    r.share_id.c_str(),
                    static_cast<long long>(r.timestamp),
                    r.from_id.c_str(),
                    r.to_id.c_str(),
                    r.section.has_value() ? r.section->c_str() : "*");
            }
            return ok_status();
        }

        Status dispatch(CommandId id, Session* session) noexcept {
            if (id == CommandId::Help) {
                print_usage(stdout);
                return ok_status();
            }
            const Status s = open_store(session);
            if (!is_ok(s)) {
                return s;
            }
            switch (id) {
                case CommandId::Keygen: return handle_keygen(session);
                case CommandId::Protect: return handle_protect(session);
                case CommandId::Countersign: return handle_countersign(session);
                case CommandId::Check: return handle_check(session);
                case CommandId::Unprotect: return handle_unprotect(session);
                case CommandId::Share: return handle_share(session);
                case CommandId::Disclosures: return handle_disclosures(session);
                case CommandId::None:
                case CommandId::Help:
                    break;
            }
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        std::string env_or(const char* name, const std::string& fallback) {
            const char* v = std::getenv(name);
            return (v != nullptr && *v != '\0') ? std::string(v) : fallback;
        }
    } // namespace

    CliConfig config_from_env() {
        std::string home;
        const char* user_home = std::getenv("HOME");
        if (user_home != nullptr && *user_home != '\0') {
            home = std::string(user_home) + "/.cop";
        } else {
            home = "/tmp/cop";
        }
        home = env_or("COP_HOME", home);

        CliConfig cfg;
        cfg.keys_dir = env_or("COP_KEYS_DIR", home + "/keys");
        cfg.db_path = env_or("COP_DB_PATH", home + "/cop.db");
        return cfg;
    }

    Status parse_invocation(const CliArgs& args, Invocation* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        u32 used = 0;
        Status s = parse_options(args, kGlobalOptions, count_of(kGlobalOptions), &out->global, &used);
        if (!is_ok(s)) {
            return s;
        }
        const CliArgs rest{args.argv + used, args.argc - used};
        if (rest.argc == 0) {
            return ok_status();
        }

        out->command_name = rest.argv[0];
        u32 consumed = 0;
        s = parse_command(rest, kCommands, static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0])), &out->command, &consumed);
        if (!is_ok(s)) {
            return s;
        }

        u32 spec_count = 0;
        const OptionSpec* specs = options_for(out->command.id, &spec_count);
        s = collect_arguments(out->command.args, specs, spec_count, &out->options, out->pos, kMaxPositionals, &out->npos);
        if (!is_ok(s)) {
            return s;
        }
        if (out->npos != out->command.spec->positionals) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        return ok_status();
    }

    int run(const CliArgs& args, const CliConfig& defaults) noexcept {
        Invocation inv;
        const Status s = parse_invocation(args, &inv);
        if (!is_ok(s)) {
            if (inv.command.spec != nullptr) {
                std::fprintf(stderr, "error: %s: bad arguments\n", inv.command.spec->name);
            } else if (inv.command_name != nullptr) {
                std::fprintf(stderr, "error: unknown command '%s'\n", inv.command_name);
            } else {
                print_status_error("options", s);
            }
            print_usage(stderr);
            return EXIT_FAILURE;
        }

        CliConfig cfg = defaults;
        if (const ParsedOption* o = find_option(inv.global, OptionId::KeysDir)) {
            cfg.keys_dir = o->value.str;
        }
        if (const ParsedOption* o = find_option(inv.global, OptionId::Db)) {
            cfg.db_path = o->value.str;
        }

        if (inv.command.id == CommandId::None) {
            const bool help = find_option(inv.global, OptionId::Help) != nullptr;
            print_usage(help ? stdout : stderr);
            return help ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        Session session(cfg, inv);
        const Status d = dispatch(inv.command.id, &session);
        if (!is_ok(d)) {
            print_status_error(inv.command.spec->name, d);
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
} // namespace cop::cli
