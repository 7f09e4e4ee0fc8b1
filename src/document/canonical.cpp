#include "cop/document/canonical.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cop/security/crypto.hpp"

namespace cop::document {
    using namespace cop::core;

    namespace {
        [[nodiscard]] Status structural() noexcept {
            return make_status(StatusDomain::Document, StatusCode::Structural);
        }

        // Value -> nlohmann. nlohmann::json keeps object keys in a std::map, which
        // gives the unsigned byte order; nlohmann::ordered_json keeps stored order.
        template <typename Json>
        [[nodiscard]] Status to_json(const Value& v, u32 depth, Json* out) {
            if (depth > kMaxDepth) {
                return structural();
            }
            switch (v.kind()) {
                case Kind::Null: *out = nullptr; return ok_status();
                case Kind::Bool: *out = v.as_bool(); return ok_status();
                case Kind::Int: *out = v.as_int(); return ok_status();
                case Kind::Float: {
                    double d = v.as_float();
                    if (!std::isfinite(d)) {
                        return structural();
                    }
                    if (d == 0.0) {
                        d = 0.0; // folds -0.0
                    }
                    *out = d;
                    return ok_status();
                }
                case Kind::String: *out = v.as_string(); return ok_status();
                case Kind::Binary: return structural();
                case Kind::Array: {
                    *out = Json::array();
                    for (const Value& item : v.as_array()) {
                        Json child;
                        const Status s = to_json(item, depth + 1, &child);
                        if (!is_ok(s)) {
                            return s;
                        }
                        out->push_back(std::move(child));
                    }
                    return ok_status();
                }
                case Kind::Object: {
                    *out = Json::object();
                    for (const Member& m : v.as_object()) {
                        Json child;
                        const Status s = to_json(m.value, depth + 1, &child);
                        if (!is_ok(s)) {
                            return s;
                        }
                        if (!out->emplace(m.key, std::move(child)).second) {
                            return structural();
                        }
                    }
                    return ok_status();
                }
            }
            return structural();
        }

        // Invalid UTF-8 makes dump() throw type_error 316 under the strict handler.
        template <typename Json>
        [[nodiscard]] Status dump(const Json& j, int indent, std::string* out) {
            try {
                *out = j.dump(indent, ' ', false, Json::error_handler_t::strict);
            } catch (const typename Json::type_error&) {
                return structural();
            }
            return ok_status();
        }

        // Builds a Value straight from the SAX stream so member order, the
        // Int/Float split and duplicate keys are all visible.
        class ValueBuilder : public nlohmann::json_sax<nlohmann::json> {
        public:
            bool null() override { return put(Value(nullptr)); }
            bool boolean(bool b) override { return put(Value(b)); }
            bool number_integer(number_integer_t i) override { return put(Value(static_cast<i64>(i))); }

            bool number_unsigned(number_unsigned_t u) override {
                if (u > static_cast<number_unsigned_t>(std::numeric_limits<i64>::max())) {
                    return false;
                }
                return put(Value(static_cast<i64>(u)));
            }

            // nlohmann falls back to a double for integers beyond 64 bits; the
            // lexeme tells them apart from real floats.
            bool number_float(number_float_t d, const string_t& lexeme) override {
                if (lexeme.find_first_of(".eE") == string_t::npos || !std::isfinite(d)) {
                    return false;
                }
                return put(Value(static_cast<double>(d)));
            }

            bool string(string_t& s) override { return put(Value(std::move(s))); }
            bool binary(binary_t&) override { return false; }

            bool start_object(std::size_t) override { return open(make_object()); }
            bool start_array(std::size_t) override { return open(make_array()); }
            bool end_object() override { return close(); }
            bool end_array() override { return close(); }

            bool key(string_t& k) override {
                Frame& f = frames_.back();
                for (const Member& m : f.value.as_object()) {
                    if (m.key == k) {
                        return false;
                    }
                }
                f.key = std::move(k);
                return true;
            }

            bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception&) override {
                return false;
            }

            [[nodiscard]] Value take() { return std::move(root_); }

        private:
            struct Frame {
                Value value;
                std::string key;
            };

            [[nodiscard]] bool open(Value container) {
                if (frames_.size() > kMaxDepth) {
                    return false;
                }
                frames_.push_back(Frame{std::move(container), {}});
                return true;
            }

            [[nodiscard]] bool close() {
                Value done = std::move(frames_.back().value);
                frames_.pop_back();
                return put(std::move(done));
            }

            [[nodiscard]] bool put(Value v) {
                if (frames_.empty()) {
                    root_ = std::move(v);
                    return true;
                }
                if (frames_.size() > kMaxDepth) {
                    return false;
                }
                Frame& f = frames_.back();
                if (f.value.is_array()) {
                    f.value.as_array().push_back(std::move(v));
                } else {
                    f.value.as_object().push_back(Member{std::move(f.key), std::move(v)});
                }
                return true;
            }

            std::vector<Frame> frames_;
            Value root_;
        };
    } // namespace

    Status canonicalize(const Value& v, Bytes* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        nlohmann::json j;
        Status s = to_json(v, 0, &j);
        if (!is_ok(s)) {
            return s;
        }
        std::string text;
        s = dump(j, -1, &text);
        if (!is_ok(s)) {
            return s;
        }
        out->assign(text.begin(), text.end());
        // text holds the full plaintext of whatever is about to be encrypted
        cop::security::secure_zero(text.data(), text.size());
        return ok_status();
    }

    Status parse_json(BufferView in, Value* out) noexcept {
        if (out == nullptr || !buffer_ok(in)) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        const char* first = reinterpret_cast<const char*>(in.data);
        ValueBuilder builder;
        if (!nlohmann::json::sax_parse(first, first + in.len, &builder)) {
            return structural();
        }
        *out = builder.take();
        return ok_status();
    }

    Status to_pretty_json(const Value& v, std::string* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Document, StatusCode::Invalid);
        }
        nlohmann::ordered_json j;
        Status s = to_json(v, 0, &j);
        if (!is_ok(s)) {
            return s;
        }
        std::string text;
        s = dump(j, 2, &text);
        if (!is_ok(s)) {
            return s;
        }
        text.push_back('\n');
        *out = std::move(text);
        return ok_status();
    }
} // namespace cop::document
