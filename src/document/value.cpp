#include "cop/document/value.hpp"

#include <algorithm>

namespace cop::document {
    Value::Value(Object o) : v_(std::move(o)) {}

    const Object& Value::as_object() const {
        return std::get<Object>(v_);
    }

    Object& Value::as_object() {
        return std::get<Object>(v_);
    }

    const Value* Value::find(std::string_view key) const noexcept {
        if (kind() != Kind::Object) {
            return nullptr;
        }
        for (const Member& m : std::get<Object>(v_)) {
            if (m.key == key) {
                return &m.value;
            }
        }
        return nullptr;
    }

    Value& Value::set(std::string key, Value v) {
        if (kind() != Kind::Object) {
            v_ = Object{};
        }
        Object& obj = std::get<Object>(v_);
        obj.push_back(Member{std::move(key), std::move(v)});
        return obj.back().value;
    }

    namespace {
        [[nodiscard]] bool objects_equal(const Object& a, const Object& b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (const Member& ma : a) {
                const auto it = std::find_if(b.begin(), b.end(), [&](const Member& mb) { return mb.key == ma.key; });
                if (it == b.end() || !(ma.value == it->value)) {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    bool operator==(const Value& a, const Value& b) noexcept {
        if (a.kind() != b.kind()) {
            return false;
        }
        switch (a.kind()) {
            case Kind::Null: return true;
            case Kind::Bool: return a.as_bool() == b.as_bool();
            case Kind::Int: return a.as_int() == b.as_int();
            case Kind::Float: return a.as_float() == b.as_float();
            case Kind::String: return a.as_string() == b.as_string();
            case Kind::Array: {
                const Array& x = a.as_array();
                const Array& y = b.as_array();
                if (x.size() != y.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < x.size(); ++i) {
                    if (!(x[i] == y[i])) {
                        return false;
                    }
                }
                return true;
            }
            case Kind::Object: return objects_equal(a.as_object(), b.as_object());
            case Kind::Binary: return a.as_binary().bytes == b.as_binary().bytes;
        }
        return false;
    }
} // namespace cop::document
