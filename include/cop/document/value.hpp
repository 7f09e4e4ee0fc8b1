#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "cop/core/types.hpp"

namespace cop::document {
    using u8 = cop::core::u8;
    using i64 = cop::core::i64;

    enum class Kind : u8 {
        Null = 0,
        Bool = 1,
        Int = 2,
        Float = 3,
        String = 4,
        Array = 5,
        Object = 6,
        Binary = 7, // no agreed text encoding; canonicalization rejects it
    };

    struct Member;
    class Value;

    using Array = std::vector<Value>;
    using Object = std::vector<Member>;

    struct BinaryBlob {
        cop::core::Bytes bytes;
    };

    class Value {
    public:
        Value() noexcept = default;
        Value(std::nullptr_t) noexcept {}
        Value(bool b) : v_(b) {}
        Value(int i) : v_(static_cast<i64>(i)) {}
        Value(i64 i) : v_(i) {}
        Value(double d) : v_(d) {}
        Value(const char* s) : v_(std::string(s)) {}
        Value(std::string s) : v_(std::move(s)) {}
        Value(Array a) : v_(std::move(a)) {}
        Value(Object o);
        Value(BinaryBlob b) : v_(std::move(b)) {}

        [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }

        [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::Null; }
        [[nodiscard]] bool is_object() const noexcept { return kind() == Kind::Object; }
        [[nodiscard]] bool is_array() const noexcept { return kind() == Kind::Array; }
        [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::String; }
        [[nodiscard]] bool is_int() const noexcept { return kind() == Kind::Int; }

        // Typed accessors; callers check kind() first.
        [[nodiscard]] bool as_bool() const { return std::get<bool>(v_); }
        [[nodiscard]] i64 as_int() const { return std::get<i64>(v_); }
        [[nodiscard]] double as_float() const { return std::get<double>(v_); }
        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(v_); }
        [[nodiscard]] const Array& as_array() const { return std::get<Array>(v_); }
        [[nodiscard]] Array& as_array() { return std::get<Array>(v_); }
        [[nodiscard]] const Object& as_object() const;
        [[nodiscard]] Object& as_object();
        [[nodiscard]] const BinaryBlob& as_binary() const { return std::get<BinaryBlob>(v_); }

        // Object helpers. find() returns the first member with the key, or nullptr.
        [[nodiscard]] const Value* find(std::string_view key) const noexcept;
        // Appends a member; on a non-object value this turns it into an empty object first.
        Value& set(std::string key, Value v);

    private:
        std::variant<std::monostate, bool, i64, double, std::string, Array, Object, BinaryBlob> v_;
    };

    struct Member {
        std::string key;
        Value value;
    };

    // Semantic equality: object member order is ignored, Int never equals Float.
    [[nodiscard]] bool operator==(const Value& a, const Value& b) noexcept;
    [[nodiscard]] inline bool operator!=(const Value& a, const Value& b) noexcept { return !(a == b); }

    [[nodiscard]] inline Value make_object() { return Value(Object{}); }
    [[nodiscard]] inline Value make_array() { return Value(Array{}); }

} // namespace cop::document
