/// @file value.hpp
/// @brief The document value type and the serializer hook used for equality.

#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// A value in the document tree.
///
/// Null, boolean, number (signed, unsigned, floating), string, array or
/// object. Object keys are unique and keep their insertion order when
/// serialized. `operator==` on two objects is order-sensitive; use
/// values_equal() for document equality.
using Value = nlohmann::ordered_json;

/// Produces the canonical text of a value. Two values whose canonical texts
/// are equal are treated as equal by the diff.
using Serializer = std::function<std::string(const Value&)>;

/// Compact `dump()` with object keys sorted: distinguishes `1` from `true`
/// and from `1.0`, and ignores member order.
inline auto default_serializer() -> Serializer {
    return [](const Value& v) { return nlohmann::json(v).dump(); };
}

/// Convert a value's JSON type to its string representation.
constexpr auto to_string_view(Value::value_t type) noexcept -> std::string_view {
    switch (type) {
        case Value::value_t::null:            return "null";
        case Value::value_t::boolean:         return "boolean";
        case Value::value_t::number_integer:  return "number_integer";
        case Value::value_t::number_unsigned: return "number_unsigned";
        case Value::value_t::number_float:    return "number_float";
        case Value::value_t::string:          return "string";
        case Value::value_t::array:           return "array";
        case Value::value_t::object:          return "object";
        case Value::value_t::binary:          return "binary";
        case Value::value_t::discarded:       return "discarded";
    }
    return "unknown";
}

/// Check if a value can hold children (array or object).
inline auto is_container(const Value& v) noexcept -> bool {
    return v.is_array() || v.is_object();
}

/// Structural equality as used by the `test` operation.
///
/// Scalars of different JSON kinds never compare equal (`1` is not `true`,
/// `"1"` is not `1`); integers and floats compare numerically. Member order
/// does not matter.
inline auto values_equal(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.is_object() && rhs.is_object()) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [key, value] : lhs.items()) {
            auto it = rhs.find(key);
            if (it == rhs.end() || !values_equal(value, *it)) return false;
        }
        return true;
    }
    if (lhs.is_array() && rhs.is_array()) {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                          [](const Value& a, const Value& b) { return values_equal(a, b); });
    }
    return lhs == rhs;
}

/// Equality under a serializer: equal iff the canonical texts match.
inline auto values_equal(const Value& lhs, const Value& rhs, const Serializer& serializer) -> bool {
    return serializer(lhs) == serializer(rhs);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const AddOp& op) { ... },
///     [](const auto&) { ... },
/// }, operation);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
