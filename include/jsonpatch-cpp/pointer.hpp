/// @file pointer.hpp
/// @brief Document pointers (RFC 6901): parsing, formatting and resolution.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

/// An immutable path into a document.
///
/// A pointer is a sequence of decoded reference tokens. How a token is read
/// depends on the container it is resolved against: in an array it must be
/// an index ("0", "12") or "-" (one past the end); in an object it is a
/// plain key, even if it looks like a number.
///
/// @code
/// auto p = Pointer::parse("/users/0/a~1b");   // tokens: users, 0, a/b
/// p.to_string();                             // "/users/0/a~1b"
/// @endcode
class Pointer {
public:
    /// The empty pointer, addressing the whole document.
    Pointer() = default;

    /// Construct from already-decoded tokens.
    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Construct from already-decoded tokens (convenience for tests).
    Pointer(std::initializer_list<std::string> tokens) : tokens_{tokens} {}

    /// Parse pointer text.
    /// @throws InvalidPointer if non-empty text does not start with '/', or
    ///   a '~' is not followed by '0' or '1'.
    static auto parse(std::string_view text) -> Pointer;

    /// Encode one token: '~' -> "~0", '/' -> "~1".
    static auto escape(std::string_view token) -> std::string;

    /// Decode one token: "~1" -> '/', "~0" -> '~'.
    /// @throws InvalidPointer on a malformed escape sequence.
    static auto unescape(std::string_view token) -> std::string;

    /// Format as pointer text. `Pointer::parse(p.to_string()) == p`.
    auto to_string() const -> std::string;

    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }
    auto size() const noexcept -> std::size_t { return tokens_.size(); }
    auto empty() const noexcept -> bool { return tokens_.empty(); }

    /// The last token. Precondition: `!empty()`.
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer without its last token (the root stays the root).
    auto parent() const -> Pointer;

    /// A new pointer with `token` appended.
    auto append(std::string token) const -> Pointer;

    /// A new pointer with an array index appended.
    auto append(std::size_t index) const -> Pointer;

    /// A new pointer whose last token is replaced. Precondition: `!empty()`.
    auto with_back(std::string token) const -> Pointer;

    /// True if `other` is a prefix of this pointer (or equal to it), i.e.
    /// `other` addresses an ancestor-or-self of what this pointer addresses.
    auto contains(const Pointer& other) const -> bool;

    auto operator<=>(const Pointer&) const = default;
    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Parse an RFC 6901 array index: digits only, no sign, no leading zeros
/// (except "0" itself).
auto parse_index(std::string_view token) -> std::optional<std::size_t>;

/// The parent container of a pointer's target plus the final token.
///
/// For the empty pointer both are empty: the operation targets the whole
/// document.
struct Location {
    Value* container{nullptr};       ///< The second-to-last value, or nullptr for root.
    std::optional<std::string> key;  ///< The final token, or nullopt for root.
};

/// Walk all tokens except the last.
/// @throws PointerResolutionError if an intermediate member does not exist,
///   an array index is malformed or out of range, or a scalar is indexed.
auto resolve_parent(Value& doc, const Pointer& pointer) -> Location;

/// Look `key` up in `container`: index for arrays, member for objects.
/// @throws PointerResolutionError if absent, out of range or not a container.
auto walk(Value& container, std::string_view key) -> Value&;
auto walk(const Value& container, std::string_view key) -> const Value&;

/// Resolve every token of `pointer`.
/// @throws PointerResolutionError if the pointer does not resolve.
auto resolve(Value& doc, const Pointer& pointer) -> Value&;
auto resolve(const Value& doc, const Pointer& pointer) -> const Value&;

/// Non-throwing resolution: nullptr if the pointer does not resolve.
auto try_resolve(const Value& doc, const Pointer& pointer) -> const Value*;

/// Serialize a pointer as its text form.
void to_json(Value& j, const Pointer& p);

/// Parse a pointer from a JSON string.
/// @throws InvalidPointer on malformed text.
void from_json(const Value& j, Pointer& p);

}  // namespace jsonpatch_cpp
