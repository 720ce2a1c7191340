/// @file operation.hpp
/// @brief The six patch operations and their apply semantics.

#pragma once

#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace jsonpatch_cpp {

/// The kind of edit an operation performs.
enum class OpType : std::uint8_t {
    add,      ///< Insert into an array or set an object member.
    remove,   ///< Delete an array element or object member.
    replace,  ///< Overwrite an existing value.
    move,     ///< Remove a value and add it elsewhere.
    copy,     ///< Deep-copy a value to another location.
    test,     ///< Assert that a location holds a value.
};

/// Convert an OpType to its wire-format name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Look up an OpType by its wire-format name.
auto op_type_from_string(std::string_view name) -> std::optional<OpType>;

/// Insert into an array ("-" appends) or set an object member.
struct AddOp {
    Pointer path;  ///< Where to add.
    Value value;   ///< What to add.
    auto operator==(const AddOp&) const -> bool = default;
};

/// Delete the value at `path`.
struct RemoveOp {
    Pointer path;  ///< What to delete.
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// Overwrite the existing value at `path`.
struct ReplaceOp {
    Pointer path;  ///< The existing location.
    Value value;   ///< The new value.
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// Remove the value at `from` and add it at `path`.
struct MoveOp {
    Pointer from;  ///< The source location.
    Pointer path;  ///< The target location.
    auto operator==(const MoveOp&) const -> bool = default;
};

/// Add a deep copy of the value at `from` at `path`.
struct CopyOp {
    Pointer from;  ///< The source location.
    Pointer path;  ///< The target location.
    auto operator==(const CopyOp&) const -> bool = default;
};

/// Assert that the value at `path` equals `value`.
struct TestOp {
    Pointer path;  ///< The location to check.
    Value value;   ///< The expected value.
    auto operator==(const TestOp&) const -> bool = default;
};

/// One patch operation. Each alternative carries only its own fields.
using Operation = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp,
    MoveOp,
    CopyOp,
    TestOp
>;

/// The kind of an operation.
auto op_type(const Operation& op) -> OpType;

/// The target path of an operation.
auto path_of(const Operation& op) -> const Pointer&;

/// Apply one operation to `doc` in place.
///
/// @throws PointerResolutionError if the target's parent does not resolve.
/// @throws Conflict if the document's shape contradicts the operation.
/// @throws TestFailed if a test operation does not match.
void apply(const Operation& op, Value& doc);

/// Decode and validate one wire-format operation object.
/// @throws InvalidPatch on a missing/unknown `op` or a missing field.
/// @throws InvalidPointer on a malformed `path` or `from`.
auto operation_from_json(const Value& j) -> Operation;

/// Encode one operation in wire format.
auto operation_to_json(const Operation& op) -> Value;

// -- ADL serialization --------------------------------------------------------

void to_json(Value& j, const AddOp& op);
void to_json(Value& j, const RemoveOp& op);
void to_json(Value& j, const ReplaceOp& op);
void to_json(Value& j, const MoveOp& op);
void to_json(Value& j, const CopyOp& op);
void to_json(Value& j, const TestOp& op);

}  // namespace jsonpatch_cpp
