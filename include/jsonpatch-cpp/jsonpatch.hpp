/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Pointer, Operation, Patch, DiffOptions and the exception
/// hierarchy, plus the one-call entry points below.

#pragma once

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <string_view>

namespace jsonpatch_cpp {

/// Decode `patch` and apply it to a copy of `doc`.
///
/// Copying and in-place application are two functions rather than one call
/// with an `in_place` flag: this one returns the patched copy,
/// apply_patch_in_place() mutates its argument.
///
/// @code
/// auto doc = json{{"foo", "bar"}};
/// auto out = apply_patch(doc, json::array({{{"op", "add"}, {"path", "/baz"}, {"value", "qux"}}}));
/// // out == {"foo": "bar", "baz": "qux"}, doc unchanged
/// @endcode
///
/// @throws InvalidPatch, InvalidPointer if `patch` is malformed; nothing is
///   applied in that case.
/// @throws PointerResolutionError, Conflict, TestFailed from the first
///   operation that fails.
auto apply_patch(const Value& doc, const Value& patch) -> Value;

/// Parse `patch_text` as JSON, then apply it as above.
auto apply_patch(const Value& doc, std::string_view patch_text) -> Value;

/// String literals would otherwise convert to both Value and string_view.
inline auto apply_patch(const Value& doc, const char* patch_text) -> Value {
    return apply_patch(doc, std::string_view{patch_text});
}

/// Decode `patch` and apply it directly to `doc`. On failure `doc` keeps
/// the effects of the operations that succeeded before the failing one.
void apply_patch_in_place(Value& doc, const Value& patch);

}  // namespace jsonpatch_cpp
