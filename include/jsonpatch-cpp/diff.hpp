/// @file diff.hpp
/// @brief Computing a patch between two documents.

#pragma once

#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>

namespace jsonpatch_cpp {

/// Nesting deeper than this makes make_patch() throw DepthExceeded.
inline constexpr std::size_t default_max_depth = 512;

/// Configuration for make_patch().
struct DiffOptions {
    /// Canonical text used to decide whether two values are equal. Values
    /// with equal text produce no edit; this is also the identity under which
    /// a removed value and an added value are paired into a move.
    Serializer serializer = default_serializer();

    /// Maximum container nesting the comparison will descend into.
    std::size_t max_depth = default_max_depth;
};

/// Compute a patch that transforms `src` into `dst`.
///
/// Objects are compared member by member, arrays position by position
/// (no longest-common-subsequence alignment: a reordered array shows up as
/// per-index edits). An unchanged value that was removed in one place and
/// added in another becomes a single `move`; a remove immediately followed
/// by an add at the same path becomes a single `replace`.
///
/// Postcondition: `values_equal(make_patch(src, dst).apply(src), dst)`.
///
/// @throws DepthExceeded if nesting exceeds `options.max_depth`.
auto make_patch(const Value& src, const Value& dst, const DiffOptions& options = {}) -> Patch;

}  // namespace jsonpatch_cpp
