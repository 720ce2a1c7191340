/// @file patch.hpp
/// @brief Patch: an ordered, validated sequence of operations.

#pragma once

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

struct DiffOptions;

/// An ordered list of operations. Order is application order: later
/// operations see the effects of earlier ones.
///
/// A Patch is immutable once constructed. All structural validation of the
/// wire format happens at construction, before any document is touched.
///
/// @code
/// auto patch = Patch::from_string(R"([{"op": "add", "path": "/a/-", "value": 5}])");
/// auto result = patch.apply(json{{"a", {1, 2}}});   // {"a": [1, 2, 5]}
/// @endcode
class Patch {
public:
    using const_iterator = std::vector<Operation>::const_iterator;

    /// The empty patch.
    Patch() = default;

    /// Construct from already-built operations.
    explicit Patch(std::vector<Operation> ops) : ops_{std::move(ops)} {}

    /// Decode and validate a wire-format patch document.
    /// @throws InvalidPatch if `j` is not an array of valid operation objects.
    /// @throws InvalidPointer if a `path` or `from` is malformed.
    static auto from_json(const Value& j) -> Patch;

    /// Parse JSON text, then decode it as with from_json().
    /// @throws InvalidPatch if the text is not valid JSON.
    static auto from_string(std::string_view text) -> Patch;

    /// Compute the patch that transforms `src` into `dst`.
    /// Same as make_patch().
    static auto from_diff(const Value& src, const Value& dst) -> Patch;
    static auto from_diff(const Value& src, const Value& dst, const DiffOptions& options) -> Patch;

    /// Apply to a deep copy of `doc` and return the result.
    /// `doc` is untouched, also when an operation fails.
    auto apply(const Value& doc) const -> Value;

    /// Apply directly to `doc`.
    ///
    /// No rollback: if an operation fails, `doc` keeps the effects of the
    /// operations before it. The caller must hold `doc` exclusively.
    void apply_in_place(Value& doc) const;

    /// Encode in wire format.
    auto to_json() const -> Value;

    /// Encode as JSON text (`indent` as for Value::dump).
    auto to_string(int indent = -1) const -> std::string;

    /// Encode as text with a caller-supplied serializer.
    auto to_string(const Serializer& serializer) const -> std::string;

    auto operations() const noexcept -> const std::vector<Operation>& { return ops_; }
    auto size() const noexcept -> std::size_t { return ops_.size(); }
    auto empty() const noexcept -> bool { return ops_.empty(); }
    auto begin() const noexcept -> const_iterator { return ops_.begin(); }
    auto end() const noexcept -> const_iterator { return ops_.end(); }
    auto operator[](std::size_t i) const -> const Operation& { return ops_[i]; }

    auto operator==(const Patch&) const -> bool = default;

private:
    std::vector<Operation> ops_;
};

/// Serialize a patch in wire format.
void to_json(Value& j, const Patch& p);

}  // namespace jsonpatch_cpp
