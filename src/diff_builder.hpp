#pragma once

// Internal header — not installed. Implementation detail of make_patch().

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace jsonpatch_cpp::detail {

/// A member name or an array position, as met while walking a document.
using Key = std::variant<std::string, std::size_t>;

/// Handle of a slot in the pending-edit arena. Slot 0 is the sentinel.
using EditHandle = std::size_t;

inline constexpr EditHandle sentinel = 0;

// One not-yet-final edit, linked into the pending list by handle.
struct PendingEdit {
    Operation op;
    bool indexed = false;       // last token of the path is an array index
    bool from_indexed = false;  // same for a move's `from`
    EditHandle prev = sentinel;
    EditHandle next = sentinel;
};

// Identity under which a removed value and an added value pair up:
// the JSON type plus the serializer's canonical text.
struct ValueKey {
    Value::value_t type;
    std::string text;

    auto operator==(const ValueKey&) const -> bool = default;
};

struct ValueKeyHash {
    auto operator()(const ValueKey& k) const noexcept -> std::size_t {
        return std::hash<std::string>{}(k.text) ^ (static_cast<std::size_t>(k.type) << 1);
    }
};

/// Recursive comparison of two documents into a list of pending edits.
///
/// Added and removed values are recorded in an order-preserving doubly
/// linked list (an arena of PendingEdit slots joined by handles) plus two
/// indexes from value to handle. When a value removed in one place shows up
/// added in another (or the reverse) the pending edit is unlinked in O(1)
/// and a move is recorded instead; edits sharing the affected array have
/// their indexes shifted so they stay valid once the move is applied.
///
/// Only edits in the same container as the paired one are rewritten. If a
/// later edit reaches into that container's elements, or inserts or removes
/// an element of an enclosing array, the pair is left as a remove and an
/// add.
class DiffBuilder {
public:
    explicit DiffBuilder(const DiffOptions& options);

    /// Compare `src` and `dst`, which sit at `key` under `path` (at `path`
    /// itself when `key` is empty).
    void compare_values(const Pointer& path, const std::optional<Key>& key,
                        const Value& src, const Value& dst, std::size_t depth = 0);

    /// The pending edits in list order, before the merge pass.
    auto pending() const -> std::vector<Operation>;

    /// Merge pass: an adjacent remove/add pair on the same path becomes one
    /// replace; everything else is emitted in list order.
    auto execute() const -> std::vector<Operation>;

private:
    void compare_dicts(const Pointer& path, const Value& src, const Value& dst, std::size_t depth);
    void compare_lists(const Pointer& path, const Value& src, const Value& dst, std::size_t depth);

    void item_added(const Pointer& path, const Key& key, const Value& item);
    void item_removed(const Pointer& path, const Key& key, const Value& item);
    void item_replaced(const Pointer& location, const Value& item);

    // Index adjustment of edit `h` for an array position `key` under
    // `parent` coming back (undo of a remove) or going away (undo of an
    // add). Returns the caller's adjusted position.
    auto on_undo_remove(EditHandle h, const Pointer& parent, std::int64_t key) -> std::int64_t;
    auto on_undo_add(EditHandle h, const Pointer& parent, std::int64_t key) -> std::int64_t;

    // True if no edit after `h` disturbs `anchor` (the path `h` wrote)
    // beyond what the index adjustment above accounts for.
    auto pairable(EditHandle h, const Pointer& anchor, bool anchor_indexed) const -> bool;

    auto insert(Operation op, bool indexed, bool from_indexed = false) -> EditHandle;
    void unlink(EditHandle h);

    auto value_key(const Value& v) const -> ValueKey;
    void store_index(const ValueKey& k, EditHandle h, bool removed);
    auto find_index(const ValueKey& k, bool removed) const -> std::optional<EditHandle>;
    void drop_index(const ValueKey& k, bool removed);

    auto equal(const Value& a, const Value& b) const -> bool;

    DiffOptions options_;
    std::vector<PendingEdit> edits_;
    std::unordered_map<ValueKey, std::vector<EditHandle>, ValueKeyHash> added_;
    std::unordered_map<ValueKey, std::vector<EditHandle>, ValueKeyHash> removed_;
};

}  // namespace jsonpatch_cpp::detail
