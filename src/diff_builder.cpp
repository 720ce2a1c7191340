#include "diff_builder.hpp"

#include <jsonpatch-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp::detail {

namespace {

auto join(const Pointer& path, const Key& key) -> Pointer {
    return std::visit(overload{
        [&](const std::string& k) { return path.append(k); },
        [&](std::size_t i) { return path.append(i); },
    }, key);
}

auto is_index(const Key& key) -> bool {
    return std::holds_alternative<std::size_t>(key);
}

// Only called on pointers whose last token was written by this builder from
// an array position.
auto index_of(const Pointer& p) -> std::int64_t {
    return std::stoll(p.back());
}

auto with_index(const Pointer& p, std::int64_t index) -> Pointer {
    return p.with_back(std::to_string(index));
}

// Whether an edit at `q` is disturbed when `anchor` comes back or goes away.
// Only siblings in the anchor's own container are taken care of by
// on_undo_remove/on_undo_add.
auto crosses(const Pointer& q, bool q_indexed, const Pointer& anchor, bool anchor_indexed) -> bool {
    auto parent = anchor.parent();
    if (q.empty()) return true;
    if (q.parent() == parent) return anchor_indexed ? !q_indexed : q == anchor;
    if (anchor.contains(q) || q.contains(anchor)) return true;
    if (q.contains(parent)) return anchor_indexed;
    return q_indexed && parent.contains(q.parent());
}

}  // anonymous namespace

DiffBuilder::DiffBuilder(const DiffOptions& options)
    : options_{options} {
    edits_.push_back(PendingEdit{.op = RemoveOp{}});
}

// =============================================================================
// Pending-edit list
// =============================================================================

auto DiffBuilder::insert(Operation op, bool indexed, bool from_indexed) -> EditHandle {
    auto h = edits_.size();
    auto last = edits_[sentinel].prev;
    edits_.push_back(PendingEdit{
        .op = std::move(op),
        .indexed = indexed,
        .from_indexed = from_indexed,
        .prev = last,
        .next = sentinel,
    });
    edits_[last].next = h;
    edits_[sentinel].prev = h;
    return h;
}

void DiffBuilder::unlink(EditHandle h) {
    auto& e = edits_[h];
    edits_[e.prev].next = e.next;
    edits_[e.next].prev = e.prev;
    e.prev = sentinel;
    e.next = sentinel;
}

auto DiffBuilder::pending() const -> std::vector<Operation> {
    auto result = std::vector<Operation>{};
    for (auto h = edits_[sentinel].next; h != sentinel; h = edits_[h].next) {
        result.push_back(edits_[h].op);
    }
    return result;
}

auto DiffBuilder::execute() const -> std::vector<Operation> {
    auto result = std::vector<Operation>{};
    auto h = edits_[sentinel].next;
    while (h != sentinel) {
        auto next = edits_[h].next;
        if (next != sentinel) {
            const auto* removed = std::get_if<RemoveOp>(&edits_[h].op);
            const auto* added = std::get_if<AddOp>(&edits_[next].op);
            if (removed && added && removed->path == added->path) {
                result.push_back(ReplaceOp{.path = added->path, .value = added->value});
                h = edits_[next].next;
                continue;
            }
        }
        result.push_back(edits_[h].op);
        h = next;
    }
    return result;
}

// =============================================================================
// Value indexes
// =============================================================================

// Signed and unsigned integers are one kind: `json(1)` and `json::parse("1")`
// must pair up.
auto DiffBuilder::value_key(const Value& v) const -> ValueKey {
    auto type = v.type();
    if (type == Value::value_t::number_unsigned) type = Value::value_t::number_integer;
    return ValueKey{.type = type, .text = options_.serializer(v)};
}

void DiffBuilder::store_index(const ValueKey& k, EditHandle h, bool removed) {
    auto& storage = removed ? removed_ : added_;
    storage[k].push_back(h);
}

auto DiffBuilder::find_index(const ValueKey& k, bool removed) const -> std::optional<EditHandle> {
    const auto& storage = removed ? removed_ : added_;
    auto it = storage.find(k);
    if (it == storage.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

void DiffBuilder::drop_index(const ValueKey& k, bool removed) {
    auto& storage = removed ? removed_ : added_;
    storage[k].pop_back();
}

auto DiffBuilder::equal(const Value& a, const Value& b) const -> bool {
    return values_equal(a, b, options_.serializer);
}

// =============================================================================
// Index adjustment
// =============================================================================

auto DiffBuilder::on_undo_remove(EditHandle h, const Pointer& parent, std::int64_t key)
    -> std::int64_t {
    auto& e = edits_[h];
    std::visit(overload{
        [&](RemoveOp& op) {
            if (!e.indexed || op.path.parent() != parent) return;
            auto k = index_of(op.path);
            if (k >= key) op.path = with_index(op.path, k + 1);
            else --key;
        },
        [&](AddOp& op) {
            if (!e.indexed || op.path.parent() != parent) return;
            auto k = index_of(op.path);
            if (k > key) op.path = with_index(op.path, k + 1);
            else ++key;
        },
        [&](MoveOp& op) {
            if (e.from_indexed && op.from.parent() == parent) {
                auto k = index_of(op.from);
                if (k >= key) op.from = with_index(op.from, k + 1);
                else --key;
            }
            if (e.indexed && op.path.parent() == parent) {
                auto k = index_of(op.path);
                if (k > key) op.path = with_index(op.path, k + 1);
                else ++key;
            }
        },
        [](auto&) {},
    }, e.op);
    return key;
}

auto DiffBuilder::on_undo_add(EditHandle h, const Pointer& parent, std::int64_t key)
    -> std::int64_t {
    auto& e = edits_[h];
    std::visit(overload{
        [&](RemoveOp& op) {
            if (!e.indexed || op.path.parent() != parent) return;
            auto k = index_of(op.path);
            if (k > key) op.path = with_index(op.path, k - 1);
            else --key;
        },
        [&](AddOp& op) {
            if (!e.indexed || op.path.parent() != parent) return;
            auto k = index_of(op.path);
            if (k > key) op.path = with_index(op.path, k - 1);
            else ++key;
        },
        [&](MoveOp& op) {
            if (e.from_indexed && op.from.parent() == parent) {
                auto k = index_of(op.from);
                if (k > key) op.from = with_index(op.from, k - 1);
                else --key;
            }
            if (e.indexed && op.path.parent() == parent) {
                auto k = index_of(op.path);
                if (k > key) op.path = with_index(op.path, k - 1);
                else ++key;
            }
        },
        [](auto&) {},
    }, e.op);
    return key;
}

auto DiffBuilder::pairable(EditHandle h, const Pointer& anchor, bool anchor_indexed) const -> bool {
    for (auto v = edits_[h].next; v != sentinel; v = edits_[v].next) {
        const auto& e = edits_[v];
        auto disturbed = std::visit(overload{
            [&](const MoveOp& op) {
                return crosses(op.from, e.from_indexed, anchor, anchor_indexed) ||
                       crosses(op.path, e.indexed, anchor, anchor_indexed);
            },
            [&](const auto& op) { return crosses(op.path, e.indexed, anchor, anchor_indexed); },
        }, e.op);
        if (disturbed) return false;
    }
    return true;
}

// =============================================================================
// Added / removed / replaced events
// =============================================================================

void DiffBuilder::item_added(const Pointer& path, const Key& key, const Value& item) {
    auto location = join(path, key);
    auto vk = value_key(item);
    auto found = find_index(vk, /*removed=*/true);
    if (found) {
        const auto& removed = edits_[*found];
        const auto& anchor = path_of(removed.op);
        if (!pairable(*found, anchor, removed.indexed) ||
            crosses(location, is_index(key), anchor, removed.indexed)) {
            found.reset();
        }
    }
    if (!found) {
        auto h = insert(AddOp{.path = location, .value = item}, is_index(key));
        store_index(vk, h, /*removed=*/false);
        return;
    }

    auto h = *found;
    drop_index(vk, /*removed=*/true);
    auto old_path = path_of(edits_[h].op);
    if (edits_[h].indexed) {
        auto parent = old_path.parent();
        auto k = index_of(old_path);
        for (auto v = edits_[h].next; v != sentinel; v = edits_[v].next) {
            k = on_undo_remove(v, parent, k);
        }
        old_path = with_index(old_path, k);
    }
    unlink(h);
    if (old_path != location) {
        insert(MoveOp{.from = std::move(old_path), .path = std::move(location)},
               is_index(key), edits_[h].indexed);
    }
}

void DiffBuilder::item_removed(const Pointer& path, const Key& key, const Value& item) {
    auto vk = value_key(item);
    auto found = find_index(vk, /*removed=*/false);
    auto nh = insert(RemoveOp{.path = join(path, key)}, is_index(key));
    if (found && !pairable(*found, path_of(edits_[*found].op), edits_[*found].indexed)) {
        found.reset();
    }
    if (!found) {
        store_index(vk, nh, /*removed=*/true);
        return;
    }

    auto h = *found;
    drop_index(vk, /*removed=*/false);
    auto add_path = path_of(edits_[h].op);
    if (edits_[h].indexed) {
        auto parent = add_path.parent();
        auto k = index_of(add_path);
        for (auto v = edits_[h].next; v != sentinel; v = edits_[v].next) {
            k = on_undo_add(v, parent, k);
        }
        add_path = with_index(add_path, k);
    }
    unlink(h);

    auto remove_path = path_of(edits_[nh].op);
    if (remove_path != add_path) {
        edits_[nh].from_indexed = edits_[nh].indexed;
        edits_[nh].indexed = edits_[h].indexed;
        edits_[nh].op = MoveOp{.from = std::move(remove_path), .path = std::move(add_path)};
    } else {
        unlink(nh);
    }
}

void DiffBuilder::item_replaced(const Pointer& location, const Value& item) {
    insert(ReplaceOp{.path = location, .value = item}, false);
}

// =============================================================================
// Recursive comparison
// =============================================================================

void DiffBuilder::compare_values(const Pointer& path, const std::optional<Key>& key,
                                 const Value& src, const Value& dst, std::size_t depth) {
    auto location = key ? join(path, *key) : path;
    if (src.is_object() && dst.is_object()) {
        compare_dicts(location, src, dst, depth + 1);
    } else if (src.is_array() && dst.is_array()) {
        compare_lists(location, src, dst, depth + 1);
    } else if (!equal(src, dst)) {
        item_replaced(location, dst);
    }
}

void DiffBuilder::compare_dicts(const Pointer& path, const Value& src, const Value& dst,
                                std::size_t depth) {
    if (depth > options_.max_depth) {
        throw DepthExceeded{"nesting at '" + path.to_string() + "' exceeds the maximum depth of " +
                            std::to_string(options_.max_depth)};
    }
    for (const auto& [k, v] : src.items()) {
        if (!dst.contains(k)) item_removed(path, Key{k}, v);
    }
    for (const auto& [k, v] : dst.items()) {
        if (!src.contains(k)) item_added(path, Key{k}, v);
    }
    for (const auto& [k, v] : src.items()) {
        auto it = dst.find(k);
        if (it != dst.end()) compare_values(path, Key{k}, v, *it, depth);
    }
}

void DiffBuilder::compare_lists(const Pointer& path, const Value& src, const Value& dst,
                                std::size_t depth) {
    if (depth > options_.max_depth) {
        throw DepthExceeded{"nesting at '" + path.to_string() + "' exceeds the maximum depth of " +
                            std::to_string(options_.max_depth)};
    }
    const auto len_src = src.size();
    const auto len_dst = dst.size();
    const auto max_len = std::max(len_src, len_dst);
    const auto min_len = std::min(len_src, len_dst);
    for (std::size_t i = 0; i < max_len; ++i) {
        if (i < min_len) {
            const auto& old_item = src[i];
            const auto& new_item = dst[i];
            if (equal(old_item, new_item)) continue;
            if (old_item.is_object() && new_item.is_object()) {
                compare_dicts(path.append(i), old_item, new_item, depth + 1);
            } else if (old_item.is_array() && new_item.is_array()) {
                compare_lists(path.append(i), old_item, new_item, depth + 1);
            } else {
                item_removed(path, Key{i}, old_item);
                item_added(path, Key{i}, new_item);
            }
        } else if (len_src > len_dst) {
            item_removed(path, Key{len_dst}, src[i]);
        } else {
            item_added(path, Key{i}, dst[i]);
        }
    }
}

}  // namespace jsonpatch_cpp::detail
