#include <jsonpatch-cpp/operation.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

namespace {

constexpr auto op_names = std::array<std::pair<std::string_view, OpType>, 6>{{
    {"add",     OpType::add},
    {"remove",  OpType::remove},
    {"replace", OpType::replace},
    {"move",    OpType::move},
    {"copy",    OpType::copy},
    {"test",    OpType::test},
}};

auto invalid_index(const std::string& key, const Pointer& path) -> PointerResolutionError {
    return PointerResolutionError{"'" + key + "' is not a valid array index in '" +
                                  path.to_string() + "'"};
}

auto scalar_parent(const Value& container, const Pointer& path) -> Conflict {
    return Conflict{"unable to fully resolve '" + path.to_string() + "': parent is " +
                    std::string{to_string_view(container.type())}};
}

// =============================================================================
// Container surgery shared by every operation
// =============================================================================

void add_value(Value& doc, const Pointer& path, Value value) {
    auto [container, key] = resolve_parent(doc, path);
    if (!container) {
        doc = std::move(value);
        return;
    }
    if (container->is_array()) {
        if (*key == "-") {
            container->push_back(std::move(value));
            return;
        }
        auto idx = parse_index(*key);
        if (!idx) throw invalid_index(*key, path);
        if (*idx > container->size()) {
            throw Conflict{"can't insert at '" + path.to_string() + "' outside of array of size " +
                           std::to_string(container->size())};
        }
        container->insert(container->begin() + static_cast<std::ptrdiff_t>(*idx), std::move(value));
        return;
    }
    if (container->is_object()) {
        (*container)[*key] = std::move(value);
        return;
    }
    throw scalar_parent(*container, path);
}

void remove_value(Value& doc, const Pointer& path) {
    auto [container, key] = resolve_parent(doc, path);
    if (!container) throw Conflict{"can't remove the document root"};
    if (container->is_array()) {
        auto idx = parse_index(*key);
        if (!idx) throw invalid_index(*key, path);
        if (*idx >= container->size()) {
            throw Conflict{"can't remove a non-existent element '" + path.to_string() + "'"};
        }
        container->erase(*idx);
        return;
    }
    if (container->is_object()) {
        if (container->erase(*key) == 0) {
            throw Conflict{"can't remove a non-existent member '" + path.to_string() + "'"};
        }
        return;
    }
    throw scalar_parent(*container, path);
}

void replace_value(Value& doc, const Pointer& path, Value value) {
    auto [container, key] = resolve_parent(doc, path);
    if (!container) {
        doc = std::move(value);
        return;
    }
    if (container->is_array()) {
        if (*key == "-") {
            throw Conflict{"'-' in '" + path.to_string() + "' can't be the target of a replace"};
        }
        auto idx = parse_index(*key);
        if (!idx) throw invalid_index(*key, path);
        if (*idx >= container->size()) {
            throw Conflict{"can't replace outside of array at '" + path.to_string() + "'"};
        }
        (*container)[*idx] = std::move(value);
        return;
    }
    if (container->is_object()) {
        auto it = container->find(*key);
        if (it == container->end()) {
            throw Conflict{"can't replace a non-existent member '" + path.to_string() + "'"};
        }
        *it = std::move(value);
        return;
    }
    throw scalar_parent(*container, path);
}

// The value a `from` pointer addresses; it has to exist.
auto source_value(Value& doc, const Location& loc, const Pointer& from) -> Value& {
    auto& [container, key] = loc;
    if (!container) return doc;
    if (container->is_array()) {
        if (*key != "-") {
            auto idx = parse_index(*key);
            if (!idx) throw invalid_index(*key, from);
            if (*idx < container->size()) return (*container)[*idx];
        }
        throw Conflict{"no array element at '" + from.to_string() + "'"};
    }
    if (container->is_object()) {
        auto it = container->find(*key);
        if (it == container->end()) {
            throw Conflict{"no member at '" + from.to_string() + "'"};
        }
        return *it;
    }
    throw scalar_parent(*container, from);
}

// =============================================================================
// Per-operation semantics
// =============================================================================

void apply_op(const AddOp& op, Value& doc) {
    add_value(doc, op.path, op.value);
}

void apply_op(const RemoveOp& op, Value& doc) {
    remove_value(doc, op.path);
}

void apply_op(const ReplaceOp& op, Value& doc) {
    replace_value(doc, op.path, op.value);
}

void apply_op(const MoveOp& op, Value& doc) {
    auto loc = resolve_parent(doc, op.from);
    auto& source = source_value(doc, loc, op.from);
    if (op.from == op.path) return;
    if ((!loc.container || loc.container->is_object()) && op.path.contains(op.from)) {
        throw Conflict{"can't move '" + op.from.to_string() + "' into its own child '" +
                       op.path.to_string() + "'"};
    }
    auto value = std::move(source);
    remove_value(doc, op.from);
    add_value(doc, op.path, std::move(value));
}

void apply_op(const CopyOp& op, Value& doc) {
    auto loc = resolve_parent(doc, op.from);
    auto value = source_value(doc, loc, op.from);
    add_value(doc, op.path, std::move(value));
}

void apply_op(const TestOp& op, const Value& doc) {
    const auto* actual = try_resolve(doc, op.path);
    if (!actual) {
        throw TestFailed{"'" + op.path.to_string() + "' does not resolve"};
    }
    if (!values_equal(*actual, op.value)) {
        throw TestFailed{actual->dump() + " (" + actual->type_name() + ") at '" +
                         op.path.to_string() + "' is not equal to tested value " +
                         op.value.dump() + " (" + op.value.type_name() + ")"};
    }
}

// =============================================================================
// Wire-format decoding
// =============================================================================

auto required_member(const Value& j, std::string_view name, OpType type)
    -> const Value& {
    auto it = j.find(std::string{name});
    if (it == j.end()) {
        throw InvalidPatch{"'" + std::string{to_string_view(type)} +
                           "' operation does not contain a '" + std::string{name} + "' member"};
    }
    return *it;
}

auto required_pointer(const Value& j, std::string_view name, OpType type) -> Pointer {
    const auto& member = required_member(j, name, type);
    if (!member.is_string()) {
        throw InvalidPatch{"'" + std::string{name} + "' of '" + std::string{to_string_view(type)} +
                           "' operation must be a string, got " + member.type_name()};
    }
    return Pointer::parse(member.get_ref<const std::string&>());
}

}  // anonymous namespace

auto op_type_from_string(std::string_view name) -> std::optional<OpType> {
    for (const auto& [n, type] : op_names) {
        if (n == name) return type;
    }
    return std::nullopt;
}

auto op_type(const Operation& op) -> OpType {
    return std::visit(overload{
        [](const AddOp&) { return OpType::add; },
        [](const RemoveOp&) { return OpType::remove; },
        [](const ReplaceOp&) { return OpType::replace; },
        [](const MoveOp&) { return OpType::move; },
        [](const CopyOp&) { return OpType::copy; },
        [](const TestOp&) { return OpType::test; },
    }, op);
}

auto path_of(const Operation& op) -> const Pointer& {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

void apply(const Operation& op, Value& doc) {
    std::visit([&](const auto& o) { apply_op(o, doc); }, op);
}

auto operation_from_json(const Value& j) -> Operation {
    if (!j.is_object()) {
        throw InvalidPatch{std::string{"operation must be an object, got "} + j.type_name()};
    }
    auto op_it = j.find("op");
    if (op_it == j.end()) {
        throw InvalidPatch{"operation does not contain an 'op' member"};
    }
    if (!op_it->is_string()) {
        throw InvalidPatch{std::string{"operation's 'op' must be a string, got "} + op_it->type_name()};
    }
    const auto& name = op_it->get_ref<const std::string&>();
    auto type = op_type_from_string(name);
    if (!type) {
        throw InvalidPatch{"unknown operation '" + name + "'"};
    }

    auto path = required_pointer(j, "path", *type);
    switch (*type) {
        case OpType::add:
            return AddOp{.path = std::move(path), .value = required_member(j, "value", *type)};
        case OpType::remove:
            return RemoveOp{.path = std::move(path)};
        case OpType::replace:
            return ReplaceOp{.path = std::move(path), .value = required_member(j, "value", *type)};
        case OpType::move:
            return MoveOp{.from = required_pointer(j, "from", *type), .path = std::move(path)};
        case OpType::copy:
            return CopyOp{.from = required_pointer(j, "from", *type), .path = std::move(path)};
        case OpType::test:
            return TestOp{.path = std::move(path), .value = required_member(j, "value", *type)};
    }
    throw InvalidPatch{"unknown operation '" + name + "'"};
}

auto operation_to_json(const Operation& op) -> Value {
    return std::visit([](const auto& o) { return Value(o); }, op);
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(Value& j, const AddOp& op) {
    j = Value{{"op", "add"}, {"path", op.path}, {"value", op.value}};
}

void to_json(Value& j, const RemoveOp& op) {
    j = Value{{"op", "remove"}, {"path", op.path}};
}

void to_json(Value& j, const ReplaceOp& op) {
    j = Value{{"op", "replace"}, {"path", op.path}, {"value", op.value}};
}

void to_json(Value& j, const MoveOp& op) {
    j = Value{{"op", "move"}, {"from", op.from}, {"path", op.path}};
}

void to_json(Value& j, const CopyOp& op) {
    j = Value{{"op", "copy"}, {"from", op.from}, {"path", op.path}};
}

void to_json(Value& j, const TestOp& op) {
    j = Value{{"op", "test"}, {"path", op.path}, {"value", op.value}};
}

}  // namespace jsonpatch_cpp
