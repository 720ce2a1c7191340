#include <jsonpatch-cpp/patch.hpp>

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <string>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

auto Patch::from_json(const Value& j) -> Patch {
    if (j.is_object()) {
        throw InvalidPatch{"patch must be a sequence of operations, got a single object"};
    }
    if (!j.is_array()) {
        throw InvalidPatch{std::string{"patch must be an array, got "} + j.type_name()};
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(j.size());
    for (const auto& entry : j) {
        if (entry.is_string()) {
            throw InvalidPatch{"patch is expected to be a sequence of operations, "
                               "got a sequence of strings"};
        }
        ops.push_back(operation_from_json(entry));
    }
    return Patch{std::move(ops)};
}

auto Patch::from_string(std::string_view text) -> Patch {
    auto j = Value::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw InvalidPatch{"patch text is not valid JSON"};
    }
    return from_json(j);
}

auto Patch::from_diff(const Value& src, const Value& dst) -> Patch {
    return make_patch(src, dst);
}

auto Patch::from_diff(const Value& src, const Value& dst, const DiffOptions& options) -> Patch {
    return make_patch(src, dst, options);
}

auto Patch::apply(const Value& doc) const -> Value {
    auto result = doc;
    apply_in_place(result);
    return result;
}

void Patch::apply_in_place(Value& doc) const {
    for (const auto& op : ops_) {
        jsonpatch_cpp::apply(op, doc);
    }
}

auto Patch::to_json() const -> Value {
    auto result = Value::array();
    for (const auto& op : ops_) {
        result.push_back(operation_to_json(op));
    }
    return result;
}

auto Patch::to_string(int indent) const -> std::string {
    return to_json().dump(indent);
}

auto Patch::to_string(const Serializer& serializer) const -> std::string {
    return serializer(to_json());
}

void to_json(Value& j, const Patch& p) {
    j = p.to_json();
}

}  // namespace jsonpatch_cpp
