#include <jsonpatch-cpp/jsonpatch.hpp>

namespace jsonpatch_cpp {

auto apply_patch(const Value& doc, const Value& patch) -> Value {
    return Patch::from_json(patch).apply(doc);
}

auto apply_patch(const Value& doc, std::string_view patch_text) -> Value {
    return Patch::from_string(patch_text).apply(doc);
}

void apply_patch_in_place(Value& doc, const Value& patch) {
    Patch::from_json(patch).apply_in_place(doc);
}

}  // namespace jsonpatch_cpp
