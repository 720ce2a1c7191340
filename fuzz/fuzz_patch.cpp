// Fuzz target for Patch::from_string() + apply(): exercises decoding and
// every operation against a fixed document.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    static const auto doc = jsonpatch_cpp::Value::parse(
        R"({"foo": ["bar", "baz"], "obj": {"a": 1, "b": [true, null]}, "n": 1.5})");

    try {
        const auto patch = jsonpatch_cpp::Patch::from_string(text);

        // Round-trip: a decoded patch must encode to an equal patch
        if (jsonpatch_cpp::Patch::from_json(patch.to_json()) != patch) std::abort();

        auto out = patch.apply(doc);
        (void)out;
    } catch (const jsonpatch_cpp::Exception&) {
        // malformed patches and failed applications are expected
    }
    return 0;
}
