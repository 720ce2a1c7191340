// Fuzz target for Pointer::parse(): any text that parses must format back
// to itself and resolve without crashing.

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto p = jsonpatch_cpp::Pointer::parse(text);
        if (p.to_string() != text) std::abort();

        static const auto doc = jsonpatch_cpp::Value::parse(R"({"a": [1, {"b": null}], "": {"~/": 0}})");
        auto found = jsonpatch_cpp::try_resolve(doc, p);
        (void)found;
    } catch (const jsonpatch_cpp::InvalidPointer&) {
        // rejected input is fine
    }
    return 0;
}
