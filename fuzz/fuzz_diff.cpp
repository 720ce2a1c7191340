// Fuzz target for make_patch(): the input is split into two JSON texts;
// whenever both parse, the computed patch must turn the first into the second.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = text.find('\0');
    if (split == std::string_view::npos) return 0;

    auto src = jsonpatch_cpp::Value::parse(text.substr(0, split), nullptr, false);
    auto dst = jsonpatch_cpp::Value::parse(text.substr(split + 1), nullptr, false);
    if (src.is_discarded() || dst.is_discarded()) return 0;

    try {
        const auto patch = jsonpatch_cpp::make_patch(src, dst);
        if (!jsonpatch_cpp::values_equal(patch.apply(src), dst)) std::abort();
    } catch (const jsonpatch_cpp::DepthExceeded&) {
        // nesting beyond the depth guard
    }
    return 0;
}
