// diff_demo: computing patches between two versions of a document
//
// Demonstrates:
//   - make_patch() with move detection and replace merging
//   - Shipping a diff as text and replaying it on the first version
//   - A custom serializer in DiffOptions
//
// Build: cmake -S . -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
//        cmake --build build
// Run:   ./build/examples/diff_demo

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;
using json = nlohmann::ordered_json;

static void show(const char* label, const json& src, const json& dst,
                 const jp::DiffOptions& options = {}) {
    auto patch = jp::make_patch(src, dst, options);
    std::printf("%s\n  src:   %s\n  dst:   %s\n  patch: %s\n", label, src.dump().c_str(),
                dst.dump().c_str(), patch.to_string().c_str());
}

int main() {
    // -- Move detection -------------------------------------------------------
    show("Renamed member",
         json::parse(R"({"a": [1, 2, 3]})"),
         json::parse(R"({"b": [1, 2, 3]})"));
    show("Element moved between arrays",
         json::parse(R"({"todo": ["write", "test"], "done": []})"),
         json::parse(R"({"todo": ["write"], "done": ["test"]})"));

    // -- Remove + add at one path is a replace --------------------------------
    show("Changed scalar", json::parse(R"({"x": 1})"), json::parse(R"({"x": 2})"));
    show("Number vs boolean", json::parse(R"({"x": 1})"), json::parse(R"({"x": true})"));

    // -- Positional list diff -------------------------------------------------
    show("Front insert", json::parse(R"(["a", "b", "c"])"), json::parse(R"(["x", "a", "b", "c"])"));

    // -- Ship as text, replay -------------------------------------------------
    const auto v1 = json::parse(R"({"users": [{"name": "ann"}, {"name": "bob"}], "count": 2})");
    const auto v2 = json::parse(R"({"users": [{"name": "bob"}], "count": 1, "rev": 7})");
    const auto wire = jp::make_patch(v1, v2).to_string(2);
    std::printf("Wire patch:\n%s\n", wire.c_str());
    const auto replayed = jp::apply_patch(v1, std::string_view{wire});
    std::printf("Replay matches: %s\n", jp::values_equal(replayed, v2) ? "yes" : "no");

    // -- Custom equality ------------------------------------------------------
    auto options = jp::DiffOptions{};
    options.serializer = [](const jp::Value& v) {
        auto text = v.dump();
        std::ranges::transform(text, text.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return text;
    };
    show("Case-insensitive", json::parse(R"({"name": "Ann"})"), json::parse(R"({"name": "ANN"})"),
         options);

    return 0;
}
