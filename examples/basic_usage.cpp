// basic_usage: demonstrates the core jsonpatch-cpp API
//
// Shows building patches from JSON text and from typed operations,
// applying them by copy and in place, and the exception hierarchy.
//
// Build: cmake -S . -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
//        cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;
using json = nlohmann::ordered_json;

int main() {
    auto doc = json::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs"],
        "config": {"theme": "dark"}
    })");

    // -- Patch from wire-format text ------------------------------------------
    auto patch = jp::Patch::from_string(R"([
        {"op": "add", "path": "/items/-", "value": "Bread"},
        {"op": "replace", "path": "/config/theme", "value": "light"},
        {"op": "test", "path": "/title", "value": "Shopping List"}
    ])");
    auto updated = patch.apply(doc);
    std::printf("After text patch:  %s\n", updated.dump().c_str());

    // -- Patch from typed operations ------------------------------------------
    auto typed = jp::Patch{std::vector<jp::Operation>{
        jp::MoveOp{.from = jp::Pointer::parse("/items/0"), .path = jp::Pointer::parse("/items/-")},
        jp::CopyOp{.from = jp::Pointer::parse("/title"), .path = jp::Pointer{"config", "label"}},
        jp::RemoveOp{.path = jp::Pointer::parse("/config/theme")},
    }};
    std::printf("Typed patch:       %s\n", typed.to_string().c_str());
    typed.apply_in_place(updated);
    std::printf("After typed patch: %s\n", updated.dump().c_str());

    // -- Pointers -------------------------------------------------------------
    auto ptr = jp::Pointer::parse("/config/label");
    std::printf("%s -> %s\n", ptr.to_string().c_str(), jp::resolve(updated, ptr).dump().c_str());
    if (jp::try_resolve(updated, jp::Pointer::parse("/config/theme")) == nullptr) {
        std::printf("/config/theme is gone\n");
    }

    // -- One-call entry point -------------------------------------------------
    auto once = jp::apply_patch(doc, R"([{"op": "remove", "path": "/items/1"}])");
    std::printf("apply_patch:       %s\n", once.dump().c_str());

    // -- Errors ---------------------------------------------------------------
    const char* failing[] = {
        R"([{"op": "add", "path": "/items/9", "value": 1}])",
        R"([{"op": "test", "path": "/title", "value": "Todo"}])",
        R"([{"op": "jump", "path": "/title"}])",
        R"([{"op": "remove", "path": "items"}])",
    };
    for (const auto* text : failing) {
        try {
            (void)jp::apply_patch(doc, text);
        } catch (const jp::Exception& e) {
            std::fprintf(stderr, "%-18s %s\n", std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
        }
    }

    return 0;
}
