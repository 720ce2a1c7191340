// patch_tool: apply or compute patches between JSON files
//
// Usage:
//   patch_tool apply <document.json> <patch.json>   print the patched document
//   patch_tool diff  <source.json> <target.json>    print the patch
//
// Build: cmake -S . -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
//        cmake --build build
// Run:   ./build/examples/patch_tool diff a.json b.json

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace jp = jsonpatch_cpp;
using json = nlohmann::ordered_json;

static auto load(const char* path) -> std::optional<json> {
    auto in = std::ifstream{path};
    if (!in) {
        std::fprintf(stderr, "cannot open %s\n", path);
        return std::nullopt;
    }
    auto doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        std::fprintf(stderr, "%s is not valid JSON\n", path);
        return std::nullopt;
    }
    return doc;
}

int main(int argc, char** argv) {
    if (argc != 4) {
        std::fprintf(stderr, "usage: %s apply|diff <a.json> <b.json>\n", argv[0]);
        return 2;
    }
    const auto command = std::string_view{argv[1]};
    auto a = load(argv[2]);
    auto b = load(argv[3]);
    if (!a || !b) return 1;

    try {
        if (command == "apply") {
            std::printf("%s\n", jp::apply_patch(*a, *b).dump(2).c_str());
        } else if (command == "diff") {
            std::printf("%s\n", jp::make_patch(*a, *b).to_string(2).c_str());
        } else {
            std::fprintf(stderr, "unknown command '%s'\n", argv[1]);
            return 2;
        }
    } catch (const jp::Exception& e) {
        std::fprintf(stderr, "%s: %s\n", std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
    return 0;
}
