// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// Two documents separated by a NUL byte, as fuzz_diff expects.
static auto diff_seed(const jsonpatch_cpp::Value& src, const jsonpatch_cpp::Value& dst) -> std::string {
    auto seed = src.dump();
    seed += '\0';
    seed += dst.dump();
    return seed;
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    for (const auto* sub : {"/pointer", "/patch", "/diff"}) {
        fs::create_directories(dir + sub);
    }

    // Pointers
    write_seed(dir + "/pointer/seed_root.txt", "");
    write_seed(dir + "/pointer/seed_nested.txt", "/a/1/b");
    write_seed(dir + "/pointer/seed_escaped.txt", "/~0~1/~01");
    write_seed(dir + "/pointer/seed_dash.txt", "/a/-");

    // Patches: one per operation kind, then a mixed one
    write_seed(dir + "/patch/seed_add.json", R"([{"op":"add","path":"/foo/-","value":1}])");
    write_seed(dir + "/patch/seed_remove.json", R"([{"op":"remove","path":"/obj/a"}])");
    write_seed(dir + "/patch/seed_replace.json", R"([{"op":"replace","path":"/n","value":"x"}])");
    write_seed(dir + "/patch/seed_move.json", R"([{"op":"move","from":"/foo/0","path":"/obj/c"}])");
    write_seed(dir + "/patch/seed_copy.json", R"([{"op":"copy","from":"/obj","path":"/foo/1"}])");
    write_seed(dir + "/patch/seed_test.json", R"([{"op":"test","path":"/obj/b/0","value":true}])");

    // Diff pairs, produced from documents whose patches exercise moves
    {
        const auto src = jsonpatch_cpp::Value::parse(R"({"a": [1, 2, 3], "b": {"c": "d"}})");
        const auto dst = jsonpatch_cpp::Value::parse(R"({"x": [1, 2, 3], "b": {"c": "e"}})");
        write_seed(dir + "/diff/seed_rename.bin", diff_seed(src, dst));
        write_seed(dir + "/patch/seed_mixed.json", jsonpatch_cpp::make_patch(src, dst).to_string());
    }
    write_seed(dir + "/diff/seed_reverse.bin",
               diff_seed(jsonpatch_cpp::Value::parse("[1, 2, 3, 4]"), jsonpatch_cpp::Value::parse("[4, 3, 2, 1]")));
    write_seed(dir + "/diff/seed_types.bin",
               diff_seed(jsonpatch_cpp::Value::parse(R"({"x": 1})"), jsonpatch_cpp::Value::parse(R"({"x": true})")));

    return 0;
}
