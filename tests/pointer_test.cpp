#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;
using json = nlohmann::ordered_json;

// =============================================================================
// Parsing and formatting
// =============================================================================

TEST(Pointer, empty_text_is_root) {
    const auto p = Pointer::parse("");
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.to_string(), "");
}

TEST(Pointer, parse_splits_tokens) {
    const auto p = Pointer::parse("/foo/0/bar");
    EXPECT_EQ(p.tokens(), (std::vector<std::string>{"foo", "0", "bar"}));
    EXPECT_EQ(p.size(), 3u);
    EXPECT_EQ(p.back(), "bar");
}

TEST(Pointer, single_slash_is_the_empty_key) {
    const auto p = Pointer::parse("/");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.back(), "");
}

TEST(Pointer, parse_unescapes_tokens) {
    const auto p = Pointer::parse("/a~1b/m~0n/~01");
    EXPECT_EQ(p.tokens(), (std::vector<std::string>{"a/b", "m~n", "~1"}));
}

TEST(Pointer, to_string_escapes_tokens) {
    const auto p = Pointer{"a/b", "m~n"};
    EXPECT_EQ(p.to_string(), "/a~1b/m~0n");
}

TEST(Pointer, text_round_trip) {
    for (const auto* text : {"", "/", "/a", "/a/0/-", "/~0~1", "/a~1b/c%d/e^f/ /k\"l"}) {
        EXPECT_EQ(Pointer::parse(text).to_string(), text);
    }
}

TEST(Pointer, missing_leading_slash_is_invalid) {
    EXPECT_THROW(Pointer::parse("foo"), InvalidPointer);
    EXPECT_THROW(Pointer::parse("#/foo"), InvalidPointer);
}

TEST(Pointer, bad_escapes_are_invalid) {
    EXPECT_THROW(Pointer::parse("/a~"), InvalidPointer);
    EXPECT_THROW(Pointer::parse("/a~2"), InvalidPointer);
    EXPECT_THROW(Pointer::unescape("~x"), InvalidPointer);
}

TEST(Pointer, escape_and_unescape) {
    EXPECT_EQ(Pointer::escape("~/"), "~0~1");
    EXPECT_EQ(Pointer::unescape("~0~1"), "~/");
    EXPECT_EQ(Pointer::unescape("~01"), "~1");
}

// =============================================================================
// Derived pointers
// =============================================================================

TEST(Pointer, parent_drops_last_token) {
    EXPECT_EQ(Pointer::parse("/a/b").parent(), Pointer::parse("/a"));
    EXPECT_EQ(Pointer::parse("/a").parent(), Pointer{});
    EXPECT_EQ(Pointer{}.parent(), Pointer{});
}

TEST(Pointer, append_returns_new_pointer) {
    const auto base = Pointer::parse("/a");
    const auto child = base.append(std::string{"b"});
    const auto item = base.append(std::size_t{3});

    EXPECT_EQ(base.to_string(), "/a");
    EXPECT_EQ(child.to_string(), "/a/b");
    EXPECT_EQ(item.to_string(), "/a/3");
}

TEST(Pointer, with_back_leaves_receiver_untouched) {
    const auto p = Pointer::parse("/list/1");
    const auto q = p.with_back("2");
    EXPECT_EQ(p.to_string(), "/list/1");
    EXPECT_EQ(q.to_string(), "/list/2");
}

TEST(Pointer, contains_is_prefix_test) {
    const auto p = Pointer::parse("/a/b/c");
    EXPECT_TRUE(p.contains(Pointer::parse("/a")));
    EXPECT_TRUE(p.contains(Pointer::parse("/a/b/c")));
    EXPECT_TRUE(p.contains(Pointer{}));
    EXPECT_FALSE(p.contains(Pointer::parse("/a/bc")));
    EXPECT_FALSE(Pointer::parse("/a").contains(p));
}

TEST(Pointer, equality_and_ordering) {
    EXPECT_EQ(Pointer::parse("/a/1"), (Pointer{"a", "1"}));
    EXPECT_NE(Pointer::parse("/a/1"), Pointer::parse("/a/2"));
    EXPECT_LT(Pointer::parse("/a/1"), Pointer::parse("/a/2"));
}

TEST(Pointer, json_serialization) {
    const auto j = json(Pointer::parse("/a~1b"));
    EXPECT_EQ(j, "/a~1b");
    EXPECT_EQ(j.get<Pointer>(), Pointer{"a/b"});
    EXPECT_THROW(json(5).get<Pointer>(), InvalidPointer);
}

// =============================================================================
// Array indexes
// =============================================================================

TEST(ParseIndex, accepts_canonical_digits) {
    EXPECT_EQ(parse_index("0"), std::size_t{0});
    EXPECT_EQ(parse_index("12"), std::size_t{12});
}

TEST(ParseIndex, rejects_everything_else) {
    EXPECT_FALSE(parse_index("").has_value());
    EXPECT_FALSE(parse_index("01").has_value());
    EXPECT_FALSE(parse_index("-1").has_value());
    EXPECT_FALSE(parse_index("+1").has_value());
    EXPECT_FALSE(parse_index("1a").has_value());
    EXPECT_FALSE(parse_index("-").has_value());
}

// =============================================================================
// Resolution
// =============================================================================

class PointerResolve : public ::testing::Test {
protected:
    json doc = json::parse(R"({
        "foo": ["bar", "baz"],
        "": 0,
        "a/b": 1,
        "m~n": 8,
        "7": "seven",
        "nested": {"list": [{"x": 1}]}
    })");
};

TEST_F(PointerResolve, rfc6901_examples) {
    EXPECT_EQ(resolve(doc, Pointer::parse("")), doc);
    EXPECT_EQ(resolve(doc, Pointer::parse("/foo")), json::parse(R"(["bar", "baz"])"));
    EXPECT_EQ(resolve(doc, Pointer::parse("/foo/0")), "bar");
    EXPECT_EQ(resolve(doc, Pointer::parse("/")), 0);
    EXPECT_EQ(resolve(doc, Pointer::parse("/a~1b")), 1);
    EXPECT_EQ(resolve(doc, Pointer::parse("/m~0n")), 8);
}

TEST_F(PointerResolve, numeric_token_is_a_key_in_objects) {
    EXPECT_EQ(resolve(doc, Pointer::parse("/7")), "seven");
}

TEST_F(PointerResolve, nested_lookup) {
    EXPECT_EQ(resolve(doc, Pointer::parse("/nested/list/0/x")), 1);
}

TEST_F(PointerResolve, resolve_returns_mutable_reference) {
    resolve(doc, Pointer::parse("/foo/1")) = "qux";
    EXPECT_EQ(doc["foo"][1], "qux");
}

TEST_F(PointerResolve, failures_throw_resolution_error) {
    EXPECT_THROW(resolve(doc, Pointer::parse("/missing")), PointerResolutionError);
    EXPECT_THROW(resolve(doc, Pointer::parse("/foo/2")), PointerResolutionError);
    EXPECT_THROW(resolve(doc, Pointer::parse("/foo/-")), PointerResolutionError);
    EXPECT_THROW(resolve(doc, Pointer::parse("/foo/01")), PointerResolutionError);
    EXPECT_THROW(resolve(doc, Pointer::parse("/foo/0/x")), PointerResolutionError);
}

TEST_F(PointerResolve, try_resolve_does_not_throw) {
    const auto& cdoc = doc;
    ASSERT_NE(try_resolve(cdoc, Pointer::parse("/foo/1")), nullptr);
    EXPECT_EQ(*try_resolve(cdoc, Pointer::parse("/foo/1")), "baz");
    EXPECT_EQ(try_resolve(cdoc, Pointer::parse("/foo/5")), nullptr);
    EXPECT_EQ(try_resolve(cdoc, Pointer::parse("/foo/-")), nullptr);
    EXPECT_EQ(try_resolve(cdoc, Pointer::parse("/nope/x")), nullptr);
}

TEST_F(PointerResolve, walk_one_step) {
    EXPECT_EQ(walk(doc, "foo"), json::parse(R"(["bar", "baz"])"));
    EXPECT_EQ(walk(doc["foo"], "1"), "baz");
    EXPECT_THROW(walk(doc["foo"], "x"), PointerResolutionError);
    EXPECT_THROW(walk(doc["a/b"], "0"), PointerResolutionError);
}

TEST_F(PointerResolve, resolve_parent_returns_container_and_key) {
    auto loc = resolve_parent(doc, Pointer::parse("/nested/list/0"));
    ASSERT_NE(loc.container, nullptr);
    EXPECT_TRUE(loc.container->is_array());
    ASSERT_TRUE(loc.key.has_value());
    EXPECT_EQ(*loc.key, "0");
}

TEST_F(PointerResolve, resolve_parent_of_root_is_empty) {
    auto loc = resolve_parent(doc, Pointer{});
    EXPECT_EQ(loc.container, nullptr);
    EXPECT_FALSE(loc.key.has_value());
}

TEST_F(PointerResolve, resolve_parent_does_not_require_the_last_token) {
    auto loc = resolve_parent(doc, Pointer::parse("/foo/-"));
    ASSERT_NE(loc.container, nullptr);
    EXPECT_EQ(*loc.key, "-");
}

TEST_F(PointerResolve, resolve_parent_fails_on_missing_intermediate) {
    EXPECT_THROW(resolve_parent(doc, Pointer::parse("/missing/x")), PointerResolutionError);
}
