#include <jsonpatch-cpp/jsonpatch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace jp = jsonpatch_cpp;
using json = nlohmann::ordered_json;

// =============================================================================
// apply_patch
// =============================================================================

TEST(ApplyPatch, add_dash_appends) {
    const auto doc = json::parse(R"({"a": [1, 2]})");
    const auto patch = json::parse(R"([{"op": "add", "path": "/a/-", "value": 5}])");
    EXPECT_EQ(jp::apply_patch(doc, patch), json::parse(R"({"a": [1, 2, 5]})"));
}

TEST(ApplyPatch, out_of_range_add_is_conflict) {
    const auto doc = json::parse(R"({"a": [1, 2]})");
    const auto patch = json::parse(R"([{"op": "add", "path": "/a/9", "value": 1}])");
    EXPECT_THROW(jp::apply_patch(doc, patch), jp::Conflict);
}

TEST(ApplyPatch, accepts_patch_text) {
    const auto doc = json::parse(R"({"foo": "bar"})");
    EXPECT_EQ(jp::apply_patch(doc, R"([{"op": "remove", "path": "/foo"}])"), json::object());
    EXPECT_EQ(jp::apply_patch(doc, std::string_view{R"([])"}), doc);
    EXPECT_THROW(jp::apply_patch(doc, "not json"), jp::InvalidPatch);
}

TEST(ApplyPatch, leaves_input_untouched) {
    const auto doc = json::parse(R"({"foo": "bar"})");
    const auto out = jp::apply_patch(doc, json::parse(R"([{"op": "add", "path": "/baz", "value": 1}])"));
    EXPECT_EQ(doc, json::parse(R"({"foo": "bar"})"));
    EXPECT_EQ(out, json::parse(R"({"foo": "bar", "baz": 1})"));
}

TEST(ApplyPatch, member_order_is_kept) {
    const auto doc = json::parse(R"({"zeta": 1, "alpha": 2})");
    const auto out = jp::apply_patch(doc, R"([
        {"op": "add", "path": "/mid", "value": 3},
        {"op": "replace", "path": "/zeta", "value": 0}
    ])");
    EXPECT_EQ(out.dump(), R"({"zeta":0,"alpha":2,"mid":3})");
}

TEST(ApplyPatch, test_ignores_member_order) {
    const auto doc = json::parse(R"({"obj": {"zeta": 1, "alpha": [{"b": 1, "a": 2}]}})");
    EXPECT_NO_THROW((void)jp::apply_patch(doc, R"([
        {"op": "test", "path": "/obj", "value": {"alpha": [{"a": 2, "b": 1}], "zeta": 1}}
    ])"));
    EXPECT_THROW((void)jp::apply_patch(doc, R"([
        {"op": "test", "path": "/obj", "value": {"alpha": [{"a": 2}], "zeta": 1}}
    ])"), jp::TestFailed);
}

TEST(ApplyPatch, malformed_patch_applies_nothing) {
    auto doc = json::parse(R"({"foo": "bar"})");
    const auto patch = json::parse(R"([
        {"op": "add", "path": "/baz", "value": 1},
        {"op": "jump", "path": "/foo"}
    ])");
    EXPECT_THROW(jp::apply_patch_in_place(doc, patch), jp::InvalidPatch);
    EXPECT_EQ(doc, json::parse(R"({"foo": "bar"})"));
}

TEST(ApplyPatch, in_place_mutates_document) {
    auto doc = json::parse(R"({"foo": ["bar"]})");
    jp::apply_patch_in_place(doc, json::parse(R"([
        {"op": "add", "path": "/foo/0", "value": "baz"},
        {"op": "copy", "from": "/foo", "path": "/qux"}
    ])"));
    EXPECT_EQ(doc, json::parse(R"({"foo": ["baz", "bar"], "qux": ["baz", "bar"]})"));
}

TEST(ApplyPatch, test_failure_is_distinct_from_conflict) {
    const auto doc = json::parse(R"({"a": 1})");
    const auto patch = json::parse(R"([{"op": "test", "path": "/a", "value": 2}])");
    try {
        (void)jp::apply_patch(doc, patch);
        FAIL() << "expected TestFailed";
    } catch (const jp::Exception& e) {
        EXPECT_EQ(e.kind(), jp::ErrorKind::test_failed);
    }
}

// =============================================================================
// RFC 6902 appendix A
// =============================================================================

TEST(Rfc6902, appendix_a_examples) {
    struct Case { const char* doc; const char* patch; const char* expected; };
    const Case cases[] = {
        {R"({"foo": "bar"})",
         R"([{"op": "add", "path": "/baz", "value": "qux"}])",
         R"({"baz": "qux", "foo": "bar"})"},
        {R"({"foo": ["bar", "baz"]})",
         R"([{"op": "add", "path": "/foo/1", "value": "qux"}])",
         R"({"foo": ["bar", "qux", "baz"]})"},
        {R"({"baz": "qux", "foo": "bar"})",
         R"([{"op": "remove", "path": "/baz"}])",
         R"({"foo": "bar"})"},
        {R"({"foo": ["bar", "qux", "baz"]})",
         R"([{"op": "remove", "path": "/foo/1"}])",
         R"({"foo": ["bar", "baz"]})"},
        {R"({"baz": "qux", "foo": "bar"})",
         R"([{"op": "replace", "path": "/baz", "value": "boo"}])",
         R"({"baz": "boo", "foo": "bar"})"},
        {R"({"foo": {"bar": "baz", "waldo": "fred"}, "qux": {"corge": "grault"}})",
         R"([{"op": "move", "from": "/foo/waldo", "path": "/qux/thud"}])",
         R"({"foo": {"bar": "baz"}, "qux": {"corge": "grault", "thud": "fred"}})"},
        {R"({"foo": ["all", "grass", "cows", "eat"]})",
         R"([{"op": "move", "from": "/foo/1", "path": "/foo/3"}])",
         R"({"foo": ["all", "cows", "eat", "grass"]})"},
        {R"({"baz": "qux", "foo": ["a", 2, "c"]})",
         R"([{"op": "test", "path": "/baz", "value": "qux"}, {"op": "test", "path": "/foo/1", "value": 2}])",
         R"({"baz": "qux", "foo": ["a", 2, "c"]})"},
        {R"({"foo": "bar"})",
         R"([{"op": "add", "path": "/child", "value": {"grandchild": {}}}])",
         R"({"foo": "bar", "child": {"grandchild": {}}})"},
        {R"({"foo": "bar"})",
         R"([{"op": "add", "path": "/baz", "value": "qux", "xyz": 123}])",
         R"({"foo": "bar", "baz": "qux"})"},
        {R"({"foo": ["bar"]})",
         R"([{"op": "add", "path": "/foo/-", "value": ["abc", "def"]}])",
         R"({"foo": ["bar", ["abc", "def"]]})"},
        {R"({"/": 9, "~1": 10})",
         R"([{"op": "test", "path": "/~01", "value": 10}])",
         R"({"/": 9, "~1": 10})"},
    };
    for (const auto& c : cases) {
        EXPECT_TRUE(jp::values_equal(jp::apply_patch(json::parse(c.doc), json::parse(c.patch)),
                                     json::parse(c.expected)))
            << c.patch;
    }
}

TEST(Rfc6902, appendix_a_errors) {
    EXPECT_THROW(jp::apply_patch(json::parse(R"({"baz": "qux", "foo": "bar"})"),
                                 json::parse(R"([{"op": "test", "path": "/baz", "value": "bar"}])")),
                 jp::TestFailed);
    EXPECT_THROW(jp::apply_patch(json::parse(R"({"foo": "bar"})"),
                                 json::parse(R"([{"op": "add", "path": "/baz/bat", "value": "qux"}])")),
                 jp::PointerResolutionError);
    EXPECT_THROW(jp::apply_patch(json::parse(R"({"/": 9, "~1": 10})"),
                                 json::parse(R"([{"op": "test", "path": "/~01", "value": "10"}])")),
                 jp::TestFailed);
}

// =============================================================================
// make_patch through the umbrella header
// =============================================================================

TEST(MakePatch, patch_reproduces_target) {
    const auto src = json::parse(R"({"users": [{"name": "a"}, {"name": "b"}], "count": 2})");
    const auto dst = json::parse(R"({"users": [{"name": "b"}], "count": 1, "updated": true})");
    const auto patch = jp::make_patch(src, dst);
    EXPECT_TRUE(jp::values_equal(jp::apply_patch(src, patch.to_json()), dst));
}
