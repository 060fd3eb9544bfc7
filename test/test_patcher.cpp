// test_patcher.cpp - Tests for structural edits and minimal text patches

#include <catch2/catch_all.hpp>
#include <cfgtree/patcher.h>
#include <cfgtree/serialization.h>

#include <string>

using namespace cfgtree;

namespace {

Value doc(const char* json)
{
    auto parsed = parse_json(json);
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

// ============================================================
// Structural edits
// ============================================================

TEST_CASE("set_value", "[patcher][structural]") {
    Value root = doc(R"({"a": {"b": 1}, "list": [1, 2]})");
    std::string error;

    SECTION("replace a nested leaf") {
        auto result = set_value(root, Path{"a", "b"}, 5, &error);
        REQUIRE(result.has_value());
        REQUIRE(*result == doc(R"({"a": {"b": 5}, "list": [1, 2]})"));
        REQUIRE(root.at("a").at("b") == Value{1});
    }

    SECTION("new field is appended") {
        auto result = set_value(root, Path{"a", "c"}, "new", &error);
        REQUIRE(result.has_value());
        REQUIRE(to_json(result->at("a"), true) == R"({"b":1,"c":"new"})");
    }

    SECTION("index equal to size appends") {
        auto result = set_value(root, Path{"list", std::size_t{2}}, 3, &error);
        REQUIRE(result.has_value());
        REQUIRE(result->at("list") == Value::array({1, 2, 3}));
    }

    SECTION("empty path replaces the root") {
        auto result = set_value(root, Path{}, Value::array(), &error);
        REQUIRE(result.has_value());
        REQUIRE(*result == Value::array());
    }

    SECTION("index past the end is rejected") {
        REQUIRE_FALSE(set_value(root, Path{"list", std::size_t{5}}, 0, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("traversing a leaf is rejected") {
        REQUIRE_FALSE(set_value(root, Path{"a", "b", "c"}, 0, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("missing intermediate is rejected") {
        REQUIRE_FALSE(set_value(root, Path{"nope", "x"}, 0, &error).has_value());
        REQUIRE(error.find("nope") != std::string::npos);
    }

    SECTION("field segment into an array is rejected") {
        REQUIRE_FALSE(set_value(root, Path{"list", "x"}, 0, &error).has_value());
    }
}

TEST_CASE("remove_value", "[patcher][structural]") {
    Value root = doc(R"({"a": 1, "b": 2, "list": ["x", "y", "z"]})");
    std::string error;

    SECTION("field") {
        auto result = remove_value(root, Path{"a"}, &error);
        REQUIRE(result.has_value());
        REQUIRE(*result == doc(R"({"b": 2, "list": ["x", "y", "z"]})"));
    }

    SECTION("element shifts the rest down") {
        auto result = remove_value(root, Path{"list", std::size_t{0}}, &error);
        REQUIRE(result.has_value());
        REQUIRE(result->at("list") == Value::array({"y", "z"}));
    }

    SECTION("failures") {
        REQUIRE_FALSE(remove_value(root, Path{}, &error).has_value());
        REQUIRE_FALSE(remove_value(root, Path{"missing"}, &error).has_value());
        REQUIRE_FALSE(remove_value(root, Path{"list", std::size_t{3}}, &error).has_value());
    }
}

TEST_CASE("insert_element", "[patcher][structural]") {
    Value root = doc(R"({"list": [1, 3], "obj": {}})");
    std::string error;

    REQUIRE(insert_element(root, Path{"list"}, 1, 2, &error)->at("list") == Value::array({1, 2, 3}));
    REQUIRE(insert_element(root, Path{"list"}, 0, 0, &error)->at("list") == Value::array({0, 1, 3}));
    REQUIRE(insert_element(root, Path{"list"}, 2, 4, &error)->at("list") == Value::array({1, 3, 4}));

    SECTION("past the end") {
        REQUIRE_FALSE(insert_element(root, Path{"list"}, 3, 9, &error).has_value());
    }

    SECTION("not an array") {
        REQUIRE_FALSE(insert_element(root, Path{"obj"}, 0, 9, &error).has_value());
        REQUIRE(error.find("not an array") != std::string::npos);
    }
}

TEST_CASE("move_element", "[patcher][structural]") {
    Value root = doc(R"({"list": ["a", "b", "c"]})");
    std::string error;

    REQUIRE(move_element(root, Path{"list"}, 0, 2, &error)->at("list") == Value::array({"b", "c", "a"}));
    REQUIRE(move_element(root, Path{"list"}, 2, 0, &error)->at("list") == Value::array({"c", "a", "b"}));
    REQUIRE(*move_element(root, Path{"list"}, 1, 1, &error) == root);
    REQUIRE_FALSE(move_element(root, Path{"list"}, 0, 3, &error).has_value());
}

// ============================================================
// Text edits - splice
// ============================================================

TEST_CASE("Minimal edit only touches the edited value", "[patcher][text]") {
    const std::string text = "{\n  \"name\": \"old\",\n  \"count\": 1\n}\n";

    PatchResult result = apply_minimal_edit(text, Path{"name"}, "new");
    REQUIRE(result.ok);
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == "{\n  \"name\": \"new\",\n  \"count\": 1\n}\n");
}

TEST_CASE("Minimal edit keeps unusual spacing", "[patcher][text]") {
    const std::string text = R"({"a" :  1,"b":[1, 2 ,3]})";

    PatchResult result = apply_minimal_edit(text, Path{"b", std::size_t{1}}, 9);
    REQUIRE(result.ok);
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == R"({"a" :  1,"b":[1, 9 ,3]})");
}

TEST_CASE("Minimal edit with a container value follows the indentation", "[patcher][text]") {
    const std::string text =
        "{\n"
        "    \"a\": 1,\n"
        "    \"o\": {\n"
        "        \"x\": 1\n"
        "    }\n"
        "}";

    PatchResult result = apply_minimal_edit(text, Path{"o"}, Value::object({{"y", 2}}));
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text ==
            "{\n"
            "    \"a\": 1,\n"
            "    \"o\": {\n"
            "        \"y\": 2\n"
            "    }\n"
            "}");
}

TEST_CASE("Minimal edit decodes escaped keys", "[patcher][text]") {
    const std::string text = R"({"a\u0062": 1, "s": "x,}"})";

    PatchResult result = apply_minimal_edit(text, Path{"ab"}, 2);
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == R"({"a\u0062": 2, "s": "x,}"})");

    PatchResult after_string = apply_minimal_edit(text, Path{"s"}, true);
    REQUIRE(after_string.strategy == PatchStrategy::Splice);
    REQUIRE(after_string.text == R"({"a\u0062": 1, "s": true})");
}

TEST_CASE("Minimal edit of the root value", "[patcher][text]") {
    PatchResult result = apply_minimal_edit("  [1, 2]\n", Path{}, Value::array({3}));
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == "  [3]\n");
}

// ============================================================
// Text edits - fallback
// ============================================================

TEST_CASE("Duplicate keys fall back to re-serialization", "[patcher][text][fallback]") {
    PatchResult result = apply_minimal_edit(R"({"a":1,"a":2})", Path{"a"}, 5);
    REQUIRE(result.ok);
    REQUIRE(result.strategy == PatchStrategy::Rebuild);
    REQUIRE(result.text == R"({"a":5})");
}

TEST_CASE("A new field is written by re-serializing", "[patcher][text][fallback]") {
    PatchResult result = apply_minimal_edit("{\n    \"a\": 1\n}\n", Path{"b"}, 2);
    REQUIRE(result.ok);
    REQUIRE(result.strategy == PatchStrategy::Rebuild);
    REQUIRE(result.text == "{\n    \"a\": 1,\n    \"b\": 2\n}\n");
}

TEST_CASE("Text that drifted from the tree is rebuilt from the tree", "[patcher][text][fallback]") {
    Value tree = doc(R"({"a": 2, "b": 3})");

    PatchResult result = apply_minimal_edit(R"({"a":1})", Path{"a"}, 5, &tree);
    REQUIRE(result.ok);
    REQUIRE(result.strategy == PatchStrategy::Rebuild);
    REQUIRE(result.text == R"({"a":5,"b":3})");
}

TEST_CASE("Matching tree still allows a splice", "[patcher][text]") {
    Value tree = doc(R"({"a": 1})");
    PatchResult result = apply_minimal_edit(R"({ "a": 1 })", Path{"a"}, 2, &tree);
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == R"({ "a": 2 })");
}

TEST_CASE("Failures are reported, not papered over", "[patcher][text][error]") {
    SECTION("unparsable text without a tree") {
        PatchResult result = apply_minimal_edit("{oops", Path{"a"}, 1);
        REQUIRE_FALSE(result.ok);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("structurally impossible edit") {
        PatchResult result = apply_minimal_edit(R"({"a": 1})", Path{"a", "b"}, 1);
        REQUIRE_FALSE(result.ok);
    }

    SECTION("unparsable text with a tree is rebuilt") {
        Value tree = doc(R"({"a": 1})");
        PatchResult result = apply_minimal_edit("{oops", Path{"a"}, 2, &tree);
        REQUIRE(result.ok);
        REQUIRE(result.strategy == PatchStrategy::Rebuild);
        REQUIRE(result.text == R"({"a":2})");
    }
}

// ============================================================
// Text deletes
// ============================================================

TEST_CASE("Minimal delete removes one member and one separator", "[patcher][text][delete]") {
    const std::string text = R"({"a": 1, "b": 2, "c": 3})";

    SECTION("middle member") {
        PatchResult result = apply_minimal_delete(text, Path{"b"});
        REQUIRE(result.strategy == PatchStrategy::Splice);
        REQUIRE(result.text == R"({"a": 1, "c": 3})");
    }

    SECTION("first member") {
        PatchResult result = apply_minimal_delete(text, Path{"a"});
        REQUIRE(result.text == R"({"b": 2, "c": 3})");
    }

    SECTION("last member") {
        PatchResult result = apply_minimal_delete(text, Path{"c"});
        REQUIRE(result.strategy == PatchStrategy::Splice);
        REQUIRE(result.text == R"({"a": 1, "b": 2})");
    }
}

TEST_CASE("Minimal delete of the only member empties the container", "[patcher][text][delete]") {
    PatchResult result = apply_minimal_delete(R"({"keep": {"only": true}})", Path{"keep", "only"});
    REQUIRE(result.strategy == PatchStrategy::Splice);
    REQUIRE(result.text == R"({"keep": {}})");
}

TEST_CASE("Minimal delete in pretty text", "[patcher][text][delete]") {
    const std::string text = "{\n  \"a\": 1,\n  \"list\": [\n    1,\n    2\n  ]\n}\n";

    SECTION("last field") {
        PatchResult result = apply_minimal_delete(text, Path{"list"});
        REQUIRE(result.text == "{\n  \"a\": 1\n}\n");
    }

    SECTION("first element") {
        PatchResult result = apply_minimal_delete(text, Path{"list", std::size_t{0}});
        REQUIRE(result.strategy == PatchStrategy::Splice);
        REQUIRE(result.text == "{\n  \"a\": 1,\n  \"list\": [\n    2\n  ]\n}\n");
    }
}

TEST_CASE("Minimal delete of a missing path fails", "[patcher][text][delete]") {
    PatchResult result = apply_minimal_delete(R"({"a": 1})", Path{"b"});
    REQUIRE_FALSE(result.ok);
    REQUIRE_FALSE(result.error.empty());
}
