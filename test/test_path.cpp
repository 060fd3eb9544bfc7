// test_path.cpp - Tests for Path and canonical path strings
// Parsing, escaping, ancestry and path resolution

#include <catch2/catch_all.hpp>
#include <cfgtree/path.h>
#include <cfgtree/path_utils.h>
#include <cfgtree/value.h>

#include <string>
#include <vector>

using namespace cfgtree;

// ============================================================
// Canonical form
// ============================================================

TEST_CASE("Path canonical string", "[path][canonical]") {
    SECTION("root is the empty string") {
        REQUIRE(Path{}.to_string().empty());
        auto parsed = Path::parse("");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->empty());
    }

    SECTION("fields and indices") {
        Path path{"items", std::size_t{1}, "name"};
        REQUIRE(path.to_string() == "items.[1].name");

        auto parsed = Path::parse("items.[1].name");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->size() == 3);
        REQUIRE(std::get<std::string>((*parsed)[0]) == "items");
        REQUIRE(std::get<std::size_t>((*parsed)[1]) == 1);
        REQUIRE(std::get<std::string>((*parsed)[2]) == "name");
        REQUIRE(*parsed == path);
    }

    SECTION("leading index") {
        auto parsed = Path::parse("[0].id");
        REQUIRE(parsed.has_value());
        REQUIRE(std::holds_alternative<std::size_t>(parsed->front()));
    }
}

TEST_CASE("Field names are escaped", "[path][escape]") {
    SECTION("separator characters") {
        Path path{"a.b", "c[0]", "back\\slash"};
        std::string canonical = path.to_string();
        REQUIRE(canonical == "a\\.b.c\\[0\\].back\\\\slash");

        auto parsed = Path::parse(canonical);
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == path);
    }

    SECTION("empty field name") {
        Path path{"", "x"};
        REQUIRE(path.to_string() == "\\_.x");
        auto parsed = Path::parse("\\_.x");
        REQUIRE(parsed.has_value());
        REQUIRE(std::get<std::string>(parsed->front()).empty());
    }

    SECTION("a field that looks like an index stays a field") {
        Path path{"[1]"};
        auto parsed = Path::parse(path.to_string());
        REQUIRE(parsed.has_value());
        REQUIRE(std::holds_alternative<std::string>(parsed->front()));
    }

    SECTION("distinct paths give distinct strings") {
        REQUIRE(Path{"a.b"}.to_string() != Path{"a", "b"}.to_string());
        REQUIRE(Path{"1"}.to_string() != Path{std::size_t{1}}.to_string());
    }
}

TEST_CASE("Malformed canonical strings", "[path][parse]") {
    for (const char* bad : {"a..b", ".a", "a.", "[x]", "[]", "a\\q", "a]", "a[1]", "a\\"}) {
        INFO(bad);
        REQUIRE_FALSE(Path::parse(bad).has_value());
    }
}

// ============================================================
// Ancestry
// ============================================================

TEST_CASE("Path parent and ancestors", "[path][ancestry]") {
    Path path{"a", std::size_t{2}, "c"};

    REQUIRE(path.parent() == Path{"a", std::size_t{2}});
    REQUIRE(Path{}.parent().empty());
    REQUIRE(path.child("d").to_string() == "a.[2].c.d");

    auto ancestors = path.ancestors();
    REQUIRE(ancestors.size() == 3);
    REQUIRE(ancestors[0].empty());
    REQUIRE(ancestors[1] == Path{"a"});
    REQUIRE(ancestors[2] == Path{"a", std::size_t{2}});

    REQUIRE(Path{"a"}.is_prefix_of(path));
    REQUIRE(path.is_prefix_of(path));
    REQUIRE(Path{}.is_prefix_of(path));
    REQUIRE_FALSE(Path{"b"}.is_prefix_of(path));
    REQUIRE_FALSE(path.is_prefix_of(Path{"a"}));
}

TEST_CASE("path_has_prefix respects segment boundaries", "[path][prefix]") {
    REQUIRE(path_has_prefix("a.b", "a"));
    REQUIRE(path_has_prefix("a.b", "a.b"));
    REQUIRE(path_has_prefix("a.b", ""));
    REQUIRE_FALSE(path_has_prefix("a.bc", "a.b"));
    REQUIRE_FALSE(path_has_prefix("a", "a.b"));
    REQUIRE(path_has_prefix("items.[1].name", "items.[1]"));
}

TEST_CASE("ancestor_paths lists the reveal set", "[path][prefix]") {
    REQUIRE(ancestor_paths("items.[1].name") == std::vector<std::string>{"", "items", "items.[1]"});
    REQUIRE(ancestor_paths("top") == std::vector<std::string>{""});
    REQUIRE(ancestor_paths("").empty());
    REQUIRE(ancestor_paths("a..b").empty());
}

TEST_CASE("join_path and make_path_set", "[path]") {
    REQUIRE(join_path("", PathElement{std::string{"x"}}) == "x");
    REQUIRE(join_path("items", PathElement{std::size_t{2}}) == "items.[2]");
    REQUIRE(join_path("a", PathElement{std::string{"b.c"}}) == "a.b\\.c");

    PathSet set = make_path_set({"a", "b", "a"});
    REQUIRE(set.size() == 2);
    REQUIRE(set.count("a") == 1);
    REQUIRE(path_to_display("") == "(root)");
}

// ============================================================
// Resolution
// ============================================================

TEST_CASE("Path resolution against a tree", "[path][resolve]") {
    Value doc = Value::object({
        {"items", Value::array({Value::object({{"name", "first"}}), "second"})},
        {"count", 2},
    });

    SECTION("find_at_path") {
        const Value* name = find_at_path(doc, Path{"items", std::size_t{0}, "name"});
        REQUIRE(name != nullptr);
        REQUIRE(*name == Value{"first"});
        REQUIRE(find_at_path(doc, Path{}) == &doc);
    }

    SECTION("failures resolve to nothing") {
        REQUIRE(find_at_path(doc, Path{"items", std::size_t{5}}) == nullptr);
        REQUIRE(find_at_path(doc, Path{"count", "x"}) == nullptr);
        REQUIRE(find_at_path(doc, Path{"items", "name"}) == nullptr);
        REQUIRE(find_at_path(doc, Path{std::size_t{0}}) == nullptr);
    }

    SECTION("get_at_path with canonical strings") {
        REQUIRE(get_at_path(doc, "items.[1]") == Value{"second"});
        REQUIRE_FALSE(get_at_path(doc, "items.[9]").has_value());
        REQUIRE_FALSE(get_at_path(doc, "items..x").has_value());
    }
}
