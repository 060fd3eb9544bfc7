// test_diff.cpp - Tests for change classification
// Plain diff, hybrid diff and the ChangeMap helpers

#include <catch2/catch_all.hpp>
#include <cfgtree/serialization.h>
#include <cfgtree/value.h>
#include <cfgtree/value_diff.h>

#include <string>
#include <thread>
#include <vector>

using namespace cfgtree;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value doc(const char* json)
{
    auto parsed = parse_json(json);
    REQUIRE(parsed.has_value());
    return *parsed;
}

bool has(const ChangeMap& changes, const std::string& path, ChangeKind kind)
{
    auto found = changes.find(path);
    return found && *found == kind;
}

} // namespace

// ============================================================
// Plain diff
// ============================================================

TEST_CASE("Identical trees produce no changes", "[diff][plain]") {
    Value a = doc(R"({"a": {"x": 1, "list": [1, 2]}, "b": "s"})");
    REQUIRE(compare(a, &a).empty());
}

TEST_CASE("Modified leaf inside an unchanged container", "[diff][plain]") {
    Value current = doc(R"({"a": {"x": 1, "y": 2}})");
    Value original = doc(R"({"a": {"x": 1, "y": 9}})");

    ChangeMap changes = compare(current, &original);
    REQUIRE(changes.size() == 1);
    REQUIRE(has(changes, "a.y", ChangeKind::Modified));
    REQUIRE_FALSE(changes.contains("a"));
    REQUIRE_FALSE(changes.contains("a.x"));
}

TEST_CASE("Deleted subtree marks the container and every descendant", "[diff][plain]") {
    Value current = doc("{}");
    Value original = doc(R"({"a": {"b": 1}})");

    ChangeMap changes = compare(current, &original);
    REQUIRE(changes.size() == 2);
    REQUIRE(has(changes, "a", ChangeKind::Deleted));
    REQUIRE(has(changes, "a.b", ChangeKind::Deleted));
}

TEST_CASE("Added subtree marks only leaves", "[diff][plain]") {
    Value current = doc(R"({"a": {"b": 1, "c": [true, null]}})");
    Value original = doc("{}");

    ChangeMap changes = compare(current, &original);
    REQUIRE(changes.size() == 3);
    REQUIRE(has(changes, "a.b", ChangeKind::Added));
    REQUIRE(has(changes, "a.c.[0]", ChangeKind::Added));
    REQUIRE(has(changes, "a.c.[1]", ChangeKind::Added));
    REQUIRE_FALSE(changes.contains("a"));
    REQUIRE_FALSE(changes.contains("a.c"));
}

TEST_CASE("Added empty container records nothing", "[diff][plain]") {
    Value current = doc(R"({"empty": {}, "list": []})");
    Value original = doc("{}");
    REQUIRE(compare(current, &original).empty());
}

TEST_CASE("Missing original diffs against an empty document", "[diff][plain]") {
    Value current = doc(R"({"a": 1, "b": {"c": 2}})");

    ChangeMap changes = compare(current, nullptr);
    REQUIRE(changes.size() == 2);
    REQUIRE(has(changes, "a", ChangeKind::Added));
    REQUIRE(has(changes, "b.c", ChangeKind::Added));
}

TEST_CASE("Array elements compare by index", "[diff][plain][array]") {
    Value original = doc(R"({"l": [1, 2, 3]})");

    SECTION("shorter array deletes the tail") {
        Value current = doc(R"({"l": [1, 2]})");
        ChangeMap changes = compare(current, &original);
        REQUIRE(changes.size() == 1);
        REQUIRE(has(changes, "l.[2]", ChangeKind::Deleted));
    }

    SECTION("longer array adds the tail") {
        Value current = doc(R"({"l": [1, 2, 3, 4]})");
        ChangeMap changes = compare(current, &original);
        REQUIRE(changes.size() == 1);
        REQUIRE(has(changes, "l.[3]", ChangeKind::Added));
    }

    SECTION("element change") {
        Value current = doc(R"({"l": [1, 5, 3]})");
        ChangeMap changes = compare(current, &original);
        REQUIRE(changes.size() == 1);
        REQUIRE(has(changes, "l.[1]", ChangeKind::Modified));
    }
}

TEST_CASE("Numbers equal by value are unchanged", "[diff][plain]") {
    Value current = doc(R"({"n": 1.0})");
    Value original = doc(R"({"n": 1})");
    REQUIRE(compare(current, &original).empty());
}

TEST_CASE("Kind changes between leaf and container", "[diff][plain][kind]") {
    SECTION("container replaced by a leaf") {
        Value current = doc(R"({"a": 5})");
        Value original = doc(R"({"a": {"b": 1, "c": {"d": 2}}})");

        ChangeMap changes = compare(current, &original);
        REQUIRE(has(changes, "a", ChangeKind::Modified));
        REQUIRE(has(changes, "a.b", ChangeKind::Deleted));
        REQUIRE(has(changes, "a.c", ChangeKind::Deleted));
        REQUIRE(has(changes, "a.c.d", ChangeKind::Deleted));
        REQUIRE(changes.size() == 4);
    }

    SECTION("leaf replaced by a container") {
        Value current = doc(R"({"a": {"b": 1}})");
        Value original = doc(R"({"a": 5})");

        ChangeMap changes = compare(current, &original);
        REQUIRE(changes.size() == 1);
        REQUIRE(has(changes, "a.b", ChangeKind::Added));
    }

    SECTION("object replaced by an array") {
        Value current = doc(R"({"a": [7]})");
        Value original = doc(R"({"a": {"k": 7}})");

        ChangeMap changes = compare(current, &original);
        REQUIRE(changes.size() == 2);
        REQUIRE(has(changes, "a.[0]", ChangeKind::Added));
        REQUIRE(has(changes, "a.k", ChangeKind::Deleted));
    }
}

TEST_CASE("No container path is ever Added", "[diff][plain]") {
    Value current = doc(R"({"x": {"y": {"z": [1, {"w": 2}]}}, "k": [[], [3]]})");
    Value original = doc(R"({"k": [[]]})");

    ChangeMap changes = compare(current, &original);
    for (const auto& [path, kind] : changes.entries()) {
        if (kind != ChangeKind::Added) continue;
        auto parsed = Path::parse(path);
        REQUIRE(parsed.has_value());
        INFO(path);
        // Every Added path must resolve to a leaf in the current tree
        const Value* node = &current;
        for (const auto& elem : *parsed) {
            if (auto* key = std::get_if<std::string>(&elem)) {
                node = node->find(*key);
            } else {
                node = node->find(std::get<std::size_t>(elem));
            }
            REQUIRE(node != nullptr);
        }
        REQUIRE_FALSE(node->is_container());
    }
    REQUIRE(has(changes, "x.y.z.[1].w", ChangeKind::Added));
    REQUIRE(has(changes, "k.[1].[0]", ChangeKind::Added));
}

TEST_CASE("Field names with separators are escaped in change keys", "[diff][plain]") {
    Value current = doc(R"({"a.b": 2})");
    Value original = doc(R"({"a.b": 1})");
    REQUIRE(has(compare(current, &original), "a\\.b", ChangeKind::Modified));
}

// ============================================================
// Hybrid diff
// ============================================================

TEST_CASE("Hybrid diff for a deleted document", "[diff][hybrid]") {
    Value original = doc(R"({"a": 1, "b": {"c": 2}})");

    SECTION("no edits: everything inherits Deleted") {
        ChangeMap changes = compare_hybrid(original, &original, DocumentStatus::Deleted, PathSet{});
        REQUIRE(changes.size() == 3);
        REQUIRE(has(changes, "a", ChangeKind::Deleted));
        REQUIRE(has(changes, "b", ChangeKind::Deleted));
        REQUIRE(has(changes, "b.c", ChangeKind::Deleted));
    }

    SECTION("an edited but unchanged field is compared") {
        ChangeMap changes = compare_hybrid(original, &original, DocumentStatus::Deleted, make_path_set({"a"}));
        REQUIRE_FALSE(changes.contains("a"));
        REQUIRE(has(changes, "b.c", ChangeKind::Deleted));
    }

    SECTION("an edited and changed field is Modified") {
        Value current = original.set("a", 3);
        ChangeMap changes = compare_hybrid(current, &original, DocumentStatus::Deleted, make_path_set({"a"}));
        REQUIRE(has(changes, "a", ChangeKind::Modified));
        REQUIRE(has(changes, "b", ChangeKind::Deleted));
    }

    SECTION("an edited container diffs its whole subtree") {
        Value current = original.set("b", Value::object({{"c", 2}, {"d", 4}}));
        ChangeMap changes = compare_hybrid(current, &original, DocumentStatus::Deleted, make_path_set({"b"}));
        REQUIRE_FALSE(changes.contains("b"));
        REQUIRE_FALSE(changes.contains("b.c"));
        REQUIRE(has(changes, "b.d", ChangeKind::Added));
        REQUIRE(has(changes, "a", ChangeKind::Deleted));
    }

    SECTION("an edited path that is gone from current is Deleted with its subtree") {
        Value nested = doc(R"({"a": {"x": [1, {"y": 2}]}, "keep": 0})");
        Value current = doc(R"({"keep": 0})");
        ChangeMap changes = compare_hybrid(current, &nested, DocumentStatus::Deleted, make_path_set({"a"}));

        for (const char* path : {"a", "a.x", "a.x.[0]", "a.x.[1]", "a.x.[1].y"}) {
            INFO(path);
            REQUIRE(has(changes, path, ChangeKind::Deleted));
        }
        REQUIRE(has(changes, "keep", ChangeKind::Deleted));
        REQUIRE(changes.size() == 6);
    }

    SECTION("an edit below a removed path does not shield it") {
        Value nested = doc(R"({"a": {"x": 1}})");
        Value current = Value::object();
        ChangeMap changes = compare_hybrid(current, &nested, DocumentStatus::Deleted, make_path_set({"a.x"}));
        REQUIRE(has(changes, "a", ChangeKind::Deleted));
        REQUIRE(has(changes, "a.x", ChangeKind::Deleted));
    }
}

TEST_CASE("Hybrid diff matches edited paths on segment boundaries", "[diff][hybrid]") {
    Value original = doc(R"({"a": {"b": 1, "bc": 2}})");
    Value current = doc(R"({"a": {"b": 1, "bc": 2}})");

    ChangeMap changes = compare_hybrid(current, &original, DocumentStatus::Deleted, make_path_set({"a.b"}));
    REQUIRE_FALSE(changes.contains("a.b"));
    REQUIRE(has(changes, "a.bc", ChangeKind::Deleted));
    REQUIRE(has(changes, "a", ChangeKind::Deleted));
}

TEST_CASE("Hybrid diff for an added document", "[diff][hybrid]") {
    Value current = doc(R"({"a": {"b": 1}, "c": [2]})");

    ChangeMap changes = compare_hybrid(current, nullptr, DocumentStatus::Added, PathSet{});
    REQUIRE(has(changes, "a", ChangeKind::Added));
    REQUIRE(has(changes, "a.b", ChangeKind::Added));
    REQUIRE(has(changes, "c", ChangeKind::Added));
    REQUIRE(has(changes, "c.[0]", ChangeKind::Added));
    REQUIRE(changes.size() == 4);
}

TEST_CASE("Hybrid diff without an overlay status is a plain diff", "[diff][hybrid]") {
    Value current = doc(R"({"a": {"x": 1, "y": 2}})");
    Value original = doc(R"({"a": {"x": 1, "y": 9}})");

    for (auto status : {DocumentStatus::Unchanged, DocumentStatus::Modified}) {
        REQUIRE(compare_hybrid(current, &original, status, make_path_set({"a.x"})) == compare(current, &original));
    }
}

// ============================================================
// ChangeMap and ChangeCollector
// ============================================================

TEST_CASE("ChangeMap counts", "[diff][map]") {
    Value current = doc(R"({"a": 2, "b": 1, "new1": 1, "new2": 2})");
    Value original = doc(R"({"a": 1, "b": 1, "gone": 0})");

    ChangeMap changes = compare(current, &original);
    REQUIRE(changes.count(ChangeKind::Added) == 2);
    REQUIRE(changes.count(ChangeKind::Modified) == 1);
    REQUIRE(changes.count(ChangeKind::Deleted) == 1);
    REQUIRE(changes.changed_field_count() == 3);
    REQUIRE(changes.sorted_paths() == std::vector<std::string>{"a", "gone", "new1", "new2"});
    REQUIRE_FALSE(changes.find("b").has_value());
}

TEST_CASE("ChangeKind and DocumentStatus names", "[diff]") {
    REQUIRE(to_string(ChangeKind::Added) == "added");
    REQUIRE(to_string(ChangeKind::Deleted) == "deleted");
    REQUIRE(to_string(DocumentStatus::Unchanged) == "unchanged");
}

TEST_CASE("ChangeCollector can be reused", "[diff][collector]") {
    Value a = doc(R"({"x": 1})");
    Value b = doc(R"({"x": 2})");

    ChangeCollector collector;
    collector.compare(a, &b);
    REQUIRE(collector.has_changes());
    REQUIRE(collector.result().size() == 1);

    collector.compare(a, &a);
    REQUIRE_FALSE(collector.has_changes());

    collector.compare(a, &b);
    collector.clear();
    REQUIRE(collector.result().empty());
}

TEST_CASE("Independent documents can be diffed in parallel", "[diff][concurrency]") {
    Value shared = doc(R"({"common": {"list": [1, 2, 3], "name": "base"}})");

    constexpr int kWorkers = 8;
    std::vector<ChangeMap> results(kWorkers);
    std::vector<std::thread> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back([&results, &shared, i]() {
            // Each worker edits its own copy; structure is shared with `shared`
            Value current = shared.set("worker", i);
            for (int round = 0; round < 50; ++round) {
                results[i] = compare(current, &shared);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (int i = 0; i < kWorkers; ++i) {
        REQUIRE(results[i].size() == 1);
        REQUIRE(has(results[i], "worker", ChangeKind::Added));
    }
}
