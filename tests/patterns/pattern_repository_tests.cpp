#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "patterns/pattern_backend.hpp"
#include "patterns/pattern_repository.hpp"
#include "patterns/pattern_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

Blocker rect(float x, float y, float w, float h, int cast_height = 9, int softness = 5) {
    Blocker b;
    b.x = x;
    b.y = y;
    b.width = w;
    b.height = h;
    b.cast_height = cast_height;
    b.softness = softness;
    return b;
}

TileInstance tile(const std::string& id, const std::string& type, int col = 0, int row = 0) {
    TileInstance t;
    t.id = id;
    t.type_id = type;
    t.col = col;
    t.row = row;
    return t;
}

struct RepoFixture {
    MemoryPatternBackend* backend = nullptr;
    std::unique_ptr<PatternRepository> repo;
    PatternRepository::clock::time_point t0 = PatternRepository::clock::now();

    explicit RepoFixture(json initial = json()) {
        auto owned = initial.is_null() ? std::make_unique<MemoryPatternBackend>()
                                       : std::make_unique<MemoryPatternBackend>(initial);
        backend = owned.get();
        repo = std::make_unique<PatternRepository>(std::move(owned), 250ms);
    }
};

}

TEST_CASE("effective pattern covers all four override/default combinations") {
    PatternStore store;
    const TileInstance t = tile("t1", "oak");

    CHECK(resolve_effective_pattern(t, store).empty());

    store.defaults["oak"] = DefaultPattern{ { rect(1, 1, 2, 2) }, 0.0 };
    auto only_default = resolve_effective_pattern(t, store);
    REQUIRE(only_default.size() == 1);
    CHECK(only_default[0].x == doctest::Approx(1.0f));

    store.overrides["t1"] = { rect(5, 5, 1, 1), rect(6, 6, 1, 1) };
    CHECK(resolve_effective_pattern(t, store).size() == 2);

    store.defaults.erase("oak");
    CHECK(resolve_effective_pattern(t, store).size() == 2);

    store.overrides["t1"].clear();
    store.defaults["oak"] = DefaultPattern{ { rect(1, 1, 2, 2) }, 0.0 };
    CHECK(resolve_effective_pattern(t, store).empty());
}

TEST_CASE("load normalizes entries and clamps parameters") {
    json doc = {
        {"defaults", {
            {"oak", {{"rects", json::array({
                {{"x", 1}, {"y", 2}, {"width", 3}, {"height", 4}, {"castHeight", 15}, {"softness", 0}},
                {{"x", 1}, {"y", 2}, {"width", -3}, {"height", 4}}
            })}}}
        }},
        {"overrides", {
            {"t9", json::array({ {{"x", 0}, {"y", 0}, {"width", 1}, {"height", 1}} })},
            {"bad", "not an array"}
        }}
    };
    RepoFixture f(doc);
    CHECK(f.repo->load());

    const DefaultPattern* oak = f.repo->find_default("oak");
    REQUIRE(oak != nullptr);
    REQUIRE(oak->rects.size() == 1);
    CHECK(oak->rects[0].cast_height == 9);
    CHECK(oak->rects[0].softness == 5);
    CHECK(oak->apply_after == 0.0);
    REQUIRE(f.repo->find_override("t9") != nullptr);
    CHECK(f.repo->find_override("bad") == nullptr);
}

TEST_CASE("legacy documents fall back to the provided defaults") {
    json legacy = { {"oak", json::array({ {{"x", 0}, {"y", 0}, {"width", 1}, {"height", 1}} })} };
    json fallback = { {"defaults", {{"pine", {{"rects", json::array()}, {"applyAfter", 12}}}}} };
    RepoFixture f(legacy);
    CHECK_FALSE(f.repo->load(&fallback));
    CHECK(f.repo->find_default("oak") == nullptr);
    const DefaultPattern* pine = f.repo->find_default("pine");
    REQUIRE(pine != nullptr);
    CHECK(pine->apply_after == doctest::Approx(12.0));
}

TEST_CASE("saves are debounced after the last mutation") {
    RepoFixture f;
    f.repo->load();
    f.repo->set_override("t1", { rect(0, 0, 4, 4) }, f.t0);
    f.repo->set_override("t2", { rect(0, 0, 4, 4) }, f.t0 + 100ms);

    CHECK(f.repo->dirty());
    CHECK_FALSE(f.repo->update(f.t0 + 200ms));
    CHECK_FALSE(f.repo->update(f.t0 + 300ms));
    CHECK(f.backend->save_count() == 0);

    CHECK(f.repo->update(f.t0 + 351ms));
    CHECK(f.backend->save_count() == 1);
    CHECK_FALSE(f.repo->dirty());
    CHECK(f.backend->data().at("overrides").contains("t2"));

    CHECK_FALSE(f.repo->update(f.t0 + 2000ms));
    CHECK(f.backend->save_count() == 1);
}

TEST_CASE("a failed save keeps the store dirty and retries") {
    RepoFixture f;
    f.repo->load();
    f.backend->set_fail_saves(true);
    f.repo->set_override("t1", { rect(0, 0, 4, 4) }, f.t0);
    CHECK_FALSE(f.repo->update(f.t0 + 300ms));
    CHECK(f.repo->dirty());

    f.backend->set_fail_saves(false);
    CHECK_FALSE(f.repo->update(f.t0 + 400ms));
    CHECK(f.repo->update(f.t0 + 600ms));
    CHECK_FALSE(f.repo->dirty());
}

TEST_CASE("add_rects appends to the effective pattern as an override") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    f.repo->set_default("oak", { rect(0, 0, 2, 2), rect(3, 3, 2, 2) }, 0.0, f.t0);

    const size_t first = f.repo->add_rects(t, { rect(10, 10, 1, 1) }, f.t0);
    CHECK(first == 2);
    const auto* over = f.repo->find_override("t1");
    REQUIRE(over != nullptr);
    CHECK(over->size() == 3);
    CHECK(f.repo->find_default("oak")->rects.size() == 2);
}

TEST_CASE("update_rects edits selected override rects with clamping") {
    RepoFixture f;
    f.repo->load();
    f.repo->set_override("t1", { rect(0, 0, 1, 1), rect(1, 1, 1, 1), rect(2, 2, 1, 1) }, f.t0);

    CHECK(f.repo->update_rects("t1", { 0, 2, 7 }, 15.0, std::nullopt, f.t0));
    const auto* over = f.repo->find_override("t1");
    REQUIRE(over != nullptr);
    CHECK((*over)[0].cast_height == 9);
    CHECK((*over)[2].cast_height == 9);

    CHECK(f.repo->update_rects("t1", { 1 }, 2.0, 0.0, f.t0));
    CHECK((*f.repo->find_override("t1"))[1].cast_height == 2);
    CHECK((*f.repo->find_override("t1"))[1].softness == 5);

    CHECK_FALSE(f.repo->update_rects("t1", { 9 }, 3.0, std::nullopt, f.t0));
    CHECK_FALSE(f.repo->update_rects("missing", { 0 }, 3.0, std::nullopt, f.t0));
}

TEST_CASE("clear_tile empties the override and the type default") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    f.repo->set_default("oak", { rect(0, 0, 2, 2) }, 0.0, f.t0);
    f.repo->set_override("t1", { rect(1, 1, 2, 2) }, f.t0);

    CHECK(f.repo->clear_tile(t, 1234.0, f.t0));
    REQUIRE(f.repo->find_override("t1") != nullptr);
    CHECK(f.repo->find_override("t1")->empty());
    CHECK(f.repo->find_default("oak")->rects.empty());
    CHECK(f.repo->find_default("oak")->apply_after == doctest::Approx(1234.0));
    CHECK(f.repo->resolve_effective_pattern(t).empty());
}

TEST_CASE("tile mutations ignore a tile without an id") {
    RepoFixture f;
    f.repo->load();
    const auto revision = f.repo->revision();
    CHECK_FALSE(f.repo->clear_tile(tile("", "oak"), 1.0, f.t0));
    CHECK_FALSE(f.repo->remove_rects(tile("", "oak"), {}, f.t0));
    f.repo->add_rects(tile("", "oak"), { rect(0, 0, 1, 1) }, f.t0);
    CHECK(f.repo->store().overrides.empty());
    CHECK_FALSE(f.repo->can_undo());
    CHECK_FALSE(f.repo->dirty());
    CHECK(f.repo->revision() == revision);
}

TEST_CASE("remove_rects drops the selected rects from the effective pattern") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    f.repo->set_default("oak", { rect(0, 0, 1, 1), rect(2, 2, 1, 1), rect(4, 4, 1, 1) }, 0.0, f.t0);

    CHECK(f.repo->remove_rects(t, { 0, 2 }, f.t0));
    const auto* override_rects = f.repo->find_override("t1");
    REQUIRE(override_rects != nullptr);
    REQUIRE(override_rects->size() == 1);
    CHECK((*override_rects)[0].x == doctest::Approx(2.0f));
    CHECK(f.repo->find_default("oak")->rects.size() == 3);
    CHECK(f.repo->dirty());

    CHECK_FALSE(f.repo->remove_rects(t, { 7 }, f.t0));
    CHECK(f.repo->find_override("t1")->size() == 1);
}

TEST_CASE("remove_rects without a selection pops the last rect") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    CHECK_FALSE(f.repo->remove_rects(t, {}, f.t0));

    f.repo->set_override("t1", { rect(0, 0, 1, 1), rect(2, 2, 1, 1) }, f.t0);
    CHECK(f.repo->remove_rects(t, {}, f.t0));
    REQUIRE(f.repo->find_override("t1")->size() == 1);
    CHECK((*f.repo->find_override("t1"))[0].x == doctest::Approx(0.0f));

    CHECK(f.repo->remove_rects(t, {}, f.t0));
    CHECK(f.repo->find_override("t1")->empty());
    CHECK_FALSE(f.repo->remove_rects(t, {}, f.t0));
}

TEST_CASE("remove_rects is undoable and saved after the debounce") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    f.repo->set_override("t1", { rect(0, 0, 1, 1), rect(2, 2, 1, 1) }, f.t0);
    REQUIRE(f.repo->flush());
    const int saves = f.backend->save_count();

    CHECK(f.repo->remove_rects(t, { 1 }, f.t0));
    CHECK_FALSE(f.repo->update(f.t0 + 100ms));
    CHECK(f.repo->update(f.t0 + 300ms));
    CHECK(f.backend->save_count() == saves + 1);
    CHECK(f.backend->data().at("overrides").at("t1").size() == 1);

    CHECK(f.repo->undo(f.t0));
    CHECK(f.repo->find_override("t1")->size() == 2);
    CHECK(f.repo->redo(f.t0));
    CHECK(f.repo->find_override("t1")->size() == 1);
}

TEST_CASE("promote_override copies a non-empty override into the default") {
    RepoFixture f;
    f.repo->load();
    const TileInstance t = tile("t1", "oak");
    CHECK_FALSE(f.repo->promote_override(t, 5.0, f.t0));

    f.repo->set_override("t1", { rect(1, 1, 2, 2), rect(4, 4, 1, 1) }, f.t0);
    CHECK(f.repo->promote_override(t, 5.0, f.t0));
    const DefaultPattern* oak = f.repo->find_default("oak");
    REQUIRE(oak != nullptr);
    CHECK(oak->rects.size() == 2);
    CHECK(oak->apply_after == doctest::Approx(5.0));
}

TEST_CASE("undo and redo restore whole store snapshots") {
    RepoFixture f;
    f.repo->load();
    CHECK_FALSE(f.repo->can_undo());

    f.repo->set_override("t1", { rect(0, 0, 1, 1) }, f.t0);
    f.repo->set_override("t1", { rect(0, 0, 1, 1), rect(2, 2, 1, 1) }, f.t0);
    CHECK(f.repo->find_override("t1")->size() == 2);

    CHECK(f.repo->undo(f.t0));
    CHECK(f.repo->find_override("t1")->size() == 1);
    CHECK(f.repo->undo(f.t0));
    CHECK(f.repo->find_override("t1") == nullptr);
    CHECK_FALSE(f.repo->undo(f.t0));

    CHECK(f.repo->redo(f.t0));
    CHECK(f.repo->find_override("t1")->size() == 1);

    f.repo->remove_override("t1", f.t0);
    CHECK_FALSE(f.repo->can_redo());
    CHECK(f.repo->dirty());
}

TEST_CASE("world blockers are translated by the tile cell origin") {
    RepoFixture f;
    f.repo->load();
    f.repo->set_default("oak", { rect(10, 20, 5, 5, 15, 3) }, 0.0, f.t0);

    TileInstance placed = tile("a", "oak", 2, 3);
    TileInstance unplaced = tile("b", "oak", 4, 4);
    unplaced.placed = false;
    TileInstance other = tile("c", "rock", 1, 1);

    auto world = f.repo->collect_world_blockers({ placed, unplaced, other }, 100.0f);
    REQUIRE(world.size() == 1);
    CHECK(world[0].x == doctest::Approx(210.0f));
    CHECK(world[0].y == doctest::Approx(320.0f));
    CHECK(world[0].cast_height == 9);
    CHECK(world[0].softness == 3);
}

TEST_CASE("pattern store json keeps defaults and overrides keys") {
    PatternStore store;
    store.defaults["oak"] = DefaultPattern{ { rect(1, 2, 3, 4, 6, 2) }, 42.0 };
    store.overrides["t1"] = {};
    const json j = pattern_store_to_json(store);
    CHECK(j.at("defaults").at("oak").at("applyAfter").get<double>() == doctest::Approx(42.0));
    CHECK(j.at("overrides").at("t1").is_array());

    bool legacy = true;
    CHECK(pattern_store_from_json(j, &legacy) == store);
    CHECK_FALSE(legacy);
}
