#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "patterns/pattern_backend.hpp"
#include "patterns/pattern_store.hpp"
#include "utils/frame_throttle.hpp"

class PatternRepository {

	public:
    using clock = std::chrono::steady_clock;

    explicit PatternRepository(std::unique_ptr<PatternBackend> backend,
                               std::chrono::milliseconds save_debounce = std::chrono::milliseconds(250));

    // Loads from the backend. Falls back to fallback_defaults when the backend
    // has nothing usable or holds a legacy document.
    bool load(const nlohmann::json* fallback_defaults = nullptr);

    const PatternStore& store() const { return store_; }
    std::uint64_t revision() const { return revision_; }

    std::vector<Blocker> resolve_effective_pattern(const TileInstance& tile) const;
    const std::vector<Blocker>* find_override(const std::string& tile_id) const;
    const DefaultPattern* find_default(const std::string& type_id) const;

    void set_default(const std::string& type_id, std::vector<Blocker> rects, double apply_after,
                     clock::time_point now = clock::now());
    void set_override(const std::string& tile_id, std::vector<Blocker> rects,
                      clock::time_point now = clock::now());
    bool remove_override(const std::string& tile_id, clock::time_point now = clock::now());

    // Appends to the tile's effective pattern and stores the result as its
    // override. Returns the index of the first appended rect.
    std::size_t add_rects(const TileInstance& tile, const std::vector<Blocker>& rects,
                          clock::time_point now = clock::now());

    bool update_rects(const std::string& tile_id,
                      const std::vector<std::size_t>& indices,
                      std::optional<double> cast_height,
                      std::optional<double> softness,
                      clock::time_point now = clock::now());

    // Removes the rects at indices from the tile's effective pattern, or the
    // last rect when indices is empty, and stores the result as its override.
    bool remove_rects(const TileInstance& tile, const std::vector<std::size_t>& indices,
                      clock::time_point now = clock::now());

    bool clear_tile(const TileInstance& tile, double apply_after, clock::time_point now = clock::now());

    // Copies a non-empty override into the tile type's default.
    bool promote_override(const TileInstance& tile, double apply_after, clock::time_point now = clock::now());

    bool undo(clock::time_point now = clock::now());
    bool redo(clock::time_point now = clock::now());
    bool can_undo() const { return !history_.empty(); }
    bool can_redo() const { return !future_.empty(); }

    // Saves once the debounce after the last mutation has elapsed.
    bool update(clock::time_point now);
    bool flush();
    bool dirty() const { return dirty_; }

    // Effective patterns of placed tiles translated to world coordinates.
    std::vector<Blocker> collect_world_blockers(const std::vector<TileInstance>& tiles, float cell_size) const;

	private:
    void push_history();
    void mark_dirty(clock::time_point now);

	private:
    std::unique_ptr<PatternBackend> backend_;
    PatternStore store_;
    std::vector<PatternStore> history_;
    std::vector<PatternStore> future_;
    Debouncer save_debounce_;
    bool dirty_ = false;
    std::uint64_t revision_ = 0;
    std::size_t max_history_ = 100;
};
