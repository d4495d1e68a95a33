#include "pattern_repository.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

PatternRepository::PatternRepository(std::unique_ptr<PatternBackend> backend,
                                     std::chrono::milliseconds save_debounce)
: backend_(std::move(backend)),
  save_debounce_(save_debounce)
{}

bool PatternRepository::load(const json* fallback_defaults) {
        history_.clear();
        future_.clear();
        dirty_ = false;
        save_debounce_.cancel();
        if (backend_) {
                json data;
                if (backend_->load(data)) {
                        bool legacy = false;
                        PatternStore loaded = pattern_store_from_json(data, &legacy);
                        if (!legacy) {
                                store_ = std::move(loaded);
                                ++revision_;
                                return true;
                        }
                        std::cerr << "[PatternRepository] Ignoring legacy pattern document in "
                                  << backend_->describe() << "\n";
                }
        }
        store_ = fallback_defaults ? pattern_store_from_json(*fallback_defaults) : PatternStore{};
        ++revision_;
        return false;
}

std::vector<Blocker> PatternRepository::resolve_effective_pattern(const TileInstance& tile) const {
        return ::resolve_effective_pattern(tile, store_);
}

const std::vector<Blocker>* PatternRepository::find_override(const std::string& tile_id) const {
        const auto it = store_.overrides.find(tile_id);
        return it == store_.overrides.end() ? nullptr : &it->second;
}

const DefaultPattern* PatternRepository::find_default(const std::string& type_id) const {
        const auto it = store_.defaults.find(type_id);
        return it == store_.defaults.end() ? nullptr : &it->second;
}

void PatternRepository::set_default(const std::string& type_id, std::vector<Blocker> rects,
                                    double apply_after, clock::time_point now) {
        push_history();
        store_.defaults[type_id] = DefaultPattern{ sanitize_blockers(rects), apply_after };
        mark_dirty(now);
}

void PatternRepository::set_override(const std::string& tile_id, std::vector<Blocker> rects,
                                     clock::time_point now) {
        push_history();
        store_.overrides[tile_id] = sanitize_blockers(rects);
        mark_dirty(now);
}

bool PatternRepository::remove_override(const std::string& tile_id, clock::time_point now) {
        if (store_.overrides.find(tile_id) == store_.overrides.end()) return false;
        push_history();
        store_.overrides.erase(tile_id);
        mark_dirty(now);
        return true;
}

std::size_t PatternRepository::add_rects(const TileInstance& tile, const std::vector<Blocker>& rects,
                                         clock::time_point now) {
        std::vector<Blocker> base = resolve_effective_pattern(tile);
        const std::size_t first = base.size();
        const std::vector<Blocker> clean = sanitize_blockers(rects);
        if (clean.empty() || tile.id.empty()) return first;
        push_history();
        base.insert(base.end(), clean.begin(), clean.end());
        store_.overrides[tile.id] = std::move(base);
        mark_dirty(now);
        return first;
}

bool PatternRepository::update_rects(const std::string& tile_id,
                                     const std::vector<std::size_t>& indices,
                                     std::optional<double> cast_height,
                                     std::optional<double> softness,
                                     clock::time_point now) {
        const auto it = store_.overrides.find(tile_id);
        if (it == store_.overrides.end() || indices.empty()) return false;
        if (!cast_height.has_value() && !softness.has_value()) return false;
        const bool any_in_range = std::any_of(indices.begin(), indices.end(),
                [&](std::size_t idx) { return idx < it->second.size(); });
        if (!any_in_range) return false;
        push_history();
        auto& rects = it->second;
        for (std::size_t idx : indices) {
                if (idx >= rects.size()) continue;
                if (cast_height.has_value()) rects[idx].cast_height = clamp_1_to_9(cast_height, kDefaultCastHeight);
                if (softness.has_value())    rects[idx].softness    = clamp_1_to_9(softness, kDefaultSoftness);
        }
        mark_dirty(now);
        return true;
}

bool PatternRepository::remove_rects(const TileInstance& tile, const std::vector<std::size_t>& indices,
                                     clock::time_point now) {
        if (tile.id.empty()) return false;
        std::vector<Blocker> base = resolve_effective_pattern(tile);
        if (base.empty()) return false;
        std::vector<Blocker> kept;
        if (indices.empty()) {
                kept.assign(base.begin(), base.end() - 1);
        } else {
                kept.reserve(base.size());
                for (std::size_t i = 0; i < base.size(); ++i) {
                        if (std::find(indices.begin(), indices.end(), i) == indices.end()) {
                                kept.push_back(base[i]);
                        }
                }
                if (kept.size() == base.size()) return false;
        }
        push_history();
        store_.overrides[tile.id] = std::move(kept);
        mark_dirty(now);
        return true;
}

bool PatternRepository::clear_tile(const TileInstance& tile, double apply_after, clock::time_point now) {
        if (tile.id.empty()) return false;
        push_history();
        auto d_it = store_.defaults.find(tile.type_id);
        if (!tile.type_id.empty() && d_it != store_.defaults.end()) {
                d_it->second.rects.clear();
                d_it->second.apply_after = apply_after;
        }
        store_.overrides[tile.id].clear();
        mark_dirty(now);
        return true;
}

bool PatternRepository::promote_override(const TileInstance& tile, double apply_after, clock::time_point now) {
        const auto* override_rects = find_override(tile.id);
        if (!override_rects || override_rects->empty() || tile.type_id.empty()) return false;
        std::vector<Blocker> rects = *override_rects;
        push_history();
        store_.defaults[tile.type_id] = DefaultPattern{ std::move(rects), apply_after };
        mark_dirty(now);
        return true;
}

bool PatternRepository::undo(clock::time_point now) {
        if (history_.empty()) return false;
        future_.push_back(store_);
        store_ = std::move(history_.back());
        history_.pop_back();
        mark_dirty(now);
        return true;
}

bool PatternRepository::redo(clock::time_point now) {
        if (future_.empty()) return false;
        history_.push_back(store_);
        store_ = std::move(future_.back());
        future_.pop_back();
        mark_dirty(now);
        return true;
}

bool PatternRepository::update(clock::time_point now) {
        if (!dirty_) return false;
        if (!save_debounce_.fire(now)) return false;
        if (flush()) return true;
        save_debounce_.touch(now);
        return false;
}

bool PatternRepository::flush() {
        if (!backend_) {
                dirty_ = false;
                return false;
        }
        if (!backend_->save(pattern_store_to_json(store_))) {
                std::cerr << "[PatternRepository] Save failed: " << backend_->describe() << "\n";
                return false;
        }
        dirty_ = false;
        save_debounce_.cancel();
        return true;
}

std::vector<Blocker> PatternRepository::collect_world_blockers(const std::vector<TileInstance>& tiles,
                                                               float cell_size) const {
        std::vector<Blocker> out;
        for (const auto& tile : tiles) {
                if (!tile.placed) continue;
                const float cell_x = static_cast<float>(tile.col) * cell_size;
                const float cell_y = static_cast<float>(tile.row) * cell_size;
                for (const auto& rect : resolve_effective_pattern(tile)) {
                        Blocker world = rect;
                        world.x += cell_x;
                        world.y += cell_y;
                        if (auto clean = sanitize_blocker(world)) {
                                out.push_back(*clean);
                        }
                }
        }
        return out;
}

void PatternRepository::push_history() {
        history_.push_back(store_);
        if (history_.size() > max_history_) {
                history_.erase(history_.begin());
        }
        future_.clear();
}

void PatternRepository::mark_dirty(clock::time_point now) {
        dirty_ = true;
        ++revision_;
        save_debounce_.touch(now);
}
