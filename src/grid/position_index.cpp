#include "grid/position_index.hpp"

#include <algorithm>
#include <string>

namespace otc::grid {

Result<void> PositionIndex::add_entity(EntityId id, GridPos pos) {
    auto located = locations_.find(id);
    if (located != locations_.end()) {
        if (located->second == pos) return {};
        return Error(ErrorCode::InvalidState,
                     "entity " + std::to_string(id) + " already at " +
                         to_string(located->second) + ", cannot add at " +
                         to_string(pos));
    }

    cells_[pos].push_back(id);
    locations_.emplace(id, pos);
    return {};
}

Result<void> PositionIndex::remove_entity(EntityId id, GridPos pos) {
    auto it = cells_.find(pos);
    if (it == cells_.end()) {
        return Error(ErrorCode::NotFound,
                     "no entities at position " + to_string(pos));
    }

    auto& ids = it->second;
    auto found = std::find(ids.begin(), ids.end(), id);
    if (found == ids.end()) {
        return Error(ErrorCode::NotFound,
                     "entity " + std::to_string(id) +
                         " not found at position " + to_string(pos));
    }

    // Swap with the last occupant and truncate
    *found = ids.back();
    ids.pop_back();
    if (ids.empty()) cells_.erase(it);
    locations_.erase(id);
    return {};
}

Result<void> PositionIndex::move_entity(EntityId id, GridPos old_pos,
                                        GridPos new_pos) {
    if (old_pos == new_pos) return {};

    auto removed = remove_entity(id, old_pos);
    if (!removed) {
        return Error(removed.error().code,
                     "failed to remove entity from old position: " +
                         removed.error().message);
    }

    auto added = add_entity(id, new_pos);
    if (!added) {
        return Error(added.error().code,
                     "failed to add entity to new position: " +
                         added.error().message);
    }
    return {};
}

EntityId PositionIndex::entity_at(GridPos pos) const {
    auto it = cells_.find(pos);
    if (it == cells_.end() || it->second.empty()) return 0;
    return it->second.front();
}

std::vector<EntityId> PositionIndex::all_entities_at(GridPos pos) const {
    auto it = cells_.find(pos);
    if (it == cells_.end()) return {};
    return it->second;
}

std::vector<EntityId> PositionIndex::entities_in_radius(GridPos center,
                                                        i32 radius) const {
    std::vector<EntityId> result;
    if (radius < 0) return result;

    for (i32 x = center.x - radius; x <= center.x + radius; ++x) {
        for (i32 y = center.y - radius; y <= center.y + radius; ++y) {
            GridPos pos{x, y};
            if (chebyshev_distance(center, pos) > radius) continue;
            auto it = cells_.find(pos);
            if (it == cells_.end()) continue;
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }
    return result;
}

bool PositionIndex::contains(EntityId id, GridPos pos) const {
    auto it = cells_.find(pos);
    if (it == cells_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), id) !=
           it->second.end();
}

std::optional<GridPos> PositionIndex::position_of(EntityId id) const {
    auto it = locations_.find(id);
    if (it == locations_.end()) return std::nullopt;
    return it->second;
}

std::vector<GridPos> PositionIndex::occupied_positions() const {
    std::vector<GridPos> positions;
    positions.reserve(cells_.size());
    for (const auto& [pos, ids] : cells_)
        positions.push_back(pos);
    return positions;
}

void PositionIndex::clear() {
    CellMap empty;
    cells_.swap(empty);
    locations_.clear();
}

} // namespace otc::grid
