#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/grid_pos.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace otc::grid {

/// Cell -> occupants lookup for everything standing on the combat grid.
/// An id lives in at most one cell; cells that lose their last occupant are
/// erased so the map never holds empty buckets.
///
/// Each combat session owns its own index. Not thread-safe.
class PositionIndex {
public:
    /// Register an entity at a cell. No-op if it is already there; fails
    /// with InvalidState if it is registered at a different cell (use
    /// move_entity for that).
    Result<void> add_entity(EntityId id, GridPos pos);

    /// Remove an entity from a cell. Fails with NotFound if the cell is
    /// empty or does not hold the id.
    Result<void> remove_entity(EntityId id, GridPos pos);

    /// Remove from old_pos then add at new_pos. No-op when both are equal.
    /// If the removal fails nothing is changed.
    Result<void> move_entity(EntityId id, GridPos old_pos, GridPos new_pos);

    /// First occupant of a cell, or 0 if the cell is empty.
    EntityId entity_at(GridPos pos) const;

    /// Copy of all occupants of a cell (empty if none).
    std::vector<EntityId> all_entities_at(GridPos pos) const;

    /// Occupants of every cell within Chebyshev distance `radius` of center.
    /// Scans the (2r+1)^2 bounding square regardless of occupancy.
    std::vector<EntityId> entities_in_radius(GridPos center, i32 radius) const;

    bool contains(EntityId id, GridPos pos) const;
    bool has_cell(GridPos pos) const { return cells_.count(pos) != 0; }

    /// Cell currently holding an entity.
    std::optional<GridPos> position_of(EntityId id) const;

    size_t entity_count() const { return locations_.size(); }

    std::vector<GridPos> occupied_positions() const;

    void clear();

private:
    using CellMap =
        std::unordered_map<GridPos, std::vector<EntityId>, GridPosHash>;
    CellMap cells_;
    std::unordered_map<EntityId, GridPos> locations_;
};

} // namespace otc::grid
