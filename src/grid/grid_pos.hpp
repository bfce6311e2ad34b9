#pragma once

#include "core/types.hpp"

#include <cstdlib>
#include <functional>
#include <string>

namespace otc::grid {

/// Discrete cell on the combat grid.
struct GridPos {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const GridPos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridPos& o) const { return !(*this == o); }
};

/// max(|dx|, |dy|): the number of 8-directional steps between two cells.
inline i32 chebyshev_distance(const GridPos& a, const GridPos& b) {
    i32 dx = std::abs(a.x - b.x);
    i32 dy = std::abs(a.y - b.y);
    return dx > dy ? dx : dy;
}

inline std::string to_string(const GridPos& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

struct GridPosHash {
    size_t operator()(const GridPos& p) const {
        u64 key = (static_cast<u64>(static_cast<u32>(p.x)) << 32) |
                  static_cast<u32>(p.y);
        return std::hash<u64>{}(key);
    }
};

} // namespace otc::grid
