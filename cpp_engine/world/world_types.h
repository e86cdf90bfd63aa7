#pragma once

// world/world_types.h
//
// Shared value types for the navigable-space layer.
//
// Coordinate convention:
//   - Z is up. Level k sits at z = k * level_height_m.
//   - Grid cell (i, j) on level k has its centre at
//       x = i * cell_size_m, y = j * cell_size_m.

#include <cmath>
#include <cstdint>
#include <limits>

namespace rescue {
namespace world {

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline double distance(const Vec3d& a, const Vec3d& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

inline double distanceXY(const Vec3d& a, const Vec3d& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Integer grid address of a cell.
struct GridCoord {
    int i = 0;
    int j = 0;
    int level = 0;
};

inline bool operator==(const GridCoord& a, const GridCoord& b) {
    return a.i == b.i && a.j == b.j && a.level == b.level;
}
inline bool operator!=(const GridCoord& a, const GridCoord& b) { return !(a == b); }

// Inclusive cell rectangle, applied on every level.
struct GridRect {
    int i0 = 0;
    int j0 = 0;
    int i1 = 0;
    int j1 = 0;

    bool contains(int i, int j) const {
        return i >= i0 && i <= i1 && j >= j0 && j <= j1;
    }
};

using NodeId = std::int32_t;
static constexpr NodeId kInvalidNode = -1;

} // namespace world
} // namespace rescue
