#pragma once

// world/spatial_graph.h
//
// Navigable-space graph over a multi-level building.
//
// Design goals:
//   - Regular grid per level, 4-neighbour horizontal adjacency.
//   - Vertical adjacency only inside the stairway rectangle, between the same
//     (i, j) cell on consecutive levels.
//   - Immutable after build: build() hands out a shared_ptr<const SpatialGraph>
//     that agents and successive missions read without locking.
//
// Node ids are assigned in (level, j, i) order over navigable cells, so a lower
// id is always "earlier" in that scan. The planner relies on this for its
// deterministic tie-break.

#include <memory>
#include <string>
#include <vector>

#include "../include/Status.h"
#include "world_types.h"

namespace rescue {
namespace world {

enum class NodeKind : int {
    FloorCell = 0,
    StairCell = 1,
    Exit      = 2,
};

struct GraphConfig {
    int levels = 4;
    int grid_w = 20;
    int grid_h = 20;

    double cell_size_m = 1.0;
    double level_height_m = 3.0;

    // Vertical edge base cost = level_height_m * vertical_cost_factor.
    // Default 2.0: climbing is slower than walking.
    double vertical_cost_factor = 2.0;

    GridRect stairway{8, 8, 11, 11};

    GridCoord start{2, 2, 0};
    GridCoord target{15, 15, 3};

    // Non-navigable cells (walls). Each rectangle applies to the listed level
    // only when level >= 0, otherwise to all levels.
    struct Obstacle {
        GridRect rect{};
        int level = -1;
    };
    std::vector<Obstacle> obstacles;
};

struct Node {
    NodeId id = kInvalidNode;
    GridCoord cell{};
    Vec3d pos_m{};
    NodeKind kind = NodeKind::FloorCell;
};

struct Edge {
    NodeId to = kInvalidNode;
    double base_cost = 0.0;
    bool vertical = false;
};

class SpatialGraph {
public:
    // Fails with ConfigurationError on non-positive dimensions, a stairway or
    // obstacle outside the grid, or start/target outside the grid or walled off.
    static std::shared_ptr<const SpatialGraph> build(const GraphConfig& cfg, Status* status = nullptr);

    // Validation only; build() calls this first.
    static Status validate(const GraphConfig& cfg);

    const GraphConfig& config() const { return cfg_; }

    int nodeCount() const { return static_cast<int>(nodes_.size()); }
    std::size_t edgeCount() const { return edge_count_; }

    bool contains(NodeId id) const { return id >= 0 && id < nodeCount(); }
    const Node& node(NodeId id) const { return nodes_[static_cast<std::size_t>(id)]; }

    // Pure and deterministic. Order: +i, -i, +j, -j, up, down.
    const std::vector<Edge>& neighbors(NodeId id) const { return adjacency_[static_cast<std::size_t>(id)]; }

    // kInvalidNode if out of bounds or not navigable.
    NodeId nodeAt(int i, int j, int level) const;
    NodeId nodeAt(const GridCoord& c) const { return nodeAt(c.i, c.j, c.level); }

    // Closest navigable node on the given level (clamped into range).
    // Ties resolve to the lower node id.
    NodeId nearestNode(const Vec3d& p_m, int level) const;

    NodeId startNode() const { return start_; }
    NodeId targetNode() const { return target_; }

    double verticalEdgeCost() const { return cfg_.level_height_m * cfg_.vertical_cost_factor; }

    // Lower bound on the unweighted route length between two nodes:
    // horizontal straight-line distance + |level difference| * vertical edge cost.
    double unweightedLowerBound(NodeId a, NodeId b) const;

    // Sum of base costs along consecutive nodes; negative if any hop is not an edge.
    double pathLength(const std::vector<NodeId>& path) const;
    int verticalTransitions(const std::vector<NodeId>& path) const;

private:
    SpatialGraph() = default;

    std::size_t cellIndex(int i, int j, int level) const {
        return (static_cast<std::size_t>(level) * static_cast<std::size_t>(cfg_.grid_h)
                + static_cast<std::size_t>(j)) * static_cast<std::size_t>(cfg_.grid_w)
               + static_cast<std::size_t>(i);
    }

    void connect(NodeId a, NodeId b, double cost, bool vertical);

    GraphConfig cfg_{};
    std::vector<Node> nodes_;
    std::vector<std::vector<Edge>> adjacency_;
    std::vector<NodeId> cell_to_node_;
    std::size_t edge_count_ = 0;
    NodeId start_ = kInvalidNode;
    NodeId target_ = kInvalidNode;
};

using SpatialGraphPtr = std::shared_ptr<const SpatialGraph>;

} // namespace world
} // namespace rescue
