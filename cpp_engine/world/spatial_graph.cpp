// world/spatial_graph.cpp
//
// Grid build:
//   1) validate configuration (ConfigurationError on anything degenerate)
//   2) create one node per navigable cell in (level, j, i) order
//   3) horizontal 4-neighbour edges, base cost = cell size
//   4) vertical edges inside the stairway, base cost = level height * factor
//   5) resolve start/target

#include "spatial_graph.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace rescue {
namespace world {

static constexpr double kMaxDimension = 1.0e6;

static inline bool isFinitePositive(double v) {
    return std::isfinite(v) && v > 0.0;
}

static inline bool inGrid(const GraphConfig& cfg, int i, int j) {
    return i >= 0 && i < cfg.grid_w && j >= 0 && j < cfg.grid_h;
}

static inline bool rectInGrid(const GraphConfig& cfg, const GridRect& r) {
    return r.i0 <= r.i1 && r.j0 <= r.j1 && inGrid(cfg, r.i0, r.j0) && inGrid(cfg, r.i1, r.j1);
}

static bool isObstacle(const GraphConfig& cfg, int i, int j, int level) {
    for (const auto& ob : cfg.obstacles) {
        if (ob.level >= 0 && ob.level != level) continue;
        if (ob.rect.contains(i, j)) return true;
    }
    return false;
}

static std::string coordText(const GridCoord& c) {
    std::ostringstream os;
    os << "(" << c.i << "," << c.j << ",L" << c.level << ")";
    return os.str();
}

Status SpatialGraph::validate(const GraphConfig& cfg) {
    if (cfg.levels <= 0 || cfg.grid_w <= 0 || cfg.grid_h <= 0) {
        return Status::error(ErrorCode::ConfigurationError, "levels and grid dimensions must be positive");
    }
    const double cells = static_cast<double>(cfg.levels) * cfg.grid_w * cfg.grid_h;
    if (cells > kMaxDimension * 10.0) {
        return Status::error(ErrorCode::ConfigurationError, "grid too large");
    }
    if (!isFinitePositive(cfg.cell_size_m) || !isFinitePositive(cfg.level_height_m)) {
        return Status::error(ErrorCode::ConfigurationError, "cell size and level height must be positive");
    }
    if (!isFinitePositive(cfg.vertical_cost_factor)) {
        return Status::error(ErrorCode::ConfigurationError, "vertical cost factor must be positive");
    }
    if (!rectInGrid(cfg, cfg.stairway)) {
        return Status::error(ErrorCode::ConfigurationError, "stairway region outside grid bounds");
    }
    for (const auto& ob : cfg.obstacles) {
        if (!rectInGrid(cfg, ob.rect) || ob.level >= cfg.levels) {
            return Status::error(ErrorCode::ConfigurationError, "obstacle outside grid bounds");
        }
    }

    const GridCoord* ends[2] = {&cfg.start, &cfg.target};
    const char* names[2] = {"start", "target"};
    for (int k = 0; k < 2; ++k) {
        const GridCoord& c = *ends[k];
        if (!inGrid(cfg, c.i, c.j) || c.level < 0 || c.level >= cfg.levels) {
            return Status::error(ErrorCode::ConfigurationError,
                                 std::string(names[k]) + " " + coordText(c) + " outside grid bounds");
        }
        if (isObstacle(cfg, c.i, c.j, c.level)) {
            return Status::error(ErrorCode::ConfigurationError,
                                 std::string(names[k]) + " " + coordText(c) + " is inside an obstacle");
        }
    }
    return Status::success();
}

void SpatialGraph::connect(NodeId a, NodeId b, double cost, bool vertical) {
    adjacency_[static_cast<std::size_t>(a)].push_back(Edge{b, cost, vertical});
    ++edge_count_;
}

std::shared_ptr<const SpatialGraph> SpatialGraph::build(const GraphConfig& cfg, Status* status) {
    Status st = validate(cfg);
    if (!st.ok()) {
        if (status) *status = st;
        return nullptr;
    }

    std::shared_ptr<SpatialGraph> g(new SpatialGraph());
    g->cfg_ = cfg;

    const std::size_t num_cells = static_cast<std::size_t>(cfg.levels)
                                * static_cast<std::size_t>(cfg.grid_w)
                                * static_cast<std::size_t>(cfg.grid_h);
    g->cell_to_node_.assign(num_cells, kInvalidNode);

    // 2) Nodes.
    for (int level = 0; level < cfg.levels; ++level) {
        for (int j = 0; j < cfg.grid_h; ++j) {
            for (int i = 0; i < cfg.grid_w; ++i) {
                if (isObstacle(cfg, i, j, level)) continue;

                Node n;
                n.id = static_cast<NodeId>(g->nodes_.size());
                n.cell = GridCoord{i, j, level};
                n.pos_m = Vec3d{i * cfg.cell_size_m, j * cfg.cell_size_m, level * cfg.level_height_m};

                if (cfg.stairway.contains(i, j)) {
                    n.kind = NodeKind::StairCell;
                } else if (level == 0 && (i == 0 || j == 0 || i == cfg.grid_w - 1 || j == cfg.grid_h - 1)) {
                    n.kind = NodeKind::Exit;
                } else {
                    n.kind = NodeKind::FloorCell;
                }

                g->cell_to_node_[g->cellIndex(i, j, level)] = n.id;
                g->nodes_.push_back(n);
            }
        }
    }
    g->adjacency_.resize(g->nodes_.size());

    // 3) + 4) Edges, per node in id order so neighbour lists are stable.
    static constexpr int kDirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    const double vcost = g->verticalEdgeCost();
    for (const Node& n : g->nodes_) {
        for (const auto& d : kDirs) {
            const NodeId m = g->nodeAt(n.cell.i + d[0], n.cell.j + d[1], n.cell.level);
            if (m != kInvalidNode) {
                g->connect(n.id, m, cfg.cell_size_m, false);
            }
        }
        if (n.kind == NodeKind::StairCell) {
            const NodeId up = g->nodeAt(n.cell.i, n.cell.j, n.cell.level + 1);
            const NodeId down = g->nodeAt(n.cell.i, n.cell.j, n.cell.level - 1);
            if (up != kInvalidNode) g->connect(n.id, up, vcost, true);
            if (down != kInvalidNode) g->connect(n.id, down, vcost, true);
        }
    }

    // 5) Distinguished nodes (validated above, so both resolve).
    g->start_ = g->nodeAt(cfg.start);
    g->target_ = g->nodeAt(cfg.target);

    if (status) *status = Status::success();
    return g;
}

NodeId SpatialGraph::nodeAt(int i, int j, int level) const {
    if (i < 0 || j < 0 || level < 0 || i >= cfg_.grid_w || j >= cfg_.grid_h || level >= cfg_.levels) {
        return kInvalidNode;
    }
    return cell_to_node_[cellIndex(i, j, level)];
}

NodeId SpatialGraph::nearestNode(const Vec3d& p_m, int level) const {
    if (nodes_.empty()) return kInvalidNode;
    const int lv = std::clamp(level, 0, cfg_.levels - 1);

    // Fast path: the cell under the point is navigable.
    const int ci = static_cast<int>(std::lround(p_m.x / cfg_.cell_size_m));
    const int cj = static_cast<int>(std::lround(p_m.y / cfg_.cell_size_m));
    const NodeId direct = nodeAt(std::clamp(ci, 0, cfg_.grid_w - 1), std::clamp(cj, 0, cfg_.grid_h - 1), lv);
    if (direct != kInvalidNode) return direct;

    NodeId best = kInvalidNode;
    double best_d = std::numeric_limits<double>::infinity();
    for (const Node& n : nodes_) {
        if (n.cell.level != lv) continue;
        const double d = distanceXY(n.pos_m, p_m);
        if (d < best_d) {
            best_d = d;
            best = n.id;
        }
    }
    return best;
}

double SpatialGraph::unweightedLowerBound(NodeId a, NodeId b) const {
    if (!contains(a) || !contains(b)) return 0.0;
    const Node& na = node(a);
    const Node& nb = node(b);
    const int dl = std::abs(na.cell.level - nb.cell.level);
    return distanceXY(na.pos_m, nb.pos_m) + static_cast<double>(dl) * verticalEdgeCost();
}

double SpatialGraph::pathLength(const std::vector<NodeId>& path) const {
    double total = 0.0;
    for (std::size_t k = 1; k < path.size(); ++k) {
        const NodeId from = path[k - 1];
        const NodeId to = path[k];
        if (!contains(from) || !contains(to)) return -1.0;
        bool found = false;
        for (const Edge& e : neighbors(from)) {
            if (e.to == to) {
                total += e.base_cost;
                found = true;
                break;
            }
        }
        if (!found) return -1.0;
    }
    return total;
}

int SpatialGraph::verticalTransitions(const std::vector<NodeId>& path) const {
    int count = 0;
    for (std::size_t k = 1; k < path.size(); ++k) {
        if (!contains(path[k - 1]) || !contains(path[k])) continue;
        if (node(path[k - 1]).cell.level != node(path[k]).cell.level) ++count;
    }
    return count;
}

} // namespace world
} // namespace rescue
