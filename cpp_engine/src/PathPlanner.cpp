#include "PathPlanner.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <limits>
#include <queue>
#include <utility>

namespace rescue {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

inline double nonNegative(double x) {
    return (std::isfinite(x) && x > 0.0) ? x : 0.0;
}

inline double penaltyAt(const NodePenalty* p, world::NodeId id) {
    if (!p || id < 0 || static_cast<std::size_t>(id) >= p->size()) return 0.0;
    return nonNegative((*p)[static_cast<std::size_t>(id)]);
}

// Relative tolerance for "same cost".
inline bool sameCost(double a, double b) {
    return std::abs(a - b) <= 1e-9 * (1.0 + std::max(std::abs(a), std::abs(b)));
}

struct Label {
    double g = kInf;
    int vt = INT_MAX;
    world::NodeId parent = world::kInvalidNode;
    bool closed = false;
};

struct OpenItem {
    double f = 0.0;
    double g = 0.0;
    int vt = 0;
    world::NodeId id = world::kInvalidNode;
};

// Min-heap order on (f, vertical transitions, node id). Exact on f: the
// relative tolerance is for label relaxation only.
struct OpenWorse {
    bool operator()(const OpenItem& a, const OpenItem& b) const {
        if (a.f != b.f) return a.f > b.f;
        if (a.vt != b.vt) return a.vt > b.vt;
        return a.id > b.id;
    }
};

} // namespace

PathPlanner::PathPlanner(world::SpatialGraphPtr graph, const PlannerConfig& cfg)
    : graph_(std::move(graph)), cfg_(cfg) {}

double PathPlanner::lambda(double risk_tolerance) const {
    const double rt = std::isfinite(risk_tolerance) ? std::clamp(risk_tolerance, 0.0, 1.0) : 0.0;
    return nonNegative(cfg_.danger_weight) * (1.0 - rt);
}

double PathPlanner::heuristic(world::NodeId from, world::NodeId goal) const {
    const double scale = std::isfinite(cfg_.heuristic_scale) ? std::clamp(cfg_.heuristic_scale, 0.0, 1.0) : 0.0;
    return scale * graph_->unweightedLowerBound(from, goal);
}

PlanResult PathPlanner::plan(const PlanRequest& req) const {
    PlanResult out;
    const world::SpatialGraph& g = *graph_;

    if (!g.contains(req.start) || !g.contains(req.goal)) {
        out.status = Status::error(ErrorCode::NoPathFound, "start or goal is not a graph node");
        return out;
    }

    out.lambda = lambda(req.risk_tolerance);

    const std::size_t n = static_cast<std::size_t>(g.nodeCount());
    std::vector<Label> labels(n);

    // Snapshot intensities, sampled lazily once per node.
    std::vector<double> hazard_cache(n, -1.0);
    auto hazardAt = [&](world::NodeId id) -> double {
        double& h = hazard_cache[static_cast<std::size_t>(id)];
        if (h < 0.0) {
            h = req.hazard ? nonNegative(req.hazard->intensityAtNode(g, id, req.hazard_t_s)) : 0.0;
        }
        return h;
    };

    std::priority_queue<OpenItem, std::vector<OpenItem>, OpenWorse> open;

    Label& s = labels[static_cast<std::size_t>(req.start)];
    s.g = 0.0;
    s.vt = 0;
    s.parent = req.start;
    open.push(OpenItem{heuristic(req.start, req.goal), 0.0, 0, req.start});

    while (!open.empty()) {
        const OpenItem cur = open.top();
        open.pop();

        Label& cl = labels[static_cast<std::size_t>(cur.id)];
        if (cl.closed) continue;
        // Stale entry: a better label was pushed after this one.
        if (cur.g != cl.g || cur.vt != cl.vt) continue;
        cl.closed = true;
        ++out.expansions;

        if (cur.id == req.goal) {
            // Reconstruct goal -> start, then reverse.
            world::NodeId at = req.goal;
            while (true) {
                out.path.push_back(at);
                const world::NodeId p = labels[static_cast<std::size_t>(at)].parent;
                if (p == at) break;
                at = p;
            }
            std::reverse(out.path.begin(), out.path.end());

            out.planned_intensity.reserve(out.path.size());
            for (world::NodeId id : out.path) {
                out.planned_intensity.push_back(hazardAt(id));
            }
            out.cost = cl.g;
            out.length_m = g.pathLength(out.path);
            out.vertical_transitions = cl.vt;
            return out;
        }

        if (cfg_.max_expansions != 0u && out.expansions >= cfg_.max_expansions) {
            break;
        }

        for (const world::Edge& e : g.neighbors(cur.id)) {
            Label& nl = labels[static_cast<std::size_t>(e.to)];
            if (nl.closed) continue;

            const double danger = hazardAt(e.to)
                                + penaltyAt(req.persistent_penalty, e.to)
                                + penaltyAt(req.shared_penalty, e.to);
            const double step = e.base_cost * (1.0 + out.lambda * danger);
            const double tg = cl.g + step;
            const int tvt = cl.vt + (e.vertical ? 1 : 0);

            bool better = false;
            if (nl.g == kInf) {
                better = true;
            } else if (!sameCost(tg, nl.g)) {
                better = tg < nl.g;
            } else if (tvt != nl.vt) {
                better = tvt < nl.vt;
            } else {
                better = cur.id < nl.parent;
            }
            if (!better) continue;

            nl.g = tg;
            nl.vt = tvt;
            nl.parent = cur.id;
            open.push(OpenItem{tg + heuristic(e.to, req.goal), tg, tvt, e.to});
        }
    }

    out.path.clear();
    out.status = Status::error(ErrorCode::NoPathFound,
                               (cfg_.max_expansions != 0u && out.expansions >= cfg_.max_expansions)
                                   ? "expansion budget exhausted"
                                   : "target unreachable from start");
    return out;
}

} // namespace rescue
