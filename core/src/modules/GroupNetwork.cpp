#include "modules/GroupNetwork.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <string>

GroupNetwork::GroupNetwork(std::uint32_t nodes) : adj_(nodes) {}

bool GroupNetwork::addEdge(std::uint32_t a, std::uint32_t b) {
    if (a == b || hasEdge(a, b)) return false;
    adj_[a].push_back(b);
    adj_[b].push_back(a);
    return true;
}

bool GroupNetwork::removeEdge(std::uint32_t a, std::uint32_t b) {
    auto& na = adj_[a];
    auto it = std::find(na.begin(), na.end(), b);
    if (it == na.end()) return false;
    na.erase(it);
    auto& nb = adj_[b];
    nb.erase(std::remove(nb.begin(), nb.end(), a), nb.end());
    return true;
}

bool GroupNetwork::hasEdge(std::uint32_t a, std::uint32_t b) const {
    const auto& na = adj_[a];
    return std::find(na.begin(), na.end(), b) != na.end();
}

std::size_t GroupNetwork::edgeCount() const {
    std::size_t total = 0;
    for (const auto& nbrs : adj_) total += nbrs.size();
    return total / 2;
}

namespace {

// Replace edge (u, v) by (u, w) for a random w. Gives up (edge kept) once u
// is adjacent to every other node.
void rewireEdge(GroupNetwork& g, std::uint32_t u, std::uint32_t v,
                std::mt19937_64& rng, std::uniform_int_distribution<std::uint32_t>& nodeDist) {
    const std::uint32_t n = g.size();
    std::uint32_t w = nodeDist(rng);
    while (w == u || g.hasEdge(u, w)) {
        w = nodeDist(rng);
        if (g.degree(u) >= n - 1) return;  // skip this rewiring
    }
    g.removeEdge(u, v);
    g.addEdge(u, w);
}

// Number of neighbours of `node` in the other group.
std::uint32_t crossDegree(const GroupNetwork& g, std::uint32_t node) {
    const auto own = g.groupOf(node);
    std::uint32_t count = 0;
    for (auto nb : g.neighbors(node)) {
        if (g.groupOf(nb) != own) ++count;
    }
    return count;
}

// Between-group offsets 0, +1, -1, +2, -2, ...
std::vector<int> betweenGroupOffsets(std::uint32_t kOut) {
    std::vector<int> offsets;
    offsets.reserve(kOut);
    for (std::uint32_t i = 0; i < kOut; ++i) {
        const int step = static_cast<int>((i + 1) / 2);
        offsets.push_back(i % 2 == 1 ? step : -step);
    }
    return offsets;
}

}  // namespace

GroupNetwork buildRingSmallWorld(std::uint32_t n, std::uint32_t k, double p, std::uint64_t seed) {
    if (k >= n) {
        throw ConfigurationError("k >= n (k=" + std::to_string(k) + ", n=" +
                                 std::to_string(n) + "), choose smaller k or larger n");
    }

    GroupNetwork g(n);
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::uniform_int_distribution<std::uint32_t> nodeDist(0, n - 1);
    const std::uint32_t halfK = k / 2;

    // Ring lattice: each node linked to its halfK successors
    for (std::uint32_t j = 1; j <= halfK; ++j) {
        for (std::uint32_t u = 0; u < n; ++u) {
            g.addEdge(u, (u + j) % n);
        }
    }

    // Odd degree: extra successor edge with probability 1/2, rewired on the spot
    if (k % 2 == 1) {
        for (std::uint32_t m = 0; m < n; ++m) {
            if (uniDist(rng) < 0.5) {
                const std::uint32_t oddTarget = (m + halfK + 1) % n;
                g.addEdge(m, oddTarget);
                if (uniDist(rng) < p) {
                    rewireEdge(g, m, oddTarget, rng, nodeDist);
                }
            }
        }
    }

    // Rewiring pass: outer loop over lattice distance, inner loop in node order
    for (std::uint32_t j = 1; j <= halfK; ++j) {
        for (std::uint32_t u = 0; u < n; ++u) {
            if (uniDist(rng) < p) {
                const std::uint32_t v = (u + j) % n;
                if (!g.hasEdge(u, v)) continue;
                rewireEdge(g, u, v, rng, nodeDist);
            }
        }
    }
    return g;
}

GroupNetwork buildGroupNetwork(const NetworkParams& params, std::mt19937_64& rng) {
    validation::require(params.nodes > 0 && params.nodes % 2 == 0,
                        "number of nodes must be even and positive (got " +
                        std::to_string(params.nodes) + ")");
    validation::checkUnitInterval(params.rewireProb, "rewireProb");

    const std::uint32_t n = params.nodes;
    const std::uint32_t groupSize = n / 2;
    validation::require(params.kIn < groupSize,
                        "kIn must be smaller than the group size (kIn=" +
                        std::to_string(params.kIn) + ", group size=" +
                        std::to_string(groupSize) + ")");
    validation::require(params.kOut <= groupSize,
                        "kOut must not exceed the group size (kOut=" +
                        std::to_string(params.kOut) + ", group size=" +
                        std::to_string(groupSize) + ")");

    GroupNetwork first = buildRingSmallWorld(groupSize, params.kIn, params.rewireProb, params.seed);
    GroupNetwork second = buildRingSmallWorld(groupSize, params.kIn, params.rewireProb,
                                              params.seed + kSecondRingSeedOffset);

    GroupNetwork g(n);
    for (std::uint32_t u = 0; u < groupSize; ++u) {
        for (auto v : first.neighbors(u)) {
            if (u < v) g.addEdge(u, v);
        }
    }
    for (std::uint32_t u = 0; u < groupSize; ++u) {
        for (auto v : second.neighbors(u)) {
            if (u < v) g.addEdge(u + groupSize, v + groupSize);
        }
    }

    // Group 1 node i links to group 2 nodes i+offset (wrapped within group 2)
    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::uniform_int_distribution<std::uint32_t> localDist(0, groupSize - 1);
    const auto offsets = betweenGroupOffsets(params.kOut);

    for (std::uint32_t from = 0; from < groupSize; ++from) {
        for (int offset : offsets) {
            std::int64_t to = static_cast<std::int64_t>(from) + groupSize + offset;
            if (to >= static_cast<std::int64_t>(n)) to -= groupSize;
            if (to < static_cast<std::int64_t>(groupSize)) to += groupSize;
            const auto edgeTo = static_cast<std::uint32_t>(to);

            g.addEdge(from, edgeTo);
            if (uniDist(rng) >= params.rewireProb) continue;

            g.removeEdge(from, edgeTo);
            while (true) {
                // Neither endpoint can take a new partner: keep the original link
                if (crossDegree(g, from) >= groupSize && crossDegree(g, edgeTo) >= groupSize) {
                    g.addEdge(from, edgeTo);
                    break;
                }
                std::uint32_t fromNew = from;
                std::uint32_t toNew = edgeTo;
                if (uniDist(rng) < 0.5) {
                    toNew = groupSize + localDist(rng);
                } else {
                    fromNew = localDist(rng);
                }
                if (fromNew != toNew && !g.hasEdge(fromNew, toNew)) {
                    g.addEdge(fromNew, toNew);
                    break;
                }
            }
        }
    }

    g.setLayout(twoRingLayout(groupSize));
    return g;
}

GroupNetwork buildGroupNetwork(const NetworkParams& params) {
    std::mt19937_64 rng(params.seed);
    return buildGroupNetwork(params, rng);
}

std::vector<std::array<double, 2>> twoRingLayout(std::uint32_t groupSize) {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kRingCenter = 1.5;
    std::vector<std::array<double, 2>> layout;
    layout.reserve(2 * static_cast<std::size_t>(groupSize));
    for (int group = 0; group < 2; ++group) {
        const double cx = group == 0 ? -kRingCenter : kRingCenter;
        for (std::uint32_t i = 0; i < groupSize; ++i) {
            const double angle = 2.0 * kPi * i / groupSize;
            layout.push_back({cx + std::cos(angle), std::sin(angle)});
        }
    }
    return layout;
}
