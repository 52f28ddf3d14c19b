#ifndef GROUP_NETWORK_H
#define GROUP_NETWORK_H

#include <array>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

// ---------- Network Parameters ----------
struct NetworkParams {
    std::uint32_t nodes = 100;      // n (even), split into two equal groups
    std::uint32_t kIn = 8;          // intra-group degree (may be odd)
    std::uint32_t kOut = 2;         // inter-group links per group-1 node
    double rewireProb = 0.0;        // p, applied to intra- and inter-group edges
    std::uint64_t seed = 42;        // ring lattices use seed and seed + kSecondRingSeedOffset
};

/**
 * Undirected simple graph over two equal-size identity groups.
 *
 * Nodes [0, groupSize) form group 0, [groupSize, 2*groupSize) form group 1.
 * Adjacency lists keep edge insertion order; rewired edges go to the back.
 */
class GroupNetwork {
public:
    GroupNetwork() = default;
    explicit GroupNetwork(std::uint32_t nodes);

    bool addEdge(std::uint32_t a, std::uint32_t b);     // false if already present
    bool removeEdge(std::uint32_t a, std::uint32_t b);  // false if absent
    bool hasEdge(std::uint32_t a, std::uint32_t b) const;

    std::uint32_t size() const { return static_cast<std::uint32_t>(adj_.size()); }
    std::uint32_t groupSize() const { return size() / 2; }
    std::uint32_t degree(std::uint32_t node) const { return static_cast<std::uint32_t>(adj_[node].size()); }
    std::uint8_t groupOf(std::uint32_t node) const { return node < groupSize() ? 0 : 1; }
    std::size_t edgeCount() const;

    const std::vector<std::uint32_t>& neighbors(std::uint32_t node) const { return adj_[node]; }

    // 2D placement for visualization only
    const std::vector<std::array<double, 2>>& layout() const { return layout_; }
    void setLayout(std::vector<std::array<double, 2>> layout) { layout_ = std::move(layout); }

private:
    std::vector<std::vector<std::uint32_t>> adj_;
    std::vector<std::array<double, 2>> layout_;
};

// Seed offset that decorrelates the second group's ring lattice from the first.
constexpr std::uint64_t kSecondRingSeedOffset = 100;

// Small-world ring lattice over `n` nodes with degree `k` (odd k allowed:
// each node gains its +(k/2+1) neighbour with probability 1/2).
// Throws ConfigurationError if k >= n.
GroupNetwork buildRingSmallWorld(std::uint32_t n, std::uint32_t k, double p, std::uint64_t seed);

// Two ring lattices stacked on top of each other, linked by kOut
// positional inter-group edges. Inter-group rewiring draws come from `rng`.
GroupNetwork buildGroupNetwork(const NetworkParams& params, std::mt19937_64& rng);

// Same, with a generator seeded from params.seed.
GroupNetwork buildGroupNetwork(const NetworkParams& params);

// Deterministic two-ring placement (group 0 left, group 1 right).
std::vector<std::array<double, 2>> twoRingLayout(std::uint32_t groupSize);

#endif
