#ifndef NODE_HPP_
#define NODE_HPP_

#include <cstdint>
#include "voxel_jps/types.hpp"

namespace voxel_jps {

using NodeIndex = int32_t;
constexpr NodeIndex kNoNode = -1;

struct Node {
    VoxelKey key{0, 0, 0};

    double g{0.0}; // cost from start
    double h{0.0}; // estimate to goal
    double f{0.0}; // g + h
    bool h_known{false}; // h is computed once per run

    bool opened{false};
    bool closed{false}; // expanded at least once

    // JPS expansions, one bit per incoming planar direction plus one for a full expansion
    uint16_t pending_dirs{0};
    uint16_t expanded_dirs{0};

    bool tested{false}; // touched by a jump ray (debug)

    NodeIndex parent{kNoNode}; // index into the owning NodeTable

    Node() = default;
    explicit Node(const VoxelKey& k) : key(k) {}

    bool has_parent() const { return parent != kNoNode; }
};

} // namespace

#endif
