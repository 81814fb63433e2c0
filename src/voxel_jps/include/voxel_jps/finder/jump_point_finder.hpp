#ifndef JUMP_POINT_FINDER_HPP_
#define JUMP_POINT_FINDER_HPP_

#include <optional>
#include <vector>

#include "voxel_jps/common/finder_types.hpp"
#include "voxel_jps/finder/heuristic.hpp"
#include "voxel_jps/finder/node_table.hpp"
#include "voxel_jps/finder/open_list.hpp"
#include "voxel_jps/grid/voxel_grid.hpp"

namespace voxel_jps {

/*
 * Jump Point Search over a layered voxel grid.
 *
 * Planar rays run inside one z-layer with the 2D corner-cutting JPS rules. A cell that
 * has any legal step into another layer (ramp, ledge, drop) stops every ray and is
 * expanded with all its neighbours, as is a cell entered by a layer change. Layer
 * changes therefore only happen at jump points and each layer is searched as plain
 * 2D JPS between them.
 *
 * Expansions are tracked per cell and incoming direction, so a jump point reached
 * again from a new direction is expanded again for that direction.
 *
 * Node state lives in a NodeTable owned by the finder and reset on every call, so a
 * finder runs one search at a time while grids can be shared between finders.
 */
class JumpPointFinder {
public:
    JumpPointFinder();
    explicit JumpPointFinder(const JumpPointConfig& config);

    void set_config(const JumpPointConfig& config);
    const JumpPointConfig& config() const { return config_; }

    // Overrides the configured heuristic type; fn receives absolute deltas to the goal
    void set_heuristic(HeuristicFn fn);

    PathSearchResult find_path(const VoxelKey& start, const VoxelKey& goal, const VoxelGrid& grid);
    PathSearchResult find_path(int32_t start_x, int32_t start_y, int32_t start_z,
                               int32_t goal_x, int32_t goal_y, int32_t goal_z, const VoxelGrid& grid);

    // Search state of the last run (tested flags, parents)
    const NodeTable& nodes() const { return nodes_; }

private:
    struct Direction {
        int32_t dx, dy, dz;
        bool is_diagonal() const { return dx != 0 && dy != 0; }
    };

    void identify_successors(NodeIndex index);
    std::vector<VoxelKey> find_neighbors(const VoxelKey& key, const Direction& d) const; // planar pruning
    std::optional<VoxelKey> jump(const VoxelKey& origin, const Direction& d);

    bool has_forced_neighbor(const VoxelKey& key, const Direction& d) const;
    bool has_layer_step(const VoxelKey& key) const; // any legal step with dz != 0
    uint16_t expansion_bit(const VoxelKey& key, const Direction& d) const; // how a jump point reached along d is expanded
    bool step(const VoxelKey& from, int32_t dx, int32_t dy, int32_t dz) const;
    bool walkable(const VoxelKey& key, int32_t dx, int32_t dy, int32_t dz) const;
    void mark_tested(const VoxelKey& key);

    JumpPointConfig config_;
    HeuristicFn heuristic_;

    // per-run state
    const VoxelGrid* grid_{nullptr};
    NodeTable nodes_;
    OpenList open_list_;
    NodeIndex start_index_{kNoNode};
    NodeIndex goal_index_{kNoNode};
    VoxelKey goal_key_{0, 0, 0};
    SearchStatistics stats_;
};

} // namespace

#endif
