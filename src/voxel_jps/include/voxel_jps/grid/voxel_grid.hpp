#ifndef VOXEL_GRID_HPP_
#define VOXEL_GRID_HPP_

#include <array>
#include <memory>
#include <vector>
#include <Eigen/Core>

#include "voxel_jps/types.hpp"
#include "voxel_jps/finder/node.hpp"
#include "voxel_jps/grid/occupancy_source.hpp"

namespace voxel_jps {

/*
 * Walkability view over an occupancy source.
 *
 * A cell is walkable when it lies inside the grid, its voxel is empty and it is
 * supported: either z == 0 or the voxel below is solid. Agents move one column
 * sideways per step (axis or diagonal) and may change layer by at most one in the
 * same step. Pure vertical moves do not exist.
 *
 * The source is shared, not copied. It must stay unchanged while a search runs.
 */
class VoxelGrid {
public:
    VoxelGrid(int32_t width, int32_t height, int32_t depth, std::shared_ptr<const OccupancySource> source, float voxel_size = 1.0f);
    explicit VoxelGrid(std::shared_ptr<const DenseVoxelVolume> volume, float voxel_size = 1.0f);

    bool is_inside(int32_t x, int32_t y, int32_t z) const;
    bool is_inside(const VoxelKey& key) const { return is_inside(key.x, key.y, key.z); }
    bool is_walkable_at(int32_t x, int32_t y, int32_t z) const;
    bool is_walkable_at(const VoxelKey& key) const { return is_walkable_at(key.x, key.y, key.z); }

    Node get_node_at(int32_t x, int32_t y, int32_t z) const; // fresh node, walkability not implied
    Node get_node_at(const VoxelKey& key) const { return Node(key); }

    // Single step from 'from' by (dx, dy, dz). Diagonals are gated by the two axis cells in the target layer:
    // both walkable with dont_cross_corners, else at least one.
    bool is_step_allowed(const VoxelKey& from, int32_t dx, int32_t dy, int32_t dz, bool dont_cross_corners) const;

    // Axis moves N, E, S, W for layers z-1, z, z+1, then diagonals NW, NE, SE, SW for the same layers
    std::vector<VoxelKey> get_neighbors(const VoxelKey& key, bool allow_diagonal, bool dont_cross_corners) const;

    VoxelGrid clone() const;

    VoxelKey point_to_key(const Eigen::Vector3f& point) const;
    Eigen::Vector3f key_to_point(const VoxelKey& key) const; // voxel center

    int32_t width() const { return width_; }
    int32_t height() const { return height_; }
    int32_t depth() const { return depth_; }
    float voxel_size() const { return voxel_size_; }
    const std::shared_ptr<const OccupancySource>& source() const { return source_; }

    // Planar offsets in neighbor order
    static constexpr std::array<std::array<int32_t, 2>, 4> axis_offsets = {{
        {0, -1}, {1, 0}, {0, 1}, {-1, 0}
    }};
    static constexpr std::array<std::array<int32_t, 2>, 4> diagonal_offsets = {{
        {-1, -1}, {1, -1}, {1, 1}, {-1, 1}
    }};

private:
    bool is_empty(int32_t x, int32_t y, int32_t z) const; // inside and not solid

    int32_t width_;
    int32_t height_;
    int32_t depth_;
    float voxel_size_;
    std::shared_ptr<const OccupancySource> source_;
};

} // namespace

#endif
