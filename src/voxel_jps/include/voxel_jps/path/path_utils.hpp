#ifndef PATH_UTILS_HPP_
#define PATH_UTILS_HPP_

#include <vector>
#include <Eigen/Core>

#include "voxel_jps/types.hpp"
#include "voxel_jps/finder/node_table.hpp"
#include "voxel_jps/grid/voxel_grid.hpp"

namespace voxel_jps {

// Follow parent links from 'index' to the root; returns root first
Path backtrace(const NodeTable& table, NodeIndex index);

// backtrace(a) followed by reversed backtrace(b), for two frontiers meeting at a/b
Path bi_backtrace(const NodeTable& table_a, NodeIndex a, const NodeTable& table_b, NodeIndex b);

// Sum of Euclidean segment lengths
double path_length(const Path& path);

// 3D Bresenham line, both ends included
Path interpolate(const VoxelKey& from, const VoxelKey& to);
Path interpolate(int32_t x0, int32_t y0, int32_t z0, int32_t x1, int32_t y1, int32_t z1);

// Interpolate every segment; empty for fewer than 2 points
Path expand_path(const Path& path);

// True if every cell after 'from' on the line to 'to' is walkable
bool has_line_of_sight(const VoxelGrid& grid, const VoxelKey& from, const VoxelKey& to);

// Greedy forward line-of-sight smoothing; keeps start and end
Path smoothen_path(const VoxelGrid& grid, const Path& path);

// Drop interior points that continue the previous direction
Path compress_path(const Path& path);

// Voxel centers in world coordinates
std::vector<Eigen::Vector3f> to_positions(const Path& path, const VoxelGrid& grid);

} // namespace

#endif
