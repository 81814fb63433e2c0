#include "voxel_jps/grid/voxel_grid.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace voxel_jps {

VoxelGrid::VoxelGrid(int32_t width, int32_t height, int32_t depth, std::shared_ptr<const OccupancySource> source, float voxel_size)
    : width_(width)
    , height_(height)
    , depth_(depth)
    , voxel_size_(voxel_size)
    , source_(std::move(source))
{
    if (width_ <= 0 || height_ <= 0 || depth_ <= 0) {
        throw std::invalid_argument("VoxelGrid dimensions must be positive");
    }
    if (!source_) {
        throw std::invalid_argument("VoxelGrid requires an occupancy source");
    }
    if (!(voxel_size_ > 0.0f)) {
        throw std::invalid_argument("VoxelGrid voxel size must be positive");
    }
}

VoxelGrid::VoxelGrid(std::shared_ptr<const DenseVoxelVolume> volume, float voxel_size)
    : VoxelGrid(volume ? volume->width() : 0,
                volume ? volume->height() : 0,
                volume ? volume->depth() : 0,
                volume, voxel_size)
{}

bool VoxelGrid::is_inside(int32_t x, int32_t y, int32_t z) const {
    return x >= 0 && x < width_ &&
           y >= 0 && y < height_ &&
           z >= 0 && z < depth_;
}

bool VoxelGrid::is_empty(int32_t x, int32_t y, int32_t z) const {
    return is_inside(x, y, z) && source_->occupancy(x, y, z) == 0;
}

bool VoxelGrid::is_walkable_at(int32_t x, int32_t y, int32_t z) const {
    if (!is_empty(x, y, z)) return false;
    if (z == 0) return true; // ground layer

    // supported by a solid voxel below
    return source_->occupancy(x, y, z - 1) != 0;
}

Node VoxelGrid::get_node_at(int32_t x, int32_t y, int32_t z) const {
    return Node(VoxelKey{x, y, z});
}

bool VoxelGrid::is_step_allowed(const VoxelKey& from, int32_t dx, int32_t dy, int32_t dz, bool dont_cross_corners) const {
    if (dx == 0 && dy == 0) return false; // no pure vertical moves
    if (std::abs(dx) > 1 || std::abs(dy) > 1 || std::abs(dz) > 1) return false;

    if (!is_walkable_at(from.x + dx, from.y + dy, from.z + dz)) return false;
    if (dx == 0 || dy == 0) return true;

    // diagonal: gated by the two axis cells of the target layer
    const bool side_x = is_walkable_at(from.x + dx, from.y, from.z + dz);
    const bool side_y = is_walkable_at(from.x, from.y + dy, from.z + dz);
    return dont_cross_corners ? (side_x && side_y) : (side_x || side_y);
}

std::vector<VoxelKey> VoxelGrid::get_neighbors(const VoxelKey& key, bool allow_diagonal, bool dont_cross_corners) const {
    std::vector<VoxelKey> neighbors;
    neighbors.reserve(allow_diagonal ? 24 : 12);

    // s[layer][i]: axis neighbor i walkable in layer z-1, z, z+1
    std::array<std::array<bool, 4>, 3> s{};

    for (int32_t cz = -1; cz <= 1; ++cz) {
        for (size_t i = 0; i < axis_offsets.size(); ++i) {
            const VoxelKey nb = key.offset(axis_offsets[i][0], axis_offsets[i][1], cz);
            if (is_walkable_at(nb)) {
                neighbors.push_back(nb);
                s[static_cast<size_t>(cz + 1)][i] = true;
            }
        }
    }

    if (!allow_diagonal) {
        return neighbors;
    }

    for (int32_t cz = -1; cz <= 1; ++cz) {
        const auto& layer = s[static_cast<size_t>(cz + 1)];
        for (size_t i = 0; i < diagonal_offsets.size(); ++i) {
            // diagonal i sits between axis i and axis i-1 (NW between N and W)
            const bool a = layer[i];
            const bool b = layer[(i + 3) % 4];
            const bool gate = dont_cross_corners ? (a && b) : (a || b);
            if (!gate) continue;

            const VoxelKey nb = key.offset(diagonal_offsets[i][0], diagonal_offsets[i][1], cz);
            if (is_walkable_at(nb)) {
                neighbors.push_back(nb);
            }
        }
    }

    return neighbors;
}

VoxelGrid VoxelGrid::clone() const {
    return VoxelGrid(width_, height_, depth_, source_, voxel_size_);
}

VoxelKey VoxelGrid::point_to_key(const Eigen::Vector3f& point) const {
    const float inv_size = 1.0f / voxel_size_;
    return VoxelKey{
        static_cast<int32_t>(std::floor(point.x() * inv_size)),
        static_cast<int32_t>(std::floor(point.y() * inv_size)),
        static_cast<int32_t>(std::floor(point.z() * inv_size))
    };
}

Eigen::Vector3f VoxelGrid::key_to_point(const VoxelKey& key) const {
    // return center of voxel
    return Eigen::Vector3f(
        (static_cast<float>(key.x) + 0.5f) * voxel_size_,
        (static_cast<float>(key.y) + 0.5f) * voxel_size_,
        (static_cast<float>(key.z) + 0.5f) * voxel_size_
    );
}

} // namespace
