#include "voxel_jps/grid/occupancy_source.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace voxel_jps {

OccupancyFunction::OccupancyFunction(Lookup lookup) : lookup_(std::move(lookup)) {
    if (!lookup_) {
        throw std::invalid_argument("OccupancyFunction requires a lookup");
    }
}

int32_t OccupancyFunction::occupancy(int32_t x, int32_t y, int32_t z) const {
    return lookup_(x, y, z);
}

DenseVoxelVolume::DenseVoxelVolume(int32_t width, int32_t height, int32_t depth)
    : width_(width)
    , height_(height)
    , depth_(depth)
    , data_()
{
    if (width <= 0 || height <= 0 || depth <= 0) {
        throw std::invalid_argument("DenseVoxelVolume dimensions must be positive");
    }
    data_.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(depth), 0);
}

int32_t DenseVoxelVolume::occupancy(int32_t x, int32_t y, int32_t z) const {
    if (!contains(x, y, z)) return 1;
    return data_[index(x, y, z)];
}

bool DenseVoxelVolume::contains(int32_t x, int32_t y, int32_t z) const {
    return x >= 0 && x < width_ &&
           y >= 0 && y < height_ &&
           z >= 0 && z < depth_;
}

bool DenseVoxelVolume::set(int32_t x, int32_t y, int32_t z, uint8_t value) {
    if (!contains(x, y, z)) return false;
    data_[index(x, y, z)] = value;
    return true;
}

size_t DenseVoxelVolume::fill_box(const VoxelKey& min_corner, const VoxelKey& max_corner, uint8_t value) {
    // clip to volume
    const int32_t x0 = std::max(0, std::min(min_corner.x, max_corner.x));
    const int32_t y0 = std::max(0, std::min(min_corner.y, max_corner.y));
    const int32_t z0 = std::max(0, std::min(min_corner.z, max_corner.z));
    const int32_t x1 = std::min(width_ - 1, std::max(min_corner.x, max_corner.x));
    const int32_t y1 = std::min(height_ - 1, std::max(min_corner.y, max_corner.y));
    const int32_t z1 = std::min(depth_ - 1, std::max(min_corner.z, max_corner.z));

    size_t written = 0;
    for (int32_t z = z0; z <= z1; ++z) {
        for (int32_t y = y0; y <= y1; ++y) {
            for (int32_t x = x0; x <= x1; ++x) {
                data_[index(x, y, z)] = value;
                written++;
            }
        }
    }

    return written;
}

void DenseVoxelVolume::clear() {
    std::fill(data_.begin(), data_.end(), 0);
}

size_t DenseVoxelVolume::count_solid() const {
    return static_cast<size_t>(std::count_if(data_.begin(), data_.end(), [](uint8_t v) { return v != 0; }));
}

size_t DenseVoxelVolume::index(int32_t x, int32_t y, int32_t z) const {
    return (static_cast<size_t>(z) * static_cast<size_t>(height_) + static_cast<size_t>(y)) * static_cast<size_t>(width_)
           + static_cast<size_t>(x);
}

} // namespace
