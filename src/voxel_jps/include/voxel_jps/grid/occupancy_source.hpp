#ifndef OCCUPANCY_SOURCE_HPP_
#define OCCUPANCY_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <vector>

#include "voxel_jps/types.hpp"

namespace voxel_jps {

// Read-only voxel lookup. 0 is empty, anything else is solid.
class OccupancySource {
public:
    virtual ~OccupancySource() = default;
    virtual int32_t occupancy(int32_t x, int32_t y, int32_t z) const = 0;
};

// Adapter for a caller supplied lookup
class OccupancyFunction : public OccupancySource {
public:
    using Lookup = std::function<int32_t(int32_t, int32_t, int32_t)>;

    explicit OccupancyFunction(Lookup lookup);

    int32_t occupancy(int32_t x, int32_t y, int32_t z) const override;

private:
    Lookup lookup_;
};

// Dense width x height x depth byte volume, x fastest
class DenseVoxelVolume : public OccupancySource {
public:
    DenseVoxelVolume(int32_t width, int32_t height, int32_t depth);
    DenseVoxelVolume(const DenseVoxelVolume&) = default;
    DenseVoxelVolume& operator=(const DenseVoxelVolume&) = default;
    DenseVoxelVolume(DenseVoxelVolume&&) noexcept = default;
    DenseVoxelVolume& operator=(DenseVoxelVolume&&) noexcept = default;
    ~DenseVoxelVolume() override = default;

    int32_t occupancy(int32_t x, int32_t y, int32_t z) const override; // out of range reads as solid

    bool contains(int32_t x, int32_t y, int32_t z) const;
    bool contains(const VoxelKey& key) const { return contains(key.x, key.y, key.z); }
    bool set(int32_t x, int32_t y, int32_t z, uint8_t value); // false if out of range
    bool set(const VoxelKey& key, uint8_t value) { return set(key.x, key.y, key.z, value); }
    size_t fill_box(const VoxelKey& min_corner, const VoxelKey& max_corner, uint8_t value); // inclusive, clipped
    void clear();

    int32_t width() const { return width_; }
    int32_t height() const { return height_; }
    int32_t depth() const { return depth_; }
    size_t size() const { return data_.size(); }
    size_t count_solid() const;

private:
    size_t index(int32_t x, int32_t y, int32_t z) const;

    int32_t width_;
    int32_t height_;
    int32_t depth_;
    std::vector<uint8_t> data_;
};

} // namespace

#endif
