#ifndef VOXEL_JPS_TYPES_HPP_
#define VOXEL_JPS_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <vector>

namespace voxel_jps {

/* VoxelKey and VoxelKeyHash */
struct VoxelKey {
    int32_t x,y,z;
    bool operator==(const VoxelKey& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const VoxelKey& other) const {
        return !(*this == other);
    }

    bool operator<(const VoxelKey& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }

    VoxelKey offset(int32_t dx, int32_t dy, int32_t dz) const {
        return VoxelKey{x + dx, y + dy, z + dz};
    }
};

struct VoxelKeyHash {
    std::size_t operator()(const VoxelKey& k) const {
        // large primes for better distribution
        constexpr std::size_t p1 = 73856093;
        constexpr std::size_t p2 = 19349663;
        constexpr std::size_t p3 = 83492791;
        return (static_cast<std::size_t>(k.x) * p1) ^
               (static_cast<std::size_t>(k.y) * p2) ^
               (static_cast<std::size_t>(k.z) * p3);
    }
};

// Ordered voxel coordinates, start first
using Path = std::vector<VoxelKey>;

/* Constants */
namespace constants {
    constexpr double EPSILON = 1e-9;
    constexpr double SQRT2 = 1.4142135623730951;
    constexpr double SQRT3 = 1.7320508075688772;
}

} // namespace

#endif
