#include "voxel_jps/finder/heuristic.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace voxel_jps {
namespace heuristic {

double manhattan(int32_t dx, int32_t dy, int32_t dz) {
    return static_cast<double>(std::abs(dx)) + std::abs(dy) + std::abs(dz);
}

double euclidean(int32_t dx, int32_t dy, int32_t dz) {
    const double x = dx;
    const double y = dy;
    const double z = dz;
    return std::sqrt(x*x + y*y + z*z);
}

double octile(int32_t dx, int32_t dy, int32_t dz) {
    // sort so that a >= b >= c
    int32_t a = std::abs(dx);
    int32_t b = std::abs(dy);
    int32_t c = std::abs(dz);
    if (a < b) std::swap(a, b);
    if (b < c) std::swap(b, c);
    if (a < b) std::swap(a, b);

    // c full diagonals, (b - c) face diagonals, (a - b) straight steps
    return (constants::SQRT3 - constants::SQRT2) * c + (constants::SQRT2 - 1.0) * b + a;
}

double chebyshev(int32_t dx, int32_t dy, int32_t dz) {
    return static_cast<double>(std::max({std::abs(dx), std::abs(dy), std::abs(dz)}));
}

HeuristicFn from_type(HeuristicType type) {
    switch (type) {
        case HeuristicType::EUCLIDEAN: return &euclidean;
        case HeuristicType::OCTILE: return &octile;
        case HeuristicType::CHEBYSHEV: return &chebyshev;
        case HeuristicType::MANHATTAN: break;
    }
    return &manhattan;
}

} // namespace heuristic
} // namespace voxel_jps
