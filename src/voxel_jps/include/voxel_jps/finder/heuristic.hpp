#ifndef HEURISTIC_HPP_
#define HEURISTIC_HPP_

#include <cstdint>
#include <functional>

#include "voxel_jps/common/finder_types.hpp"

namespace voxel_jps {

// Distance estimate from absolute per-axis deltas
using HeuristicFn = std::function<double(int32_t dx, int32_t dy, int32_t dz)>;

namespace heuristic {

double manhattan(int32_t dx, int32_t dy, int32_t dz);
double euclidean(int32_t dx, int32_t dy, int32_t dz);
double octile(int32_t dx, int32_t dy, int32_t dz); // exact 26-connected lattice distance
double chebyshev(int32_t dx, int32_t dy, int32_t dz);

HeuristicFn from_type(HeuristicType type);

} // namespace heuristic

} // namespace voxel_jps

#endif
