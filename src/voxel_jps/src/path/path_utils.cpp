#include "voxel_jps/path/path_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>

namespace voxel_jps {

Path backtrace(const NodeTable& table, NodeIndex index) {
    Path path;
    if (index < 0 || static_cast<size_t>(index) >= table.size()) return path;

    // a parent chain never has more links than the table has nodes
    size_t remaining = table.size();
    NodeIndex curr = index;
    while (curr != kNoNode && remaining-- > 0) {
        const Node& node = table[curr];
        path.push_back(node.key);
        curr = node.parent;
    }

    std::reverse(path.begin(), path.end());
    return path;
}

Path bi_backtrace(const NodeTable& table_a, NodeIndex a, const NodeTable& table_b, NodeIndex b) {
    Path path = backtrace(table_a, a);
    Path path_b = backtrace(table_b, b);
    path.insert(path.end(), path_b.rbegin(), path_b.rend());
    return path;
}

double path_length(const Path& path) {
    double sum = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        const Eigen::Vector3d a(path[i-1].x, path[i-1].y, path[i-1].z);
        const Eigen::Vector3d b(path[i].x, path[i].y, path[i].z);
        sum += (b - a).norm();
    }
    return sum;
}

Path interpolate(const VoxelKey& from, const VoxelKey& to) {
    return interpolate(from.x, from.y, from.z, to.x, to.y, to.z);
}

Path interpolate(int32_t x0, int32_t y0, int32_t z0, int32_t x1, int32_t y1, int32_t z1) {
    const int32_t dx = std::abs(x1 - x0);
    const int32_t dy = std::abs(y1 - y0);
    const int32_t dz = std::abs(z1 - z0);

    const int32_t sx = (x0 < x1) ? 1 : -1;
    const int32_t sy = (y0 < y1) ? 1 : -1;
    const int32_t sz = (z0 < z1) ? 1 : -1;

    Path line;
    line.reserve(static_cast<size_t>(std::max({dx, dy, dz})) + 1);
    line.push_back({x0, y0, z0});

    // driving axis steps every iteration, the other two when their error turns non-negative
    // one error term per minor axis keeps each axis exact
    if (dx >= dy && dx >= dz) {
        int32_t e1 = 2 * dy - dx;
        int32_t e2 = 2 * dz - dx;
        while (x0 != x1) {
            x0 += sx;
            if (e1 >= 0) { y0 += sy; e1 -= 2 * dx; }
            if (e2 >= 0) { z0 += sz; e2 -= 2 * dx; }
            e1 += 2 * dy;
            e2 += 2 * dz;
            line.push_back({x0, y0, z0});
        }
    }
    else if (dy >= dx && dy >= dz) {
        int32_t e1 = 2 * dx - dy;
        int32_t e2 = 2 * dz - dy;
        while (y0 != y1) {
            y0 += sy;
            if (e1 >= 0) { x0 += sx; e1 -= 2 * dy; }
            if (e2 >= 0) { z0 += sz; e2 -= 2 * dy; }
            e1 += 2 * dx;
            e2 += 2 * dz;
            line.push_back({x0, y0, z0});
        }
    }
    else {
        int32_t e1 = 2 * dy - dz;
        int32_t e2 = 2 * dx - dz;
        while (z0 != z1) {
            z0 += sz;
            if (e1 >= 0) { y0 += sy; e1 -= 2 * dz; }
            if (e2 >= 0) { x0 += sx; e2 -= 2 * dz; }
            e1 += 2 * dy;
            e2 += 2 * dx;
            line.push_back({x0, y0, z0});
        }
    }

    return line;
}

Path expand_path(const Path& path) {
    Path expanded;
    if (path.size() < 2) return expanded;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const Path segment = interpolate(path[i], path[i + 1]);
        // segment end is the next segment's start
        expanded.insert(expanded.end(), segment.begin(), segment.end() - 1);
    }
    expanded.push_back(path.back());

    return expanded;
}

bool has_line_of_sight(const VoxelGrid& grid, const VoxelKey& from, const VoxelKey& to) {
    const Path line = interpolate(from, to);
    for (size_t j = 1; j < line.size(); ++j) {
        if (!grid.is_walkable_at(line[j])) return false;
    }
    return true;
}

Path smoothen_path(const VoxelGrid& grid, const Path& path) {
    if (path.size() < 3) return path;

    Path smoothed;
    smoothed.push_back(path.front());

    VoxelKey anchor = path.front();
    for (size_t i = 2; i < path.size(); ++i) {
        if (!has_line_of_sight(grid, anchor, path[i])) {
            // path[i-1] was the last point visible from the anchor
            anchor = path[i - 1];
            smoothed.push_back(anchor);
        }
    }
    smoothed.push_back(path.back());

    return smoothed;
}

namespace {

VoxelKey reduced_direction(const VoxelKey& from, const VoxelKey& to) {
    const int32_t dx = to.x - from.x;
    const int32_t dy = to.y - from.y;
    const int32_t dz = to.z - from.z;
    const int32_t g = std::gcd(std::gcd(std::abs(dx), std::abs(dy)), std::abs(dz));
    if (g == 0) return VoxelKey{0, 0, 0};
    return VoxelKey{dx / g, dy / g, dz / g};
}

} // namespace

Path compress_path(const Path& path) {
    // nothing to compress
    if (path.size() < 3) return path;

    Path compressed;
    compressed.push_back(path.front());

    VoxelKey last = path.front();
    VoxelKey last_dir{0, 0, 0};
    bool has_dir = false;

    for (size_t i = 1; i < path.size(); ++i) {
        if (path[i] == last) continue; // repeated point

        const VoxelKey dir = reduced_direction(last, path[i]);
        if (has_dir && dir != last_dir) {
            compressed.push_back(last);
        }

        last_dir = dir;
        has_dir = true;
        last = path[i];
    }

    if (compressed.back() != last) {
        compressed.push_back(last);
    }

    return compressed;
}

std::vector<Eigen::Vector3f> to_positions(const Path& path, const VoxelGrid& grid) {
    std::vector<Eigen::Vector3f> positions;
    positions.reserve(path.size());
    for (const auto& key : path) {
        positions.push_back(grid.key_to_point(key));
    }
    return positions;
}

} // namespace
