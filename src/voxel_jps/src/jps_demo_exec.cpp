#include <iostream>
#include <memory>

#include "voxel_jps/finder/jump_point_finder.hpp"
#include "voxel_jps/grid/voxel_grid.hpp"
#include "voxel_jps/path/path_utils.hpp"

using namespace voxel_jps;

namespace {

/*
 * 24 x 16 x 6 terrain:
 * - a wall two voxels high along x = 8 with a doorway at y = 12,
 * - a staircase climbing +x from x = 14 onto a plateau three voxels high.
 */
std::shared_ptr<DenseVoxelVolume> build_terrain() {
    auto volume = std::make_shared<DenseVoxelVolume>(24, 16, 6);

    volume->fill_box({8, 0, 0}, {8, 15, 1}, 1);
    volume->fill_box({8, 12, 0}, {8, 12, 1}, 0);

    volume->fill_box({14, 0, 0}, {14, 15, 0}, 1);
    volume->fill_box({15, 0, 0}, {15, 15, 1}, 1);
    volume->fill_box({16, 0, 0}, {23, 15, 2}, 1);

    return volume;
}

void print_path(const char* label, const Path& path) {
    std::cout << label << " (" << path.size() << "):";
    for (const auto& key : path) {
        std::cout << " (" << key.x << "," << key.y << "," << key.z << ")";
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    const auto volume = build_terrain();
    const VoxelGrid grid(volume, 0.5f);

    JumpPointConfig config;
    config.heuristic = HeuristicType::OCTILE;
    config.debug_output = true;

    JumpPointFinder finder(config);
    const VoxelKey start{1, 1, 0};
    const VoxelKey goal{21, 3, 3};

    const PathSearchResult result = finder.find_path(start, goal, grid);
    if (!result.found()) {
        std::cerr << "[JPS demo] No route: " << to_string(result.status) << std::endl;
        return 1;
    }

    print_path("Jump points", result.jump_points);
    print_path("Smoothed", smoothen_path(grid, result.path));
    print_path("Compressed", compress_path(result.path));

    const auto positions = to_positions(result.jump_points, grid);
    std::cout << "World waypoints:" << std::endl;
    for (const auto& p : positions) {
        std::cout << "  [" << p.x() << ", " << p.y() << ", " << p.z() << "]" << std::endl;
    }

    return 0;
}
