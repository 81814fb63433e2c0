/// @file test_voxel_grid.cpp
/// @brief Tests for walkability, steps and neighbour enumeration

#include <catch2/catch.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "voxel_jps/grid/voxel_grid.hpp"

using namespace voxel_jps;

namespace {

bool contains_key(const std::vector<VoxelKey>& keys, const VoxelKey& key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // namespace

TEST_CASE("VoxelGrid construction", "[grid]") {
    auto volume = std::make_shared<DenseVoxelVolume>(3, 3, 3);

    SECTION("From a dense volume") {
        VoxelGrid grid(volume);
        REQUIRE(grid.width() == 3);
        REQUIRE(grid.height() == 3);
        REQUIRE(grid.depth() == 3);
        REQUIRE(grid.voxel_size() == Approx(1.0f));
    }

    SECTION("Rejects bad arguments") {
        REQUIRE_THROWS_AS(VoxelGrid(0, 3, 3, volume), std::invalid_argument);
        REQUIRE_THROWS_AS(VoxelGrid(3, 3, 3, nullptr), std::invalid_argument);
        REQUIRE_THROWS_AS(VoxelGrid(3, 3, 3, volume, 0.0f), std::invalid_argument);
        REQUIRE_THROWS_AS(VoxelGrid(std::shared_ptr<const DenseVoxelVolume>{}), std::invalid_argument);
    }

    SECTION("From a lookup function") {
        auto source = std::make_shared<OccupancyFunction>([](int32_t x, int32_t, int32_t z) {
            return (z == 0 && x == 1) ? 1 : 0;
        });
        VoxelGrid grid(4, 2, 3, source);
        REQUIRE(grid.is_walkable_at(0, 0, 0));
        REQUIRE_FALSE(grid.is_walkable_at(1, 0, 0));
        REQUIRE(grid.is_walkable_at(1, 0, 1));
    }
}

TEST_CASE("VoxelGrid support rule", "[grid]") {
    auto volume = std::make_shared<DenseVoxelVolume>(3, 3, 3);
    volume->set(1, 1, 0, 1);
    VoxelGrid grid(volume);

    SECTION("Ground layer is walkable when empty") {
        REQUIRE(grid.is_walkable_at(0, 0, 0));
        REQUIRE(grid.is_walkable_at(VoxelKey{2, 2, 0}));
    }

    SECTION("Solid voxels are not walkable") {
        REQUIRE_FALSE(grid.is_walkable_at(1, 1, 0));
    }

    SECTION("Empty voxels need solid ground below") {
        REQUIRE(grid.is_walkable_at(1, 1, 1));
        REQUIRE_FALSE(grid.is_walkable_at(0, 0, 1));
        REQUIRE_FALSE(grid.is_walkable_at(1, 1, 2));
    }

    SECTION("Outside the grid is never walkable") {
        REQUIRE_FALSE(grid.is_walkable_at(-1, 0, 0));
        REQUIRE_FALSE(grid.is_walkable_at(3, 0, 0));
        REQUIRE_FALSE(grid.is_walkable_at(0, 3, 0));
        REQUIRE_FALSE(grid.is_walkable_at(0, 0, -1));
        REQUIRE_FALSE(grid.is_inside(0, 0, 3));
    }

    SECTION("get_node_at does not imply walkability") {
        const Node node = grid.get_node_at(-5, 0, 0);
        REQUIRE(node.key == VoxelKey{-5, 0, 0});
        REQUIRE_FALSE(node.opened);
        REQUIRE_FALSE(node.closed);
        REQUIRE_FALSE(node.has_parent());
    }
}

TEST_CASE("VoxelGrid steps", "[grid]") {
    auto volume = std::make_shared<DenseVoxelVolume>(4, 4, 3);
    volume->set(2, 1, 0, 1); // one-high block east of (1, 1, 0)
    VoxelGrid grid(volume);
    const VoxelKey from{1, 1, 0};

    SECTION("Planar steps") {
        REQUIRE(grid.is_step_allowed(from, 0, 1, 0, false));
        REQUIRE(grid.is_step_allowed(from, -1, -1, 0, true));
        REQUIRE_FALSE(grid.is_step_allowed(from, 1, 0, 0, false));
    }

    SECTION("Climb onto a block") {
        REQUIRE(grid.is_step_allowed(from, 1, 0, 1, false));
        REQUIRE(grid.is_step_allowed(VoxelKey{2, 1, 1}, -1, 0, -1, false));
    }

    SECTION("No pure vertical moves and no long steps") {
        REQUIRE_FALSE(grid.is_step_allowed(from, 0, 0, 1, false));
        REQUIRE_FALSE(grid.is_step_allowed(from, 0, 0, -1, false));
        REQUIRE_FALSE(grid.is_step_allowed(from, 2, 0, 0, false));
        REQUIRE_FALSE(grid.is_step_allowed(from, 0, 1, 2, false));
    }

    SECTION("Diagonal climb is gated in the target layer") {
        // (2, 2, 1) is unsupported, so the climb to the block top from (1, 2, 0) is axis only
        REQUIRE(grid.is_step_allowed(VoxelKey{1, 2, 0}, 1, -1, 1, false) == false);
        REQUIRE(grid.is_step_allowed(VoxelKey{1, 0, 0}, 1, 1, 1, false) == false);
    }
}

TEST_CASE("VoxelGrid neighbours on a flat floor", "[grid][neighbors]") {
    auto volume = std::make_shared<DenseVoxelVolume>(3, 3, 2);
    VoxelGrid grid(volume);

    SECTION("Axis then diagonals in fixed order") {
        const auto neighbors = grid.get_neighbors({1, 1, 0}, true, false);
        const std::vector<VoxelKey> expected = {
            {1, 0, 0}, {2, 1, 0}, {1, 2, 0}, {0, 1, 0},
            {0, 0, 0}, {2, 0, 0}, {2, 2, 0}, {0, 2, 0}
        };
        REQUIRE(neighbors == expected);
    }

    SECTION("Axis only") {
        const auto neighbors = grid.get_neighbors({1, 1, 0}, false, false);
        REQUIRE(neighbors.size() == 4);
    }

    SECTION("Corner cell") {
        const auto neighbors = grid.get_neighbors({0, 0, 0}, true, true);
        const std::vector<VoxelKey> expected = {{1, 0, 0}, {0, 1, 0}, {1, 1, 0}};
        REQUIRE(neighbors == expected);
    }
}

TEST_CASE("VoxelGrid neighbours across layers", "[grid][neighbors]") {
    auto volume = std::make_shared<DenseVoxelVolume>(3, 3, 3);
    volume->set(2, 1, 0, 1);
    VoxelGrid grid(volume);

    const auto neighbors = grid.get_neighbors({1, 1, 0}, true, false);
    REQUIRE(contains_key(neighbors, {2, 1, 1}));
    REQUIRE_FALSE(contains_key(neighbors, {2, 1, 0}));
    REQUIRE_FALSE(contains_key(neighbors, {1, 1, 1}));

    // lower layer first, so the climb comes after the planar axis moves
    const auto it_up = std::find(neighbors.begin(), neighbors.end(), VoxelKey{2, 1, 1});
    const auto it_flat = std::find(neighbors.begin(), neighbors.end(), VoxelKey{1, 0, 0});
    REQUIRE(it_flat < it_up);

    // every neighbour is a legal step
    for (const auto& nb : neighbors) {
        REQUIRE(grid.is_step_allowed({1, 1, 0}, nb.x - 1, nb.y - 1, nb.z, false));
    }
}

TEST_CASE("VoxelGrid corner crossing", "[grid][neighbors]") {
    auto volume = std::make_shared<DenseVoxelVolume>(3, 3, 3);
    // two-high pillar north of (1, 1, 0): blocks the north cell in layers 0 and 1
    volume->fill_box({1, 0, 0}, {1, 0, 1}, 1);
    VoxelGrid grid(volume);
    const VoxelKey from{1, 1, 0};

    SECTION("Diagonal with one open flank is kept when corners may be cut") {
        const auto neighbors = grid.get_neighbors(from, true, false);
        REQUIRE(contains_key(neighbors, {2, 0, 0}));
        REQUIRE(contains_key(neighbors, {0, 0, 0}));
        REQUIRE(grid.is_step_allowed(from, 1, -1, 0, false));
    }

    SECTION("dont_cross_corners needs both flanks") {
        REQUIRE(grid.is_walkable_at(2, 0, 0));
        const auto neighbors = grid.get_neighbors(from, true, true);
        REQUIRE_FALSE(contains_key(neighbors, {2, 0, 0}));
        REQUIRE_FALSE(contains_key(neighbors, {0, 0, 0}));
        REQUIRE(contains_key(neighbors, {2, 2, 0}));
        REQUIRE_FALSE(grid.is_step_allowed(from, 1, -1, 0, true));
    }
}

TEST_CASE("VoxelGrid clone and coordinates", "[grid]") {
    auto volume = std::make_shared<DenseVoxelVolume>(4, 4, 4);
    volume->set(1, 1, 0, 1);
    VoxelGrid grid(volume, 0.5f);

    SECTION("Clone shares the source") {
        const VoxelGrid copy = grid.clone();
        REQUIRE(copy.source() == grid.source());
        REQUIRE(copy.width() == 4);
        REQUIRE(copy.voxel_size() == Approx(0.5f));
        REQUIRE(copy.is_walkable_at(1, 1, 1));

        // source changes are visible through both handles
        volume->set(1, 1, 0, 0);
        REQUIRE_FALSE(grid.is_walkable_at(1, 1, 1));
        REQUIRE_FALSE(copy.is_walkable_at(1, 1, 1));
    }

    SECTION("Key and point conversion") {
        const Eigen::Vector3f center = grid.key_to_point({1, 2, 3});
        REQUIRE(center.x() == Approx(0.75f));
        REQUIRE(center.y() == Approx(1.25f));
        REQUIRE(center.z() == Approx(1.75f));
        REQUIRE(grid.point_to_key(center) == VoxelKey{1, 2, 3});
        REQUIRE(grid.point_to_key(Eigen::Vector3f(-0.1f, 0.0f, 0.49f)) == VoxelKey{-1, 0, 0});
    }
}
