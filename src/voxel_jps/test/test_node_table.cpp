/// @file test_node_table.cpp
/// @brief Tests for the per-run node arena

#include <catch2/catch.hpp>

#include <stdexcept>

#include "voxel_jps/finder/node_table.hpp"

using namespace voxel_jps;

TEST_CASE("NodeTable keeps one node per coordinate", "[finder][node_table]") {
    NodeTable table;
    REQUIRE(table.empty());

    const NodeIndex a = table.get_or_create({1, 2, 3});
    const NodeIndex b = table.get_or_create({3, 2, 1});
    REQUIRE(a != b);
    REQUIRE(table.size() == 2);

    SECTION("Repeated lookups return the same index") {
        REQUIRE(table.get_or_create({1, 2, 3}) == a);
        REQUIRE(table.find({3, 2, 1}) == b);
        REQUIRE(table.size() == 2);
    }

    SECTION("Missing coordinates") {
        REQUIRE(table.find({0, 0, 0}) == kNoNode);
        REQUIRE_FALSE(table.contains({0, 0, 0}));
        REQUIRE(table.contains({1, 2, 3}));
    }

    SECTION("Fresh nodes carry no search state") {
        const Node& node = table[a];
        REQUIRE(node.key == VoxelKey{1, 2, 3});
        REQUIRE_FALSE(node.opened);
        REQUIRE_FALSE(node.closed);
        REQUIRE_FALSE(node.h_known);
        REQUIRE(node.parent == kNoNode);
    }

    SECTION("Checked access") {
        REQUIRE(table.at(b).key == VoxelKey{3, 2, 1});
        REQUIRE_THROWS_AS(table.at(2), std::out_of_range);
        REQUIRE_THROWS_AS(table.at(kNoNode), std::out_of_range);
    }

    SECTION("Clear resets the table") {
        table.clear();
        REQUIRE(table.empty());
        REQUIRE(table.find({1, 2, 3}) == kNoNode);
        REQUIRE(table.get_or_create({3, 2, 1}) == 0);
    }
}

TEST_CASE("NodeTable indices stay valid while growing", "[finder][node_table]") {
    NodeTable table(4);

    const NodeIndex root = table.get_or_create({0, 0, 0});
    NodeIndex prev = root;
    for (int32_t x = 1; x < 200; ++x) {
        const NodeIndex i = table.get_or_create({x, 0, 0});
        table[i].parent = prev;
        prev = i;
    }

    REQUIRE(table.size() == 200);
    REQUIRE(table[prev].key == VoxelKey{199, 0, 0});
    REQUIRE(table[table[prev].parent].key == VoxelKey{198, 0, 0});
    REQUIRE(table[root].key == VoxelKey{0, 0, 0});

    size_t with_parent = 0;
    for (const Node& node : table) {
        if (node.has_parent()) with_parent++;
    }
    REQUIRE(with_parent == 199);
}
