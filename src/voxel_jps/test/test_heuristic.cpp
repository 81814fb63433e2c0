/// @file test_heuristic.cpp
/// @brief Tests for the distance estimators

#include <catch2/catch.hpp>

#include <cmath>

#include "voxel_jps/finder/heuristic.hpp"

using namespace voxel_jps;

TEST_CASE("Heuristic distances", "[finder][heuristic]") {
    SECTION("Manhattan") {
        REQUIRE(heuristic::manhattan(1, 2, 3) == Approx(6.0));
        REQUIRE(heuristic::manhattan(0, 0, 0) == Approx(0.0));
    }

    SECTION("Euclidean") {
        REQUIRE(heuristic::euclidean(1, 2, 2) == Approx(3.0));
        REQUIRE(heuristic::euclidean(3, 4, 0) == Approx(5.0));
    }

    SECTION("Octile") {
        REQUIRE(heuristic::octile(3, 0, 0) == Approx(3.0));
        REQUIRE(heuristic::octile(1, 1, 0) == Approx(std::sqrt(2.0)));
        REQUIRE(heuristic::octile(1, 1, 1) == Approx(std::sqrt(3.0)));
        REQUIRE(heuristic::octile(2, 1, 0) == Approx(1.0 + std::sqrt(2.0)));
        REQUIRE(heuristic::octile(0, 4, 2) == heuristic::octile(2, 0, 4));
    }

    SECTION("Chebyshev") {
        REQUIRE(heuristic::chebyshev(1, 5, 2) == Approx(5.0));
    }

    SECTION("Octile lies between Euclidean and Manhattan") {
        for (int32_t dx = 0; dx < 4; ++dx) {
            for (int32_t dz = 0; dz < 4; ++dz) {
                const double o = heuristic::octile(dx, 2, dz);
                REQUIRE(o >= heuristic::euclidean(dx, 2, dz) - 1e-9);
                REQUIRE(o <= heuristic::manhattan(dx, 2, dz) + 1e-9);
            }
        }
    }
}

TEST_CASE("Heuristic from type", "[finder][heuristic]") {
    REQUIRE(heuristic::from_type(HeuristicType::MANHATTAN)(1, 2, 3) == Approx(6.0));
    REQUIRE(heuristic::from_type(HeuristicType::EUCLIDEAN)(3, 4, 0) == Approx(5.0));
    REQUIRE(heuristic::from_type(HeuristicType::OCTILE)(1, 1, 1) == Approx(std::sqrt(3.0)));
    REQUIRE(heuristic::from_type(HeuristicType::CHEBYSHEV)(1, 5, 2) == Approx(5.0));
}
