#ifndef FINDER_TYPES_HPP_
#define FINDER_TYPES_HPP_

#include <cstddef>
#include <string>

#include "voxel_jps/types.hpp"

namespace voxel_jps {

enum class HeuristicType {
    MANHATTAN,
    EUCLIDEAN,
    OCTILE,
    CHEBYSHEV
};

struct JumpPointConfig {
    HeuristicType heuristic{HeuristicType::MANHATTAN};

    bool track_jump_recursion{false}; // mark every cell a jump ray touches (Node::tested)
    bool expand_path{true}; // interpolate jump points into a dense route

    // Search budget (0 = unbounded)
    size_t max_expansions{0};

    bool debug_output{false};
};

enum class SearchStatus {
    FOUND,
    NO_PATH, // open list exhausted
    INVALID_START, // start outside grid or not walkable
    INVALID_GOAL, // goal outside grid or not walkable
    EXPANSION_LIMIT // max_expansions reached before the goal
};

inline std::string to_string(SearchStatus status) {
    switch (status) {
        case SearchStatus::FOUND: return "FOUND";
        case SearchStatus::NO_PATH: return "NO_PATH";
        case SearchStatus::INVALID_START: return "INVALID_START";
        case SearchStatus::INVALID_GOAL: return "INVALID_GOAL";
        case SearchStatus::EXPANSION_LIMIT: return "EXPANSION_LIMIT";
    }
    return "UNKNOWN";
}

// Statistics
struct SearchStatistics {
    size_t nodes_expanded{0};
    size_t nodes_opened{0};
    size_t jump_steps{0}; // cells visited by jump rays, sub-jumps included

    double search_time_ms{0.0};
};

struct PathSearchResult {
    SearchStatus status{SearchStatus::NO_PATH};

    Path path; // dense if JumpPointConfig::expand_path, else equal to jump_points
    Path jump_points;
    double path_length{0.0};

    SearchStatistics stats;

    bool found() const { return status == SearchStatus::FOUND; }
    bool invalid_input() const {
        return status == SearchStatus::INVALID_START || status == SearchStatus::INVALID_GOAL;
    }
};

} // namespace

#endif
