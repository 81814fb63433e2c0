#include "voxel_jps/finder/jump_point_finder.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "voxel_jps/path/path_utils.hpp"

namespace voxel_jps {

namespace {

// bits 0..8 by planar direction, bit 9 for every legal step
constexpr uint16_t kFullExpansion = 1u << 9;

uint16_t direction_bit(int32_t dx, int32_t dy) {
    return static_cast<uint16_t>(1u << ((dx + 1) * 3 + (dy + 1)));
}

std::ostream& operator<<(std::ostream& os, const VoxelKey& key) {
    return os << "(" << key.x << ", " << key.y << ", " << key.z << ")";
}

} // namespace

JumpPointFinder::JumpPointFinder() : JumpPointFinder(JumpPointConfig{}) {}

JumpPointFinder::JumpPointFinder(const JumpPointConfig& config)
    : config_(config)
    , heuristic_(heuristic::from_type(config.heuristic))
{}

void JumpPointFinder::set_config(const JumpPointConfig& config) {
    config_ = config;
    heuristic_ = heuristic::from_type(config.heuristic);
}

void JumpPointFinder::set_heuristic(HeuristicFn fn) {
    if (fn) {
        heuristic_ = std::move(fn);
    }
    else {
        heuristic_ = heuristic::from_type(config_.heuristic);
    }
}

PathSearchResult JumpPointFinder::find_path(int32_t start_x, int32_t start_y, int32_t start_z,
                                            int32_t goal_x, int32_t goal_y, int32_t goal_z, const VoxelGrid& grid) {
    return find_path(VoxelKey{start_x, start_y, start_z}, VoxelKey{goal_x, goal_y, goal_z}, grid);
}

PathSearchResult JumpPointFinder::find_path(const VoxelKey& start, const VoxelKey& goal, const VoxelGrid& grid) {
    auto t_start = std::chrono::high_resolution_clock::now();

    PathSearchResult result;
    stats_ = SearchStatistics{};
    nodes_.clear();
    open_list_.clear();
    start_index_ = kNoNode;
    goal_index_ = kNoNode;

    // Endpoints must be standable cells
    if (!grid.is_walkable_at(start)) {
        std::cerr << "[JPS] Start " << start << " is outside the grid or not walkable" << std::endl;
        result.status = SearchStatus::INVALID_START;
        return result;
    }
    if (!grid.is_walkable_at(goal)) {
        std::cerr << "[JPS] Goal " << goal << " is outside the grid or not walkable" << std::endl;
        result.status = SearchStatus::INVALID_GOAL;
        return result;
    }

    grid_ = &grid;
    goal_key_ = goal;
    start_index_ = nodes_.get_or_create(start);
    goal_index_ = nodes_.get_or_create(goal);

    Node& start_node = nodes_[start_index_];
    start_node.g = 0.0;
    start_node.f = 0.0;
    start_node.opened = true;
    start_node.pending_dirs = kFullExpansion;
    open_list_.push(start_index_, 0.0);
    stats_.nodes_opened++;

    result.status = SearchStatus::NO_PATH;

    while (!open_list_.empty()) {
        const NodeIndex current = open_list_.pop();
        nodes_[current].closed = true;

        if (current == goal_index_) {
            result.status = SearchStatus::FOUND;
            result.jump_points = backtrace(nodes_, goal_index_);
            if (config_.expand_path && result.jump_points.size() > 1) {
                result.path = expand_path(result.jump_points);
            }
            else {
                result.path = result.jump_points;
            }
            result.path_length = path_length(result.jump_points);
            break;
        }

        if (config_.max_expansions > 0 && stats_.nodes_expanded >= config_.max_expansions) {
            result.status = SearchStatus::EXPANSION_LIMIT;
            break;
        }

        identify_successors(current);
        stats_.nodes_expanded++;
    }

    grid_ = nullptr;

    auto t_end = std::chrono::high_resolution_clock::now();
    stats_.search_time_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    result.stats = stats_;

    if (config_.debug_output) {
        if (result.found()) {
            std::cout << "[JPS] Path found: " << result.path.size() << " cells, "
                      << result.jump_points.size() << " jump points | "
                      << "Length: " << result.path_length << " | "
                      << "Expanded: " << stats_.nodes_expanded << " nodes | "
                      << "Time: " << stats_.search_time_ms << " ms" << std::endl;
        }
        else {
            std::cout << "[JPS] " << to_string(result.status) << " " << start << " -> " << goal << " | "
                      << "Expanded: " << stats_.nodes_expanded << " nodes | "
                      << "Time: " << stats_.search_time_ms << " ms" << std::endl;
        }
    }

    return result;
}

void JumpPointFinder::identify_successors(NodeIndex index) {
    // copy out: the table may grow while jumping
    const VoxelKey key = nodes_[index].key;
    const double g = nodes_[index].g;
    const uint16_t dirs = nodes_[index].pending_dirs;
    nodes_[index].pending_dirs = 0;
    nodes_[index].expanded_dirs |= dirs;

    std::vector<VoxelKey> neighbors;
    if (dirs & kFullExpansion) {
        neighbors = grid_->get_neighbors(key, true, false);
    }
    else {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            for (int32_t dy = -1; dy <= 1; ++dy) {
                if (!(dirs & direction_bit(dx, dy))) continue;
                const std::vector<VoxelKey> pruned = find_neighbors(key, Direction{dx, dy, 0});
                neighbors.insert(neighbors.end(), pruned.begin(), pruned.end());
            }
        }
        std::sort(neighbors.begin(), neighbors.end());
        neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    }

    for (const auto& neighbor : neighbors) {
        const Direction d{neighbor.x - key.x, neighbor.y - key.y, neighbor.z - key.z};
        const std::optional<VoxelKey> jump_point = jump(key, d);
        if (!jump_point) continue;

        const NodeIndex jump_index = nodes_.get_or_create(*jump_point);
        Node& jump_node = nodes_[jump_index];

        // parent may be several cells away
        const int32_t jx = jump_point->x;
        const int32_t jy = jump_point->y;
        const int32_t jz = jump_point->z;
        const double ng = g + heuristic::euclidean(jx - key.x, jy - key.y, jz - key.z);

        const bool improved = !jump_node.opened || ng < jump_node.g;
        if (improved) {
            jump_node.g = ng;
            if (!jump_node.h_known) {
                jump_node.h = heuristic_(std::abs(jx - goal_key_.x), std::abs(jy - goal_key_.y), std::abs(jz - goal_key_.z));
                jump_node.h_known = true;
            }
            jump_node.f = jump_node.g + jump_node.h;
            jump_node.parent = index;
        }

        // a jump point reached from a new direction is expanded again for that direction
        const uint16_t bit = expansion_bit(*jump_point, d);
        const bool needs_expansion = !((jump_node.expanded_dirs | jump_node.pending_dirs) & bit);
        if (needs_expansion) {
            jump_node.pending_dirs |= bit;
        }

        if (!open_list_.contains(jump_index)) {
            if (needs_expansion) {
                open_list_.push(jump_index, jump_node.f);
                if (!jump_node.opened) {
                    jump_node.opened = true;
                    stats_.nodes_opened++;
                }
            }
        }
        else if (improved) {
            open_list_.update(jump_index, jump_node.f);
        }
    }
}

std::vector<VoxelKey> JumpPointFinder::find_neighbors(const VoxelKey& key, const Direction& d) const {
    const int32_t dx = d.dx;
    const int32_t dy = d.dy;

    std::vector<VoxelKey> neighbors;
    neighbors.reserve(5);
    auto add = [&](int32_t mx, int32_t my) {
        neighbors.push_back(key.offset(mx, my, 0));
    };

    if (d.is_diagonal()) {
        // natural: both axis components and the diagonal itself
        if (step(key, dx, 0, 0)) add(dx, 0);
        if (step(key, 0, dy, 0)) add(0, dy);
        if (step(key, dx, dy, 0)) add(dx, dy);

        // forced: trailing side blocked
        if (!walkable(key, -dx, 0, 0) && step(key, -dx, dy, 0)) add(-dx, dy);
        if (!walkable(key, 0, -dy, 0) && step(key, dx, -dy, 0)) add(dx, -dy);
    }
    else {
        // (dx, dy) is the travel axis, (lx, ly) the lateral one
        const int32_t lx = (dx != 0) ? 0 : 1;
        const int32_t ly = (dx != 0) ? 1 : 0;

        if (step(key, dx, dy, 0)) add(dx, dy);

        for (int32_t s = -1; s <= 1; s += 2) {
            if (!walkable(key, s * lx, s * ly, 0) && step(key, dx + s * lx, dy + s * ly, 0)) {
                add(dx + s * lx, dy + s * ly);
            }
        }
    }

    return neighbors;
}

std::optional<VoxelKey> JumpPointFinder::jump(const VoxelKey& origin, const Direction& d) {
    if (!step(origin, d.dx, d.dy, d.dz)) return std::nullopt;

    VoxelKey cur = origin.offset(d.dx, d.dy, d.dz);

    // a layer change always ends the ray
    if (d.dz != 0) {
        stats_.jump_steps++;
        if (config_.track_jump_recursion) {
            mark_tested(cur);
        }
        return cur;
    }

    while (true) {
        stats_.jump_steps++;
        if (config_.track_jump_recursion) {
            mark_tested(cur);
        }

        if (cur == goal_key_) return cur;

        // ramp, ledge or drop: rays stop here and the cell is expanded in full
        if (has_layer_step(cur)) return cur;

        if (has_forced_neighbor(cur, d)) return cur;

        // diagonal: a jump point along either axis component makes this cell a turning point
        if (d.is_diagonal()) {
            if (jump(cur, Direction{d.dx, 0, 0}) || jump(cur, Direction{0, d.dy, 0})) {
                return cur;
            }
        }

        if (!step(cur, d.dx, d.dy, 0)) return std::nullopt; // dead end

        cur = cur.offset(d.dx, d.dy, 0);
    }
}

bool JumpPointFinder::has_forced_neighbor(const VoxelKey& key, const Direction& d) const {
    const int32_t dx = d.dx;
    const int32_t dy = d.dy;

    if (d.is_diagonal()) {
        return (walkable(key, -dx, dy, 0) && !walkable(key, -dx, 0, 0)) ||
               (walkable(key, dx, -dy, 0) && !walkable(key, 0, -dy, 0));
    }

    const int32_t lx = (dx != 0) ? 0 : 1;
    const int32_t ly = (dx != 0) ? 1 : 0;
    for (int32_t s = -1; s <= 1; s += 2) {
        // blocked beside, open ahead-beside
        if (!walkable(key, s * lx, s * ly, 0) && walkable(key, dx + s * lx, dy + s * ly, 0)) {
            return true;
        }
    }
    return false;
}

bool JumpPointFinder::has_layer_step(const VoxelKey& key) const {
    for (int32_t dx = -1; dx <= 1; ++dx) {
        for (int32_t dy = -1; dy <= 1; ++dy) {
            if (dx == 0 && dy == 0) continue;
            if (step(key, dx, dy, -1) || step(key, dx, dy, 1)) return true;
        }
    }
    return false;
}

uint16_t JumpPointFinder::expansion_bit(const VoxelKey& key, const Direction& d) const {
    if (d.dz != 0 || has_layer_step(key)) return kFullExpansion;
    return direction_bit(d.dx, d.dy);
}

bool JumpPointFinder::step(const VoxelKey& from, int32_t dx, int32_t dy, int32_t dz) const {
    return grid_->is_step_allowed(from, dx, dy, dz, false);
}

bool JumpPointFinder::walkable(const VoxelKey& key, int32_t dx, int32_t dy, int32_t dz) const {
    return grid_->is_walkable_at(key.x + dx, key.y + dy, key.z + dz);
}

void JumpPointFinder::mark_tested(const VoxelKey& key) {
    nodes_[nodes_.get_or_create(key)].tested = true;
}

} // namespace
