#include "voxel_jps/finder/node_table.hpp"
#include <stdexcept>

namespace voxel_jps {

NodeTable::NodeTable(size_t initial_bucket_count, float max_load_factor)
    : nodes_()
    , index_()
{
    index_.max_load_factor(max_load_factor);
    index_.reserve(initial_bucket_count);
    nodes_.reserve(initial_bucket_count);
}

NodeIndex NodeTable::get_or_create(const VoxelKey& key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }

    // create new
    const NodeIndex index = static_cast<NodeIndex>(nodes_.size());
    nodes_.emplace_back(key);
    index_.emplace(key, index);
    return index;
}

NodeIndex NodeTable::find(const VoxelKey& key) const {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }
    return kNoNode;
}

Node& NodeTable::at(NodeIndex index) {
    if (index < 0 || static_cast<size_t>(index) >= nodes_.size()) {
        throw std::out_of_range("NodeTable index out of range");
    }
    return nodes_[static_cast<size_t>(index)];
}

const Node& NodeTable::at(NodeIndex index) const {
    if (index < 0 || static_cast<size_t>(index) >= nodes_.size()) {
        throw std::out_of_range("NodeTable index out of range");
    }
    return nodes_[static_cast<size_t>(index)];
}

void NodeTable::clear() {
    nodes_.clear();
    index_.clear();
}

void NodeTable::reserve(size_t count) {
    nodes_.reserve(count);
    index_.reserve(count);
}

} // namespace
