#ifndef NODE_TABLE_HPP_
#define NODE_TABLE_HPP_

#include <unordered_map>
#include <vector>

#include "voxel_jps/finder/node.hpp"

namespace voxel_jps {

// Per-run node arena. One Node per coordinate, addressed by stable indices.
class NodeTable {
public:
    using IndexMap = std::unordered_map<VoxelKey, NodeIndex, VoxelKeyHash>;
    using iterator = std::vector<Node>::iterator;
    using const_iterator = std::vector<Node>::const_iterator;

    NodeTable() = default;
    explicit NodeTable(size_t initial_bucket_count, float max_load_factor = 0.75f);

    NodeIndex get_or_create(const VoxelKey& key); // get if exist - create if not
    NodeIndex find(const VoxelKey& key) const; // kNoNode if absent
    bool contains(const VoxelKey& key) const { return find(key) != kNoNode; }

    Node& operator[](NodeIndex index) { return nodes_[static_cast<size_t>(index)]; }
    const Node& operator[](NodeIndex index) const { return nodes_[static_cast<size_t>(index)]; }
    Node& at(NodeIndex index);
    const Node& at(NodeIndex index) const;

    iterator begin() { return nodes_.begin(); }
    const_iterator begin() const { return nodes_.begin(); }
    iterator end() { return nodes_.end(); }
    const_iterator end() const { return nodes_.end(); }

    void clear();
    void reserve(size_t count);
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    std::vector<Node> nodes_;
    IndexMap index_;
};

} // namespace

#endif
