#ifndef OPEN_LIST_HPP_
#define OPEN_LIST_HPP_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "voxel_jps/finder/node.hpp"

namespace voxel_jps {

// Indexed binary min-heap over NodeTable indices, keyed by f.
// Equal f pops in insertion order. Decrease-key keeps the original order stamp.
class OpenList {
public:
    explicit OpenList(size_t capacity = 0) {
        reset(capacity);
    }

    void reset(size_t capacity) {
        heap_.clear();
        heap_.reserve(capacity);
        pos_.assign(capacity, kNotInHeap);
        key_.assign(capacity, Key{});
        next_seq_ = 0;
    }

    void clear() { reset(0); }

    bool empty() const noexcept { return heap_.empty(); }
    size_t size() const noexcept { return heap_.size(); }

    bool contains(NodeIndex i) const {
        return i >= 0 && static_cast<size_t>(i) < pos_.size() && pos_[static_cast<size_t>(i)] != kNotInHeap;
    }

    // Insert a new index. Returns false if it is already queued.
    bool push(NodeIndex i, double f) {
        ensure(i);
        if (contains(i)) return false;
        key_[static_cast<size_t>(i)] = Key{f, next_seq_++};
        heap_.push_back(i);
        pos_[static_cast<size_t>(i)] = heap_.size() - 1;
        sift_up(heap_.size() - 1);
        return true;
    }

    // Reposition a queued index after its f changed. Returns false if not queued.
    bool update(NodeIndex i, double f) {
        if (!contains(i)) return false;
        const size_t p = pos_[static_cast<size_t>(i)];
        const double old_f = key_[static_cast<size_t>(i)].f;
        key_[static_cast<size_t>(i)].f = f;
        if (f < old_f) sift_up(p);
        else sift_down(p);
        return true;
    }

    NodeIndex top() const { return heap_.front(); }

    // Pop the index with the lowest f. The list must not be empty.
    NodeIndex pop() {
        const NodeIndex min_idx = heap_.front();
        const NodeIndex last = heap_.back();
        heap_.pop_back();
        pos_[static_cast<size_t>(min_idx)] = kNotInHeap;

        if (!heap_.empty()) {
            heap_.front() = last;
            pos_[static_cast<size_t>(last)] = 0;
            sift_down(0);
        }
        return min_idx;
    }

    double key(NodeIndex i) const {
        return key_.at(static_cast<size_t>(i)).f;
    }

private:
    struct Key {
        double f{std::numeric_limits<double>::infinity()};
        uint64_t seq{0};
    };

    static constexpr size_t kNotInHeap = std::numeric_limits<size_t>::max();

    // heap_ stores node indices; pos_[i] = position of i in heap_; key_[i] = priority
    std::vector<NodeIndex> heap_;
    std::vector<size_t> pos_;
    std::vector<Key> key_;
    uint64_t next_seq_{0};

    void ensure(NodeIndex i) {
        const size_t need = static_cast<size_t>(i) + 1;
        if (need > pos_.size()) {
            pos_.resize(need, kNotInHeap);
            key_.resize(need, Key{});
        }
    }

    bool less(NodeIndex a, NodeIndex b) const {
        const Key& ka = key_[static_cast<size_t>(a)];
        const Key& kb = key_[static_cast<size_t>(b)];
        if (ka.f != kb.f) return ka.f < kb.f;
        return ka.seq < kb.seq;
    }

    void swap_at(size_t a, size_t b) {
        std::swap(heap_[a], heap_[b]);
        pos_[static_cast<size_t>(heap_[a])] = a;
        pos_[static_cast<size_t>(heap_[b])] = b;
    }

    void sift_up(size_t i) {
        while (i > 0) {
            const size_t p = (i - 1) / 2;
            if (less(heap_[i], heap_[p])) {
                swap_at(i, p);
                i = p;
            } else break;
        }
    }

    void sift_down(size_t i) {
        const size_t n = heap_.size();
        for (;;) {
            const size_t l = 2 * i + 1;
            const size_t r = l + 1;
            size_t s = i;
            if (l < n && less(heap_[l], heap_[s])) s = l;
            if (r < n && less(heap_[r], heap_[s])) s = r;
            if (s == i) break;
            swap_at(i, s);
            i = s;
        }
    }
};

} // namespace

#endif
