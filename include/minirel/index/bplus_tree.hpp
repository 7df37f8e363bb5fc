#pragma once

#include <minirel/core_types.hpp>
#include <minirel/value.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace minirel {

// Index of a node in the tree's arena
using NodeId = uint32_t;
constexpr NodeId INVALID_NODE_ID = std::numeric_limits<NodeId>::max();

class BPlusTree;

/**
 * RangeIterator - Ascending walk over the leaf chain between two bounds.
 *
 * Rows of one key come back in insertion order. The iterator borrows the
 * tree and is invalidated by any insert.
 */
class RangeIterator {
public:
    /**
     * Produce the next row in range.
     *
     * @param row Receives the row
     * @param key Receives the row's key (optional)
     * @return false once past the upper bound or the last leaf
     */
    bool next(Row* row, Value* key = nullptr);

private:
    friend class BPlusTree;

    RangeIterator(const BPlusTree* tree, NodeId leaf, size_t key_index,
                  std::optional<Value> upper, bool upper_inclusive);

    // Skip exhausted leaves; false at the end of the chain
    bool settle();

    const BPlusTree* tree_;
    NodeId leaf_;
    size_t key_index_;
    size_t row_index_;
    std::optional<Value> upper_;
    bool upper_inclusive_;
    bool done_;
};

/**
 * BPlusTree - In-memory B+ tree over Value keys with duplicate support.
 *
 * Nodes live in an arena vector and refer to each other by NodeId. A node
 * holds at most order-1 keys; a key inserted twice appends to that key's
 * row list instead of creating a second entry. Leaves are chained left to
 * right for range scans.
 *
 * Split rules:
 * - Leaf: split at the middle, the first key of the right half is copied up
 * - Internal: split at the median, which moves up to the parent
 */
class BPlusTree {
public:
    /**
     * @param order Maximum fan-out (>= 4; smaller values are raised to 4)
     */
    explicit BPlusTree(size_t order = DEFAULT_BTREE_ORDER);

    // Prevent copying
    BPlusTree(const BPlusTree&) = delete;
    BPlusTree& operator=(const BPlusTree&) = delete;

    BPlusTree(BPlusTree&&) = default;
    BPlusTree& operator=(BPlusTree&&) = default;

    /**
     * Insert a (key, row) pair. Never fails; duplicates are kept.
     */
    void insert(const Value& key, const Row& row);

    /**
     * All rows stored under a key, in insertion order.
     */
    std::vector<Row> find(const Value& key) const;

    bool contains(const Value& key) const;

    /**
     * Iterate rows whose key lies between the bounds.
     *
     * @param lower Lower bound, std::nullopt for unbounded
     * @param upper Upper bound, std::nullopt for unbounded
     * @param lower_inclusive Include rows equal to lower
     * @param upper_inclusive Include rows equal to upper
     */
    RangeIterator range(const std::optional<Value>& lower,
                        const std::optional<Value>& upper,
                        bool lower_inclusive = true,
                        bool upper_inclusive = true) const;

    // Convenience: collect a range into a vector
    std::vector<Row> range_rows(const std::optional<Value>& lower,
                                const std::optional<Value>& upper,
                                bool lower_inclusive = true,
                                bool upper_inclusive = true) const;

    // Number of (key, row) pairs
    size_t size() const { return size_; }

    // Number of distinct keys
    size_t key_count() const { return key_count_; }

    bool empty() const { return size_ == 0; }

    size_t order() const { return order_; }

    size_t height() const;

    size_t node_count() const { return nodes_.size(); }

    // Drop every entry
    void clear();

    /**
     * Verify B+ tree invariants (for testing/debugging).
     *
     * @return true if all invariants hold
     */
    bool verify() const;

private:
    friend class RangeIterator;

    struct Node {
        bool is_leaf = true;
        std::vector<Value> keys;
        std::vector<std::vector<Row>> rows;   // leaf only, parallel to keys
        std::vector<NodeId> children;         // internal only, keys.size() + 1
        NodeId next = INVALID_NODE_ID;        // right sibling leaf
    };

    NodeId allocate_node(bool is_leaf);

    // Descend to the leaf responsible for key, recording internal nodes
    NodeId find_leaf(const Value& key, std::vector<NodeId>* path) const;

    NodeId leftmost_leaf() const;

    void split_leaf(NodeId leaf_id, std::vector<NodeId>& path);
    void split_internal(NodeId node_id, std::vector<NodeId>& path);
    void insert_into_parent(NodeId left_id, const Value& separator, NodeId right_id,
                            std::vector<NodeId>& path);

    bool verify_node(NodeId node_id, const Value* low, const Value* high,
                     size_t depth, size_t* leaf_depth) const;

    size_t max_keys() const { return order_ - 1; }

    size_t order_;
    std::vector<Node> nodes_;
    NodeId root_;
    size_t size_;
    size_t key_count_;
};

}  // namespace minirel
