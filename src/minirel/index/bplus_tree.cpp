#include <minirel/index/bplus_tree.hpp>

#include <algorithm>
#include <utility>

namespace minirel {

namespace {

bool key_less(const Value& a, const Value& b) {
    return a.compare(b) < 0;
}

// Index of the child that covers key: number of separators <= key
size_t child_index(const std::vector<Value>& keys, const Value& key) {
    auto it = std::upper_bound(keys.begin(), keys.end(), key, key_less);
    return static_cast<size_t>(it - keys.begin());
}

}  // namespace

// ============================================================================
// RangeIterator Implementation
// ============================================================================

RangeIterator::RangeIterator(const BPlusTree* tree, NodeId leaf, size_t key_index,
                             std::optional<Value> upper, bool upper_inclusive)
    : tree_(tree)
    , leaf_(leaf)
    , key_index_(key_index)
    , row_index_(0)
    , upper_(std::move(upper))
    , upper_inclusive_(upper_inclusive)
    , done_(leaf == INVALID_NODE_ID)
{}

bool RangeIterator::settle() {
    while (!done_) {
        const auto& node = tree_->nodes_[leaf_];
        if (key_index_ < node.keys.size()) {
            return true;
        }
        leaf_ = node.next;
        key_index_ = 0;
        row_index_ = 0;
        if (leaf_ == INVALID_NODE_ID) {
            done_ = true;
        }
    }
    return false;
}

bool RangeIterator::next(Row* row, Value* key) {
    if (!settle()) {
        return false;
    }

    const auto& node = tree_->nodes_[leaf_];
    const Value& current = node.keys[key_index_];

    if (upper_) {
        int c = current.compare(*upper_);
        if (c > 0 || (c == 0 && !upper_inclusive_)) {
            done_ = true;
            return false;
        }
    }

    const auto& rows = node.rows[key_index_];
    *row = rows[row_index_];
    if (key) {
        *key = current;
    }

    if (++row_index_ >= rows.size()) {
        ++key_index_;
        row_index_ = 0;
    }
    return true;
}

// ============================================================================
// BPlusTree Implementation
// ============================================================================

BPlusTree::BPlusTree(size_t order)
    : order_(std::max<size_t>(order, 4))
    , root_(INVALID_NODE_ID)
    , size_(0)
    , key_count_(0)
{
    root_ = allocate_node(true);
}

NodeId BPlusTree::allocate_node(bool is_leaf) {
    Node node;
    node.is_leaf = is_leaf;
    nodes_.push_back(std::move(node));
    return static_cast<NodeId>(nodes_.size() - 1);
}

void BPlusTree::clear() {
    nodes_.clear();
    size_ = 0;
    key_count_ = 0;
    root_ = allocate_node(true);
}

NodeId BPlusTree::find_leaf(const Value& key, std::vector<NodeId>* path) const {
    NodeId current = root_;
    while (!nodes_[current].is_leaf) {
        if (path) {
            path->push_back(current);
        }
        const Node& node = nodes_[current];
        current = node.children[child_index(node.keys, key)];
    }
    return current;
}

NodeId BPlusTree::leftmost_leaf() const {
    NodeId current = root_;
    while (!nodes_[current].is_leaf) {
        current = nodes_[current].children.front();
    }
    return current;
}

void BPlusTree::insert(const Value& key, const Row& row) {
    std::vector<NodeId> path;
    NodeId leaf_id = find_leaf(key, &path);
    Node& leaf = nodes_[leaf_id];

    auto it = std::lower_bound(leaf.keys.begin(), leaf.keys.end(), key, key_less);
    size_t pos = static_cast<size_t>(it - leaf.keys.begin());
    size_++;

    if (it != leaf.keys.end() && it->compare(key) == 0) {
        leaf.rows[pos].push_back(row);
        return;
    }

    leaf.keys.insert(it, key);
    leaf.rows.insert(leaf.rows.begin() + static_cast<std::ptrdiff_t>(pos), std::vector<Row>{row});
    key_count_++;

    if (leaf.keys.size() > max_keys()) {
        split_leaf(leaf_id, path);
    }
}

void BPlusTree::split_leaf(NodeId leaf_id, std::vector<NodeId>& path) {
    // Allocate first: push_back may move the arena
    NodeId right_id = allocate_node(true);
    Node& leaf = nodes_[leaf_id];
    Node& right = nodes_[right_id];

    size_t mid = leaf.keys.size() / 2;
    auto key_mid = leaf.keys.begin() + static_cast<std::ptrdiff_t>(mid);
    auto row_mid = leaf.rows.begin() + static_cast<std::ptrdiff_t>(mid);

    right.keys.assign(std::make_move_iterator(key_mid), std::make_move_iterator(leaf.keys.end()));
    right.rows.assign(std::make_move_iterator(row_mid), std::make_move_iterator(leaf.rows.end()));
    leaf.keys.erase(key_mid, leaf.keys.end());
    leaf.rows.erase(row_mid, leaf.rows.end());

    right.next = leaf.next;
    leaf.next = right_id;

    Value separator = right.keys.front();
    insert_into_parent(leaf_id, separator, right_id, path);
}

void BPlusTree::insert_into_parent(NodeId left_id, const Value& separator, NodeId right_id,
                                   std::vector<NodeId>& path) {
    if (path.empty()) {
        // Split reached the root: grow the tree by one level
        NodeId new_root = allocate_node(false);
        Node& root = nodes_[new_root];
        root.keys.push_back(separator);
        root.children.push_back(left_id);
        root.children.push_back(right_id);
        root_ = new_root;
        return;
    }

    NodeId parent_id = path.back();
    path.pop_back();
    Node& parent = nodes_[parent_id];

    auto child = std::find(parent.children.begin(), parent.children.end(), left_id);
    size_t i = static_cast<size_t>(child - parent.children.begin());

    parent.keys.insert(parent.keys.begin() + static_cast<std::ptrdiff_t>(i), separator);
    parent.children.insert(parent.children.begin() + static_cast<std::ptrdiff_t>(i + 1), right_id);

    if (parent.keys.size() > max_keys()) {
        split_internal(parent_id, path);
    }
}

void BPlusTree::split_internal(NodeId node_id, std::vector<NodeId>& path) {
    NodeId right_id = allocate_node(false);
    Node& node = nodes_[node_id];
    Node& right = nodes_[right_id];

    size_t mid = node.keys.size() / 2;
    Value separator = node.keys[mid];

    right.keys.assign(node.keys.begin() + static_cast<std::ptrdiff_t>(mid + 1), node.keys.end());
    right.children.assign(node.children.begin() + static_cast<std::ptrdiff_t>(mid + 1),
                          node.children.end());
    node.keys.erase(node.keys.begin() + static_cast<std::ptrdiff_t>(mid), node.keys.end());
    node.children.erase(node.children.begin() + static_cast<std::ptrdiff_t>(mid + 1),
                        node.children.end());

    insert_into_parent(node_id, separator, right_id, path);
}

std::vector<Row> BPlusTree::find(const Value& key) const {
    const Node& leaf = nodes_[find_leaf(key, nullptr)];
    auto it = std::lower_bound(leaf.keys.begin(), leaf.keys.end(), key, key_less);
    if (it == leaf.keys.end() || it->compare(key) != 0) {
        return {};
    }
    return leaf.rows[static_cast<size_t>(it - leaf.keys.begin())];
}

bool BPlusTree::contains(const Value& key) const {
    const Node& leaf = nodes_[find_leaf(key, nullptr)];
    return std::binary_search(leaf.keys.begin(), leaf.keys.end(), key, key_less);
}

RangeIterator BPlusTree::range(const std::optional<Value>& lower,
                               const std::optional<Value>& upper,
                               bool lower_inclusive,
                               bool upper_inclusive) const {
    if (!lower) {
        return RangeIterator(this, leftmost_leaf(), 0, upper, upper_inclusive);
    }

    NodeId leaf_id = find_leaf(*lower, nullptr);
    const Node& leaf = nodes_[leaf_id];
    auto it = lower_inclusive
        ? std::lower_bound(leaf.keys.begin(), leaf.keys.end(), *lower, key_less)
        : std::upper_bound(leaf.keys.begin(), leaf.keys.end(), *lower, key_less);

    return RangeIterator(this, leaf_id, static_cast<size_t>(it - leaf.keys.begin()),
                         upper, upper_inclusive);
}

std::vector<Row> BPlusTree::range_rows(const std::optional<Value>& lower,
                                       const std::optional<Value>& upper,
                                       bool lower_inclusive,
                                       bool upper_inclusive) const {
    std::vector<Row> out;
    RangeIterator it = range(lower, upper, lower_inclusive, upper_inclusive);
    Row row;
    while (it.next(&row)) {
        out.push_back(std::move(row));
    }
    return out;
}

size_t BPlusTree::height() const {
    size_t h = 1;
    NodeId current = root_;
    while (!nodes_[current].is_leaf) {
        current = nodes_[current].children.front();
        ++h;
    }
    return h;
}

bool BPlusTree::verify() const {
    size_t leaf_depth = 0;
    if (!verify_node(root_, nullptr, nullptr, 1, &leaf_depth)) {
        return false;
    }

    // Leaf chain must visit every key once, ascending
    size_t keys = 0;
    size_t rows = 0;
    const Value* prev = nullptr;
    for (NodeId id = leftmost_leaf(); id != INVALID_NODE_ID; id = nodes_[id].next) {
        const Node& leaf = nodes_[id];
        if (!leaf.is_leaf) {
            return false;
        }
        for (size_t i = 0; i < leaf.keys.size(); ++i) {
            if (prev && prev->compare(leaf.keys[i]) >= 0) {
                return false;
            }
            prev = &leaf.keys[i];
            rows += leaf.rows[i].size();
        }
        keys += leaf.keys.size();
    }

    return keys == key_count_ && rows == size_;
}

bool BPlusTree::verify_node(NodeId node_id, const Value* low, const Value* high,
                            size_t depth, size_t* leaf_depth) const {
    if (node_id >= nodes_.size()) {
        return false;
    }
    const Node& node = nodes_[node_id];

    if (node.keys.size() > max_keys()) {
        return false;
    }
    for (size_t i = 0; i < node.keys.size(); ++i) {
        const Value& k = node.keys[i];
        if (i > 0 && node.keys[i - 1].compare(k) >= 0) {
            return false;
        }
        // low <= k < high
        if ((low && k.compare(*low) < 0) || (high && k.compare(*high) >= 0)) {
            return false;
        }
    }

    if (node.is_leaf) {
        if (node.rows.size() != node.keys.size()) {
            return false;
        }
        for (const auto& list : node.rows) {
            if (list.empty()) {
                return false;
            }
        }
        // All leaves at the same depth
        if (*leaf_depth == 0) {
            *leaf_depth = depth;
        }
        return *leaf_depth == depth;
    }

    if (node.keys.empty() || node.children.size() != node.keys.size() + 1) {
        return false;
    }
    for (size_t i = 0; i < node.children.size(); ++i) {
        const Value* child_low = i == 0 ? low : &node.keys[i - 1];
        const Value* child_high = i == node.keys.size() ? high : &node.keys[i];
        if (!verify_node(node.children[i], child_low, child_high, depth + 1, leaf_depth)) {
            return false;
        }
    }
    return true;
}

}  // namespace minirel
