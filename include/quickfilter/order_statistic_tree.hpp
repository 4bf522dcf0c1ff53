#ifndef _QUICKFILTER_ORDER_STATISTIC_TREE_H_
#define _QUICKFILTER_ORDER_STATISTIC_TREE_H_

#include "base/defines.hpp"
#include "quickfilter/filter_errors.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace quickfilter {

// Sorted multiset supporting insertion, removal and selection of
// the element at a given rank, all in O(log n).
// It's an AVL tree augmented with subtree sizes. Equal values are
// fungible and share one node carrying a multiplicity count, so
// removal acts on value equality rather than insertion identity.
template <typename T>
class OrderStatisticTree {
public:
    OrderStatisticTree();
    ~OrderStatisticTree();

    OrderStatisticTree(OrderStatisticTree&&) = default;
    OrderStatisticTree& operator=(OrderStatisticTree&&) = default;

    // Insert one observation.
    void Insert(const T& value);

    // Remove one observation equal to `value`, or return false and
    // leave the tree unchanged if there is none.
    bool Erase(const T& value);

    // Returns the element at index `floor(size * percentile)` of the
    // sorted content, clamped to the last element.
    // `percentile` should be between 0 and 1.
    T Select(double percentile) const;

    // Returns the element at `rank` of the sorted content, 0 being the
    // minimum and size() - 1 the maximum.
    T SelectRank(size_t rank) const;

    size_t size() const { return Total(root_.get()); }
    bool empty() const { return root_ == nullptr; }

    void Reset();

    // Sorted content, duplicates expanded.
    std::vector<T> ToVector() const;

private:
    struct Node {
        explicit Node(const T& v)
            : value(v),
              count(1),
              total(1),
              height(1) {}

        T value;
        // Occurrences of `value`.
        size_t count;
        // Occurrences in the subtree rooted here.
        size_t total;
        int height;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };
    using NodePtr = std::unique_ptr<Node>;

    static int Height(const Node* node) { return node ? node->height : 0; }
    static size_t Total(const Node* node) { return node ? node->total : 0; }

    static void Update(Node* node);
    static NodePtr RotateLeft(NodePtr node);
    static NodePtr RotateRight(NodePtr node);
    static NodePtr Rebalance(NodePtr node);

    static NodePtr Insert(NodePtr node, const T& value);
    static NodePtr Erase(NodePtr node, const T& value, bool* erased);
    // Detaches the minimum node of the subtree into `min`.
    static NodePtr DetachMin(NodePtr node, NodePtr* min);

    static void CollectInOrder(const Node* node, std::vector<T>* out);

private:
    NodePtr root_;

    DISALLOW_COPY_AND_ASSIGN(OrderStatisticTree);
};

template <typename T>
std::ostream& operator<<(std::ostream& out, const OrderStatisticTree<T>& tree) {
    out << "[";
    bool first = true;
    for (const auto& value : tree.ToVector()) {
        if (!first) {
            out << ", ";
        }
        out << value;
        first = false;
    }
    out << "]";
    return out;
}

// Implements
template <typename T>
OrderStatisticTree<T>::OrderStatisticTree() = default;

template <typename T>
OrderStatisticTree<T>::~OrderStatisticTree() = default;

template <typename T>
void OrderStatisticTree<T>::Insert(const T& value) {
    root_ = Insert(std::move(root_), value);
}

template <typename T>
bool OrderStatisticTree<T>::Erase(const T& value) {
    bool erased = false;
    root_ = Erase(std::move(root_), value, &erased);
    return erased;
}

template <typename T>
T OrderStatisticTree<T>::Select(double percentile) const {
    // Written to reject NaN as well.
    if (!(percentile >= 0.0 && percentile <= 1.0)) {
        throw SelectionRangeError("Percent must be between 0 and 1.");
    }
    const size_t length = size();
    if (length == 0) {
        throw std::out_of_range("Select from an empty tree.");
    }
    size_t index = static_cast<size_t>(std::floor(length * percentile));
    if (index >= length) {
        index = length - 1;
    }
    return SelectRank(index);
}

template <typename T>
T OrderStatisticTree<T>::SelectRank(size_t rank) const {
    if (rank >= size()) {
        throw std::out_of_range("Rank " + std::to_string(rank) +
                                " out of range for tree of size " + std::to_string(size()));
    }
    const Node* node = root_.get();
    while (node) {
        const size_t left_total = Total(node->left.get());
        if (rank < left_total) {
            node = node->left.get();
        } else if (rank < left_total + node->count) {
            return node->value;
        } else {
            rank -= left_total + node->count;
            node = node->right.get();
        }
    }
    // Subtree totals are inconsistent.
    throw std::logic_error("Order statistic tree is corrupted.");
}

template <typename T>
void OrderStatisticTree<T>::Reset() {
    root_.reset();
}

template <typename T>
std::vector<T> OrderStatisticTree<T>::ToVector() const {
    std::vector<T> values;
    values.reserve(size());
    CollectInOrder(root_.get(), &values);
    return values;
}

template <typename T>
void OrderStatisticTree<T>::Update(Node* node) {
    node->height = 1 + std::max(Height(node->left.get()), Height(node->right.get()));
    node->total = node->count + Total(node->left.get()) + Total(node->right.get());
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::RotateLeft(NodePtr node) {
    NodePtr pivot = std::move(node->right);
    node->right = std::move(pivot->left);
    Update(node.get());
    pivot->left = std::move(node);
    Update(pivot.get());
    return pivot;
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::RotateRight(NodePtr node) {
    NodePtr pivot = std::move(node->left);
    node->left = std::move(pivot->right);
    Update(node.get());
    pivot->right = std::move(node);
    Update(pivot.get());
    return pivot;
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::Rebalance(NodePtr node) {
    Update(node.get());
    const int balance = Height(node->left.get()) - Height(node->right.get());
    if (balance > 1) {
        // Left-right case
        if (Height(node->left->left.get()) < Height(node->left->right.get())) {
            node->left = RotateLeft(std::move(node->left));
        }
        return RotateRight(std::move(node));
    } else if (balance < -1) {
        // Right-left case
        if (Height(node->right->right.get()) < Height(node->right->left.get())) {
            node->right = RotateRight(std::move(node->right));
        }
        return RotateLeft(std::move(node));
    }
    return node;
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::Insert(NodePtr node, const T& value) {
    if (!node) {
        return std::make_unique<Node>(value);
    }
    if (value < node->value) {
        node->left = Insert(std::move(node->left), value);
    } else if (node->value < value) {
        node->right = Insert(std::move(node->right), value);
    } else {
        ++node->count;
        Update(node.get());
        return node;
    }
    return Rebalance(std::move(node));
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::Erase(NodePtr node, const T& value, bool* erased) {
    if (!node) {
        return nullptr;
    }
    if (value < node->value) {
        node->left = Erase(std::move(node->left), value, erased);
    } else if (node->value < value) {
        node->right = Erase(std::move(node->right), value, erased);
    } else {
        *erased = true;
        if (node->count > 1) {
            --node->count;
            Update(node.get());
            return node;
        }
        if (!node->left) {
            return std::move(node->right);
        }
        if (!node->right) {
            return std::move(node->left);
        }
        // Replace with the in-order successor.
        NodePtr successor;
        NodePtr right = DetachMin(std::move(node->right), &successor);
        successor->left = std::move(node->left);
        successor->right = std::move(right);
        return Rebalance(std::move(successor));
    }
    return Rebalance(std::move(node));
}

template <typename T>
typename OrderStatisticTree<T>::NodePtr OrderStatisticTree<T>::DetachMin(NodePtr node, NodePtr* min) {
    if (!node->left) {
        NodePtr right = std::move(node->right);
        *min = std::move(node);
        return right;
    }
    node->left = DetachMin(std::move(node->left), min);
    return Rebalance(std::move(node));
}

template <typename T>
void OrderStatisticTree<T>::CollectInOrder(const Node* node, std::vector<T>* out) {
    if (!node) {
        return;
    }
    CollectInOrder(node->left.get(), out);
    out->insert(out->end(), node->count, node->value);
    CollectInOrder(node->right.get(), out);
}

} // namespace quickfilter

#endif
