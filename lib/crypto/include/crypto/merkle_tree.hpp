#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "crypto/common.hpp"
#include "crypto/error.hpp"

namespace Reserve::Crypto::MerkleTree {

using Hash = Digest;
using NodeIndex = std::size_t;

enum class Direction : std::uint8_t {
    Left = 0,
    Right = 1
};

[[nodiscard]] const char* to_string(Direction d);

// One step of a root-to-leaf descent: the ancestor's own hash and which
// child was followed from it.
struct PathStep {
    Hash node_hash;
    Direction direction;

    bool operator==(const PathStep&) const = default;
};

using TraversePath = std::vector<PathStep>;

// One step of a leaf-to-root sibling proof. `side` is where the sibling sits
// relative to the running hash.
struct ProofStep {
    Hash sibling;
    Direction side;

    bool operator==(const ProofStep&) const = default;
};

struct Proof {
    std::vector<ProofStep> siblings; // 叶子到根
};

// A leaf payload only needs a canonical byte serialization, found by ADL.
template <typename T>
concept LeafPayload = std::copy_constructible<T> && requires(const T& v) {
    { serialize(v) } -> std::convertible_to<std::string>;
};

template <LeafPayload T>
struct Node {
    Hash hash;
    std::optional<T> payload; // 仅叶子节点持有
    std::optional<NodeIndex> left;
    std::optional<NodeIndex> right;

    [[nodiscard]] bool is_leaf() const { return payload.has_value(); }
};

template <LeafPayload T>
struct Match {
    const Node<T>* leaf;
    TraversePath path;
};

template <LeafPayload T>
struct Inclusion {
    const Node<T>* leaf;
    Proof proof;
};

namespace detail {
    // tagged_hash(leaf_tag, data)
    Hash hash_leaf(std::string_view leaf_tag, BytesSpan data);

    // tagged_hash(branch_tag, left || right)
    Hash hash_branch(std::string_view branch_tag, const Hash& left, const Hash& right);
}

template <LeafPayload T>
class Tree {
public:
    Tree() = default;

    // Leaves are hashed in input order; each level pairs (0,1), (2,3), ...
    // and an odd trailing node is paired with itself.
    [[nodiscard]]
    static Tree build(std::string_view leaf_tag, std::string_view branch_tag, std::span<const T> records);

    [[nodiscard]] std::optional<std::string> root() const
    {
        if (!root_)
            return std::nullopt;
        return to_hex(nodes_[*root_].hash);
    }

    [[nodiscard]] std::optional<Hash> root_hash() const
    {
        if (!root_)
            return std::nullopt;
        return nodes_[*root_].hash;
    }

    // Pre-order, left before right. The returned path is root-to-leaf and
    // holds each ancestor's hash with the direction taken from it.
    template <std::predicate<const T&> Pred>
    [[nodiscard]] std::optional<Match<T>> search(Pred&& pred) const;

    // Same traversal as search(), reported as a leaf-to-root sibling proof
    // that verify() can check without the tree.
    template <std::predicate<const T&> Pred>
    [[nodiscard]] std::expected<Inclusion<T>, std::error_code> prove(Pred&& pred) const;

    [[nodiscard]] bool empty() const { return !root_.has_value(); }
    [[nodiscard]] size_t leaf_count() const { return leaf_count_; }
    [[nodiscard]] size_t height() const { return height_; }
    [[nodiscard]] std::optional<NodeIndex> root_index() const { return root_; }

    // 底层存储：叶子在前，之后逐层追加分支节点
    [[nodiscard]] const std::vector<Node<T>>& nodes() const { return nodes_; }

private:
    using Descent = std::vector<std::pair<NodeIndex, Direction>>;

    template <typename Pred>
    std::optional<NodeIndex> locate(NodeIndex index, Pred& pred, Descent& descent) const;

    size_t leaf_count_ = 0;
    size_t height_ = 0;
    std::optional<NodeIndex> root_;
    std::vector<Node<T>> nodes_;
};

template <LeafPayload T>
Tree<T> Tree<T>::build(std::string_view leaf_tag, std::string_view branch_tag, std::span<const T> records)
{
    Tree tree;
    if (records.empty()) {
        return tree;
    }

    const size_t N = records.size();
    tree.leaf_count_ = N;
    // N 个叶子，每层最多 ceil(n/2) 个分支，总数不超过 2N + log2(N)
    tree.nodes_.reserve(2 * N + 64);

    std::vector<NodeIndex> level;
    level.reserve(N);
    for (const auto& record : records) {
        const std::string bytes = serialize(record);
        level.push_back(tree.nodes_.size());
        tree.nodes_.push_back(Node<T> {
            .hash = detail::hash_leaf(leaf_tag, as_span(bytes)),
            .payload = record,
            .left = std::nullopt,
            .right = std::nullopt });
    }

    while (level.size() > 1) {
        std::vector<NodeIndex> next;
        next.reserve((level.size() + 1) / 2);

        for (size_t i = 0; i < level.size(); i += 2) {
            const NodeIndex l = level[i];
            const NodeIndex r = (i + 1 < level.size()) ? level[i + 1] : l;

            Hash h = detail::hash_branch(branch_tag, tree.nodes_[l].hash, tree.nodes_[r].hash);
            next.push_back(tree.nodes_.size());
            tree.nodes_.push_back(Node<T> {
                .hash = h,
                .payload = std::nullopt,
                .left = l,
                .right = r });
        }

        level = std::move(next);
        ++tree.height_;
    }

    tree.root_ = level.front();
    return tree;
}

template <LeafPayload T>
template <typename Pred>
std::optional<NodeIndex> Tree<T>::locate(NodeIndex index, Pred& pred, Descent& descent) const
{
    const auto& node = nodes_[index];
    if (node.payload && std::invoke(pred, *node.payload)) {
        return index;
    }

    if (node.left) {
        descent.emplace_back(index, Direction::Left);
        if (auto found = locate(*node.left, pred, descent)) {
            return found;
        }
        descent.pop_back();
    }

    if (node.right) {
        descent.emplace_back(index, Direction::Right);
        if (auto found = locate(*node.right, pred, descent)) {
            return found;
        }
        descent.pop_back();
    }

    return std::nullopt;
}

template <LeafPayload T>
template <std::predicate<const T&> Pred>
std::optional<Match<T>> Tree<T>::search(Pred&& pred) const
{
    if (!root_) {
        return std::nullopt;
    }

    Descent descent;
    descent.reserve(height_);
    auto found = locate(*root_, pred, descent);
    if (!found) {
        return std::nullopt;
    }

    TraversePath path;
    path.reserve(descent.size());
    for (const auto& [index, direction] : descent) {
        path.push_back(PathStep { .node_hash = nodes_[index].hash, .direction = direction });
    }
    return Match<T> { .leaf = &nodes_[*found], .path = std::move(path) };
}

template <LeafPayload T>
template <std::predicate<const T&> Pred>
std::expected<Inclusion<T>, std::error_code> Tree<T>::prove(Pred&& pred) const
{
    if (!root_) {
        return std::unexpected(make_error_code(Error::EmptyTree));
    }

    Descent descent;
    descent.reserve(height_);
    auto found = locate(*root_, pred, descent);
    if (!found) {
        return std::unexpected(make_error_code(Error::NotFound));
    }

    Proof proof;
    proof.siblings.reserve(descent.size());
    // 从叶子向上：走了左边，兄弟在右边，反之亦然
    for (auto it = descent.rbegin(); it != descent.rend(); ++it) {
        const auto& parent = nodes_[it->first];
        if (it->second == Direction::Left) {
            proof.siblings.push_back({ nodes_[*parent.right].hash, Direction::Right });
        } else {
            proof.siblings.push_back({ nodes_[*parent.left].hash, Direction::Left });
        }
    }
    return Inclusion<T> { .leaf = &nodes_[*found], .proof = std::move(proof) };
}

// 不需要 Tree 对象，只需要 root hash 和两个 tag
// leaf: 叶子的规范序列化字节
[[nodiscard]]
bool verify(std::string_view leaf_tag, std::string_view branch_tag,
    BytesSpan leaf, const Hash& root_hash, const Proof& proof);

} // namespace Reserve::Crypto::MerkleTree
