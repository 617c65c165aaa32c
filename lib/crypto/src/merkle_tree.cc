#include "crypto/merkle_tree.hpp"
#include "crypto/tagged_hash.hpp"

namespace Reserve::Crypto::MerkleTree {

const char* to_string(Direction d)
{
    switch (d) {
    case Direction::Left:
        return "Left";
    case Direction::Right:
        return "Right";
    }
    return "Unknown";
}

namespace detail {

    Hash hash_leaf(std::string_view leaf_tag, BytesSpan data)
    {
        return tagged_hash(leaf_tag, data);
    }

    // 原始 64 字节拼接，不做 hex 也不加长度前缀
    Hash hash_branch(std::string_view branch_tag, const Hash& left, const Hash& right)
    {
        return tagged_hash(branch_tag, { BytesSpan(left), BytesSpan(right) });
    }

} // namespace detail

bool verify(std::string_view leaf_tag, std::string_view branch_tag,
    BytesSpan leaf, const Hash& root_hash, const Proof& proof)
{
    // 1. 计算叶子哈希
    Hash acc = detail::hash_leaf(leaf_tag, leaf);

    // 2. 沿 sibling 路径向上重建 root
    for (const auto& step : proof.siblings) {
        if (step.side == Direction::Left) {
            acc = detail::hash_branch(branch_tag, step.sibling, acc);
        } else {
            acc = detail::hash_branch(branch_tag, acc, step.sibling);
        }
    }

    return acc == root_hash;
}

} // namespace Reserve::Crypto::MerkleTree
