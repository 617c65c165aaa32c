#pragma once
#include "crypto/common.hpp"
#include "crypto/merkle_tree.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <iomanip>
#include <string>
#include <string_view>
#include <vector>

namespace Reserve::Crypto {

// 测试用叶子：(id,balance)
struct Account {
    uint32_t id;
    uint64_t balance;
};

inline std::string serialize(const Account& a)
{
    return "(" + std::to_string(a.id) + "," + std::to_string(a.balance) + ")";
}

// 测试用叶子：原样字节
struct Blob {
    std::string data;
};

inline std::string serialize(const Blob& b)
{
    return b.data;
}

inline const std::string kLeafTag = "ProofOfReserve_Leaf";
inline const std::string kBranchTag = "ProofOfReserve_Branch";

// 辅助：hex -> Hash
inline MerkleTree::Hash from_hex(std::string_view hex)
{
    MerkleTree::Hash h {};
    auto nibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9')
            return static_cast<Byte>(c - '0');
        return static_cast<Byte>(c - 'a' + 10);
    };
    for (size_t i = 0; i < h.size() && 2 * i + 1 < hex.size(); ++i) {
        h[i] = static_cast<Byte>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return h;
}

// 辅助：GTest 打印 Hash (std::array<Byte, 32>)
inline void PrintTo(const MerkleTree::Hash& h, std::ostream* os)
{
    *os << "\"" << to_hex(h) << "\"";
}

} // namespace Reserve::Crypto

namespace Reserve::Crypto::MerkleTree {

inline void PrintTo(const PathStep& s, std::ostream* os)
{
    *os << "(" << to_hex(s.node_hash) << ", " << to_string(s.direction) << ")";
}

} // namespace Reserve::Crypto::MerkleTree
