#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "crypto/merkle_tree.hpp"

namespace Reserve::Attest {

using UserId = uint32_t;
using Balance = uint64_t;

/// One user's balance as committed in a leaf.
struct Record {
    UserId id;
    Balance balance;

    bool operator==(const Record&) const = default;
};

/// Canonical leaf bytes: "(id,balance)" in base 10.
std::string serialize(const Record& r);

/// Node label fragment used by the Mermaid renderer.
std::string mermaid_label(const Record& r);

/// Strict base-10 parse of a user id taken from a request target.
/// Rejects empty input, signs, whitespace, non-digits and values above 2^32-1
/// with Error::MalformedIdentifier.
[[nodiscard]]
auto parse_user_id(std::string_view text) -> std::expected<UserId, std::error_code>;

/// The eight demo balances (1,1111) .. (8,8888).
std::vector<Record> demo_records();

using LedgerTree = Crypto::MerkleTree::Tree<Record>;

} // namespace Reserve::Attest
