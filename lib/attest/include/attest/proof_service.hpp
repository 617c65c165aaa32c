#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <json/json.h>

#include "attest/record.hpp"

namespace Reserve::Attest {

struct Response {
    unsigned status = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// { "user_balance": n, "proof": [[hash_hex, 0|1], ...] }, root to leaf.
Json::Value encode_path(const Record& record, const Crypto::MerkleTree::TraversePath& path);

// { "user_id", "user_balance", "leaf", "root", "siblings": [[hash_hex, 0|1], ...] },
// leaf to root. "leaf" is the canonical serialization a verifier must hash.
Json::Value encode_proof(const Record& record, const Crypto::MerkleTree::Hash& root,
    const Crypto::MerkleTree::Proof& proof);

// Read-only router over a tree built once at startup. Borrows the tree, which
// must outlive the service. Safe to call from several threads at once.
class ProofService {
public:
    explicit ProofService(const LedgerTree& tree)
        : tree_(tree)
    {
    }

    // GET /proof, /proof/mermaid, /proof/<id>, /proof/<id>/siblings.
    // Any query string is ignored.
    [[nodiscard]] Response handle(std::string_view method, std::string_view target) const;

    [[nodiscard]] Response root() const;
    [[nodiscard]] Response diagram() const;
    [[nodiscard]] Response path(std::string_view user_id) const;
    [[nodiscard]] Response siblings(std::string_view user_id) const;

    [[nodiscard]] const LedgerTree& tree() const { return tree_; }

private:
    const LedgerTree& tree_;
};

// Maps core error codes onto HTTP status codes (400 / 404 / 500).
unsigned status_for(const std::error_code& ec);

} // namespace Reserve::Attest
