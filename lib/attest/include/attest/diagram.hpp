#pragma once

#include <string>

#include "attest/record.hpp"

namespace Reserve::Attest {

// Mermaid "graph TD" rendering of the tree, root first. Each node is labelled
// with its hash; leaves also carry the record. A self-paired node shows two
// edges from its parent. Empty trees render as the bare header.
std::string render_mermaid(const LedgerTree& tree);

} // namespace Reserve::Attest
