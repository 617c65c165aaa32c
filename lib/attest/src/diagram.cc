#include "attest/diagram.hpp"
#include "crypto/common.hpp"
#include <sstream>

namespace Reserve::Attest {

std::string render_mermaid(const LedgerTree& tree)
{
    std::ostringstream out;
    out << "graph TD\n";

    const auto& nodes = tree.nodes();
    // 从 root 开始逆序输出，root 在最上面
    for (auto i = nodes.size(); i-- > 0;) {
        const auto& node = nodes[i];
        out << "    N" << i << "[\"" << Crypto::to_hex(node.hash);
        if (node.payload) {
            out << mermaid_label(*node.payload);
        }
        out << "\"]\n";
    }

    for (auto i = nodes.size(); i-- > 0;) {
        const auto& node = nodes[i];
        if (node.left) {
            out << "    N" << i << " -->|L| N" << *node.left << "\n";
        }
        if (node.right) {
            out << "    N" << i << " -->|R| N" << *node.right << "\n";
        }
    }
    return out.str();
}

} // namespace Reserve::Attest
