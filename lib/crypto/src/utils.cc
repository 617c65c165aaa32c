#include "crypto/common.hpp"

namespace Reserve::Crypto {

std::string to_hex(BytesSpan bytes)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2);
    for (Byte b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace Reserve::Crypto
