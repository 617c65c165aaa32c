#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Reserve::Crypto {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

// SHA-256 output
using Digest = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline const unsigned char* u8ptr(const Byte* p)
{
    return reinterpret_cast<const unsigned char*>(p);
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

// Lowercase, no prefix.
std::string to_hex(BytesSpan bytes);

} // namespace Reserve::Crypto
