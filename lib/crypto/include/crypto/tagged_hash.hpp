#pragma once

#include <initializer_list>
#include <string_view>

#include "crypto/common.hpp"

namespace Reserve::Crypto {

// SHA-256(tag || tag || input), one digest pass.
// Throws std::system_error(Error::OpenSSLError) if the EVP layer fails.
[[nodiscard]]
Digest tagged_hash(std::string_view tag, BytesSpan input);

// Same digest over a sequence of input parts, fed to the hasher back to back.
[[nodiscard]]
Digest tagged_hash(std::string_view tag, std::initializer_list<BytesSpan> parts);

} // namespace Reserve::Crypto
