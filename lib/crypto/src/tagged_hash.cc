#include "crypto/tagged_hash.hpp"
#include "crypto/error.hpp"
#include "impl/evp.hpp"
#include <openssl/evp.h>
#include <system_error>

namespace Reserve::Crypto {
using impl::EvpMdCtxPtr;

namespace {

    void check(int rc)
    {
        if (rc != 1) {
            throw std::system_error(make_error_code(Error::OpenSSLError));
        }
    }

    void update(EVP_MD_CTX* ctx, BytesSpan data)
    {
        // EVP_DigestUpdate 接受长度为 0 的输入
        check(EVP_DigestUpdate(ctx, u8ptr(data.data()), data.size()));
    }

} // namespace

Digest tagged_hash(std::string_view tag, std::initializer_list<BytesSpan> parts)
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::system_error(make_error_code(Error::OpenSSLError));
    }

    check(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr));

    // tag 连续写入两次，紧接着是数据
    auto tag_bytes = as_span(tag);
    update(ctx.get(), tag_bytes);
    update(ctx.get(), tag_bytes);
    for (const auto& part : parts) {
        update(ctx.get(), part);
    }

    Digest h;
    unsigned int len = 0;
    check(EVP_DigestFinal_ex(ctx.get(), u8ptr(h.data()), &len));
    if (len != h.size()) {
        throw std::system_error(make_error_code(Error::OpenSSLError));
    }
    return h;
}

Digest tagged_hash(std::string_view tag, BytesSpan input)
{
    return tagged_hash(tag, { input });
}

} // namespace Reserve::Crypto
