#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Reserve::Crypto {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyTree, // 树由零条记录构建
    NotFound, // 没有叶子满足谓词
    MalformedIdentifier, // 用户 ID 不是合法的 u32
    InvalidConfig, // 配置文件不可读或字段非法
    OpenSSLError // EVP 调用失败
};

class ReserveErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "Reserve"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyTree:
            return "Merkle tree has no records";
        case Error::NotFound:
            return "No record matches the query";
        case Error::MalformedIdentifier:
            return "User id must be an unsigned 32-bit decimal number";
        case Error::InvalidConfig:
            return "Invalid configuration";
        case Error::OpenSSLError:
            return "OpenSSL digest failure";
        default:
            return "Unknown reserve error";
        }
    }
};

inline const std::error_category& reserve_category()
{
    static ReserveErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), reserve_category() };
}
} // namespace Reserve::Crypto

namespace std {
template <>
struct is_error_code_enum<Reserve::Crypto::Error> : true_type { };
} // namespace std
