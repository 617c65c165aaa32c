#include "attest/record.hpp"
#include "crypto/error.hpp"
#include <charconv>

namespace Reserve::Attest {
using Crypto::Error;

std::string serialize(const Record& r)
{
    return "(" + std::to_string(r.id) + "," + std::to_string(r.balance) + ")";
}

std::string mermaid_label(const Record& r)
{
    return "<br>User ID: " + std::to_string(r.id) + "<br>Balance: " + std::to_string(r.balance);
}

auto parse_user_id(std::string_view text) -> std::expected<UserId, std::error_code>
{
    if (text.empty()) {
        return std::unexpected(make_error_code(Error::MalformedIdentifier));
    }

    // from_chars 不接受 '+' 和空白，无符号类型遇到 '-' 也直接失败
    UserId id = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, id, 10);
    if (ec != std::errc {} || ptr != last) {
        return std::unexpected(make_error_code(Error::MalformedIdentifier));
    }
    return id;
}

std::vector<Record> demo_records()
{
    std::vector<Record> records;
    records.reserve(8);
    for (UserId id = 1; id <= 8; ++id) {
        records.push_back({ id, static_cast<Balance>(id) * 1111 });
    }
    return records;
}

} // namespace Reserve::Attest
