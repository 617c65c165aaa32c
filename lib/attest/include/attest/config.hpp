#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "attest/record.hpp"

namespace Reserve::Attest {

struct ServiceConfig {
    std::string leaf_tag = "ProofOfReserve_Leaf";
    std::string branch_tag = "ProofOfReserve_Branch";
    std::vector<Record> records = demo_records();

    std::string address = "127.0.0.1";
    uint16_t port = 8000;
    int threads = 1;
    std::string log_level = "info";
};

// JSON 文本中出现的字段覆盖默认值，未出现的保持默认
[[nodiscard]]
auto parse_config(std::string_view json_text, ServiceConfig base = {})
    -> std::expected<ServiceConfig, std::error_code>;

[[nodiscard]]
auto load_config(const std::filesystem::path& path, ServiceConfig base = {})
    -> std::expected<ServiceConfig, std::error_code>;

// Tags must be non-empty and distinct, threads positive, log level known.
[[nodiscard]]
std::error_code validate(const ServiceConfig& config);

} // namespace Reserve::Attest
