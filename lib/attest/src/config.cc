#include "attest/config.hpp"
#include "crypto/error.hpp"
#include <fstream>
#include <iterator>
#include <json/json.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace Reserve::Attest {
using Crypto::Error;

namespace {

    std::unexpected<std::error_code> invalid(std::string_view why)
    {
        spdlog::error("config: {}", why);
        return std::unexpected(make_error_code(Error::InvalidConfig));
    }

    bool read_string(const Json::Value& root, const char* key, std::string& out)
    {
        if (!root.isMember(key))
            return true;
        if (!root[key].isString())
            return false;
        out = root[key].asString();
        return true;
    }

    auto read_records(const Json::Value& array) -> std::expected<std::vector<Record>, std::error_code>
    {
        if (!array.isArray()) {
            return invalid("'records' must be an array");
        }

        std::vector<Record> records;
        records.reserve(array.size());
        for (Json::ArrayIndex i = 0; i < array.size(); ++i) {
            const auto& item = array[i];
            if (!item.isObject() || !item["id"].isUInt() || !item["balance"].isUInt64()) {
                return invalid("records[" + std::to_string(i) + "] must be {\"id\": u32, \"balance\": u64}");
            }
            records.push_back({ item["id"].asUInt(), item["balance"].asUInt64() });
        }
        return records;
    }

} // namespace

auto parse_config(std::string_view json_text, ServiceConfig base)
    -> std::expected<ServiceConfig, std::error_code>
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
        return invalid("not valid JSON: " + errs);
    }
    if (!root.isObject()) {
        return invalid("top level must be an object");
    }

    ServiceConfig config = std::move(base);
    if (!read_string(root, "leaf_tag", config.leaf_tag)
        || !read_string(root, "branch_tag", config.branch_tag)
        || !read_string(root, "address", config.address)
        || !read_string(root, "log_level", config.log_level)) {
        return invalid("tags, address and log_level must be strings");
    }

    if (root.isMember("port")) {
        if (!root["port"].isUInt() || root["port"].asUInt() > 65535) {
            return invalid("'port' must be in [0, 65535]");
        }
        config.port = static_cast<uint16_t>(root["port"].asUInt());
    }

    if (root.isMember("threads")) {
        if (!root["threads"].isInt()) {
            return invalid("'threads' must be an integer");
        }
        config.threads = root["threads"].asInt();
    }

    if (root.isMember("records")) {
        auto records = read_records(root["records"]);
        if (!records) {
            return std::unexpected(records.error());
        }
        config.records = std::move(*records);
    }

    if (auto ec = validate(config)) {
        return std::unexpected(ec);
    }
    return config;
}

auto load_config(const std::filesystem::path& path, ServiceConfig base)
    -> std::expected<ServiceConfig, std::error_code>
{
    std::ifstream in(path);
    if (!in) {
        return invalid("cannot open " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_config(text, std::move(base));
}

std::error_code validate(const ServiceConfig& config)
{
    if (config.leaf_tag.empty() || config.branch_tag.empty()) {
        return invalid("leaf_tag and branch_tag must be non-empty").error();
    }
    // 相同的 tag 会让分支哈希与叶子哈希落在同一个域
    if (config.leaf_tag == config.branch_tag) {
        return invalid("leaf_tag and branch_tag must differ").error();
    }
    if (config.threads < 1) {
        return invalid("'threads' must be at least 1").error();
    }
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        return invalid("unknown log level '" + config.log_level + "'").error();
    }
    return {};
}

} // namespace Reserve::Attest
