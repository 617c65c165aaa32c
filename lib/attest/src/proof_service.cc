#include "attest/proof_service.hpp"
#include "attest/diagram.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"

namespace Reserve::Attest {
using Crypto::Error;
using Crypto::to_hex;
namespace MT = Crypto::MerkleTree;

namespace {

    constexpr std::string_view kPrefix = "/proof";
    constexpr std::string_view kSiblingsSuffix = "/siblings";

    std::string to_json(const Json::Value& v)
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, v);
    }

    Response json_response(const Json::Value& v)
    {
        return Response { .status = 200, .content_type = "application/json", .body = to_json(v) };
    }

    Response error_response(unsigned status, const std::string& message)
    {
        Json::Value body(Json::objectValue);
        body["error"] = message;
        return Response { .status = status, .content_type = "application/json", .body = to_json(body) };
    }

    Response error_response(const std::error_code& ec)
    {
        return error_response(status_for(ec), ec.message());
    }

    auto by_id(UserId id)
    {
        return [id](const Record& r) { return r.id == id; };
    }

} // namespace

Json::Value encode_path(const Record& record, const MT::TraversePath& path)
{
    Json::Value out(Json::objectValue);
    out["user_balance"] = Json::Value(static_cast<Json::UInt64>(record.balance));

    Json::Value steps(Json::arrayValue);
    for (const auto& step : path) {
        Json::Value pair(Json::arrayValue);
        pair.append(to_hex(step.node_hash));
        pair.append(Json::Value(static_cast<Json::UInt>(step.direction)));
        steps.append(std::move(pair));
    }
    out["proof"] = std::move(steps);
    return out;
}

Json::Value encode_proof(const Record& record, const MT::Hash& root, const MT::Proof& proof)
{
    Json::Value out(Json::objectValue);
    out["user_id"] = Json::Value(static_cast<Json::UInt>(record.id));
    out["user_balance"] = Json::Value(static_cast<Json::UInt64>(record.balance));
    out["leaf"] = serialize(record);
    out["root"] = to_hex(root);

    Json::Value steps(Json::arrayValue);
    for (const auto& step : proof.siblings) {
        Json::Value pair(Json::arrayValue);
        pair.append(to_hex(step.sibling));
        pair.append(Json::Value(static_cast<Json::UInt>(step.side)));
        steps.append(std::move(pair));
    }
    out["siblings"] = std::move(steps);
    return out;
}

unsigned status_for(const std::error_code& ec)
{
    if (ec == Error::MalformedIdentifier)
        return 400;
    if (ec == Error::EmptyTree || ec == Error::NotFound)
        return 404;
    return 500;
}

Response ProofService::handle(std::string_view method, std::string_view target) const
{
    if (method != "GET") {
        return error_response(405, "Method Not Allowed");
    }

    if (auto q = target.find('?'); q != std::string_view::npos) {
        target = target.substr(0, q);
    }

    if (target == kPrefix) {
        return root();
    }
    if (!target.starts_with(kPrefix) || target.size() <= kPrefix.size() + 1 || target[kPrefix.size()] != '/') {
        return error_response(404, "Not Found");
    }

    auto rest = target.substr(kPrefix.size() + 1);
    if (rest == "mermaid") {
        return diagram();
    }
    if (rest.ends_with(kSiblingsSuffix)) {
        return siblings(rest.substr(0, rest.size() - kSiblingsSuffix.size()));
    }
    if (rest.find('/') != std::string_view::npos) {
        return error_response(404, "Not Found");
    }
    return path(rest);
}

Response ProofService::root() const
{
    auto hex = tree_.root();
    if (!hex) {
        return error_response(make_error_code(Error::EmptyTree));
    }
    return Response { .status = 200, .content_type = "text/plain", .body = std::move(*hex) };
}

Response ProofService::diagram() const
{
    if (tree_.empty()) {
        return error_response(make_error_code(Error::EmptyTree));
    }
    return Response { .status = 200, .content_type = "text/plain", .body = render_mermaid(tree_) };
}

Response ProofService::path(std::string_view user_id) const
{
    auto id = parse_user_id(user_id);
    if (!id) {
        return error_response(id.error());
    }
    if (tree_.empty()) {
        return error_response(make_error_code(Error::EmptyTree));
    }

    auto match = tree_.search(by_id(*id));
    if (!match) {
        return error_response(make_error_code(Error::NotFound));
    }
    return json_response(encode_path(*match->leaf->payload, match->path));
}

Response ProofService::siblings(std::string_view user_id) const
{
    auto id = parse_user_id(user_id);
    if (!id) {
        return error_response(id.error());
    }

    auto inclusion = tree_.prove(by_id(*id));
    if (!inclusion) {
        return error_response(inclusion.error());
    }
    return json_response(encode_proof(*inclusion->leaf->payload, *tree_.root_hash(), inclusion->proof));
}

} // namespace Reserve::Attest
