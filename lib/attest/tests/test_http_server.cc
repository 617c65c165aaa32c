#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "attest/http_server.hpp"

using namespace Reserve::Attest;
namespace beast = boost::beast;
namespace http = beast::http;

class HttpServerTest : public ::testing::Test {
protected:
    const std::vector<Record> records = demo_records();
    const LedgerTree tree = LedgerTree::build("ProofOfReserve_Leaf", "ProofOfReserve_Branch", records);
    const ProofService service { tree };

    boost::asio::io_context ioc;
    std::unique_ptr<HttpServer> server;
    std::thread runner;

    void SetUp() override
    {
        const tcp::endpoint any_port(boost::asio::ip::make_address("127.0.0.1"), 0);
        server = std::make_unique<HttpServer>(ioc, any_port, service);
        server->run();
        runner = std::thread([this] { ioc.run(); });
    }

    void TearDown() override
    {
        server->stop();
        ioc.stop();
        if (runner.joinable()) {
            runner.join();
        }
    }

    http::response<http::string_body> request(http::verb verb, const std::string& target, bool keep_alive = false)
    {
        boost::asio::io_context client_ioc;
        tcp::socket socket(client_ioc);
        socket.connect(server->local_endpoint());

        http::request<http::string_body> req { verb, target, 11 };
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(keep_alive);
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }
};

TEST_F(HttpServerTest, ServesRoot)
{
    auto res = request(http::verb::get, "/proof");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/plain");
    EXPECT_EQ(res.body(), "448dead7f0ee4f6d4eaba8046149f27125a918b5a459436abc3b93fe3e17acbe");
}

TEST_F(HttpServerTest, ServesUserPath)
{
    auto res = request(http::verb::get, "/proof/8");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_NE(res.body().find("\"user_balance\":8888"), std::string::npos);
}

TEST_F(HttpServerTest, ReportsErrors)
{
    EXPECT_EQ(request(http::verb::get, "/proof/nope").result(), http::status::bad_request);
    EXPECT_EQ(request(http::verb::get, "/proof/99").result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::post, "/proof").result(), http::status::method_not_allowed);
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests)
{
    boost::asio::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect(server->local_endpoint());

    for (const char* target : { "/proof", "/proof/1", "/proof/mermaid" }) {
        http::request<http::string_body> req { http::verb::get, target, 11 };
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::ok) << target;
    }

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
}
