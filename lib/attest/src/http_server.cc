#include "attest/http_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace Reserve::Attest {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

    using RequestWithStringBody = http::request<http::string_body>;
    using ResponseWithStringBody = http::response<http::string_body>;

    constexpr auto kIdleTimeout = std::chrono::seconds(30);

    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket&& socket, const ProofService& service)
            : stream_(std::move(socket))
            , service_(service)
        {
        }

        void run()
        {
            net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&Session::do_read, shared_from_this()));
        }

    private:
        void do_read()
        {
            req_ = {};
            stream_.expires_after(kIdleTimeout);
            http::async_read(stream_, buffer_, req_,
                beast::bind_front_handler(&Session::on_read, shared_from_this()));
        }

        void on_read(beast::error_code ec, std::size_t)
        {
            if (ec == http::error::end_of_stream) {
                return do_close();
            }
            if (ec) {
                if (ec != beast::error::timeout) {
                    spdlog::warn("http: read failed: {}", ec.message());
                }
                return;
            }

            const auto verb = req_.method_string();
            const auto path = req_.target();
            const std::string method(verb.data(), verb.size());
            const std::string target(path.data(), path.size());
            Response r = service_.handle(method, target);
            spdlog::debug("http: {} {} -> {}", method, target, r.status);

            res_ = ResponseWithStringBody(http::int_to_status(r.status), req_.version());
            res_.set(http::field::server, "reserve");
            res_.set(http::field::content_type, r.content_type);
            res_.keep_alive(req_.keep_alive());
            res_.body() = std::move(r.body);
            res_.prepare_payload();

            http::async_write(stream_, res_,
                beast::bind_front_handler(&Session::on_write, shared_from_this(), res_.keep_alive()));
        }

        void on_write(bool keep_alive, beast::error_code ec, std::size_t)
        {
            if (ec) {
                spdlog::warn("http: write failed: {}", ec.message());
                return;
            }
            if (!keep_alive) {
                return do_close();
            }
            do_read();
        }

        void do_close()
        {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            if (ec && ec != beast::errc::not_connected) {
                spdlog::debug("http: shutdown: {}", ec.message());
            }
        }

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        RequestWithStringBody req_;
        ResponseWithStringBody res_;
        const ProofService& service_;
    };

} // namespace

HttpServer::HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, const ProofService& service)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , service_(service)
{
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void HttpServer::stop()
{
    net::post(acceptor_.get_executor(), [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("http: closing acceptor: {}", ec.message());
        }
    });
}

void HttpServer::do_accept()
{
    acceptor_.async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        });
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket)
{
    if (ec == net::error::operation_aborted) {
        return; // stop()
    }
    if (ec) {
        spdlog::error("http: accept failed: {}", ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), service_)->run();
    }
    do_accept();
}

} // namespace Reserve::Attest
