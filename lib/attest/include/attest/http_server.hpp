#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include "attest/proof_service.hpp"

namespace Reserve::Attest {

using tcp = boost::asio::ip::tcp;

/**
 * @brief HTTP/1.1 listener that answers every request through a ProofService.
 *
 * Each accepted connection gets its own strand, so the io_context may be run
 * from several threads. The service (and the tree behind it) must outlive the
 * server and every connection it spawned.
 */
class HttpServer {
public:
    /**
     * @brief Open, bind and listen on @p endpoint.
     * @throws boost::system::system_error if the socket cannot be bound.
     */
    HttpServer(boost::asio::io_context& ioc, const tcp::endpoint& endpoint, const ProofService& service);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Begin accepting connections.
    void run() { do_accept(); }

    /// Stop accepting; open connections finish their current exchange.
    void stop();

    /// Bound address, useful when listening on port 0.
    [[nodiscard]] tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    const ProofService& service_;
};

} // namespace Reserve::Attest
