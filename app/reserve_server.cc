#include "attest/config.hpp"
#include "attest/http_server.hpp"
#include "attest/proof_service.hpp"
#include "attest/record.hpp"

#include <CLI/CLI.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <csignal>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

using namespace Reserve::Attest;

int main(int argc, char* argv[])
{
    CLI::App app { "Serves a proof-of-reserve Merkle root and per-user inclusion paths" };

    std::string config_path;
    std::optional<std::string> address;
    std::optional<uint16_t> port;
    std::optional<int> threads;
    std::optional<std::string> log_level;

    app.add_option("-c,--config", config_path, "JSON file with tags, records and listener settings")
        ->check(CLI::ExistingFile);
    app.add_option("--address", address, "Listen address (default 127.0.0.1)");
    app.add_option("--port", port, "Listen port (default 8000)");
    app.add_option("--threads", threads, "Number of I/O threads (default 1)")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", log_level, "trace, debug, info, warn, err, critical, off");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    ServiceConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            spdlog::critical("cannot load {}: {}", config_path, loaded.error().message());
            return 1;
        }
        config = std::move(*loaded);
    }
    if (address)
        config.address = *address;
    if (port)
        config.port = *port;
    if (threads)
        config.threads = *threads;
    if (log_level)
        config.log_level = *log_level;

    if (auto ec = validate(config)) {
        spdlog::critical("invalid configuration: {}", ec.message());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    // 启动时构建一次，之后只读
    const LedgerTree tree = LedgerTree::build(config.leaf_tag, config.branch_tag, config.records);
    spdlog::info("built tree: {} records, height {}, root {}",
        tree.leaf_count(), tree.height(), tree.root().value_or("<empty>"));

    const ProofService service(tree);

    try {
        boost::asio::io_context ioc(config.threads);
        const tcp::endpoint endpoint(boost::asio::ip::make_address(config.address), config.port);
        HttpServer server(ioc, endpoint, service);
        server.run();
        spdlog::info("listening on {}:{}", server.local_endpoint().address().to_string(), server.local_endpoint().port());

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec)
                return;
            spdlog::info("signal {} received, shutting down", signo);
            server.stop();
            ioc.stop();
        });

        std::vector<std::thread> pool;
        pool.reserve(config.threads - 1);
        for (int i = 1; i < config.threads; ++i) {
            pool.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : pool) {
            t.join();
        }
    } catch (const boost::system::system_error& e) {
        spdlog::critical("server error: {}", e.what());
        return 1;
    }

    spdlog::info("stopped");
    return 0;
}
