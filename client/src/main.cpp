#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "clawbridge/client/config.hpp"
#include "clawbridge/client/health_probe.hpp"
#include "clawbridge/client/logger.hpp"
#include "clawbridge/client/session_manager.hpp"
#include "clawbridge/client/websocket_transport.hpp"
#include "clawbridge/error_codes.hpp"
#include "clawbridge/version.hpp"

namespace
{

    using namespace clawbridge::client;

    int run_probe(const ClientConfig &config, boost::asio::ssl::context &tls_context)
    {
        const auto result = probe_health(config.url, tls_context);
        if (result.ok)
        {
            std::cout << "ok" << std::endl;
            return EXIT_SUCCESS;
        }
        if (result.status != 0)
        {
            std::cout << "HTTP " << result.status << std::endl;
        }
        else
        {
            std::cout << "unreachable: " << result.detail << std::endl;
        }
        return EXIT_FAILURE;
    }

} // namespace

int main(int argc, char *argv[])
{
    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const clawbridge::BridgeError &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (!config.enabled)
    {
        std::cout << "Bridge disabled by configuration" << std::endl;
        return EXIT_SUCCESS;
    }
    if (!is_configured(config))
    {
        std::cerr << "A url and a token are required" << std::endl;
        std::cerr << usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        auto tls_context = make_client_tls_context();
        if (config.probe)
        {
            return run_probe(config, tls_context);
        }

        Logger logger(LogOptions{.file = config.log_path, .console = true, .verbose = config.verbose});
        logger.info("main", "clawbridge ", clawbridge::version(), " starting");

        boost::asio::io_context io_context;
        ManagerOptions options{
            .session = SessionOptions{.url = config.url, .token = config.token},
            .notes_path = config.notes_path,
        };
        SessionManager manager(io_context, std::move(options), logger, nullptr,
                               websocket_transport_factory(io_context, tls_context));

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &ec, int signal)
                           {
                               if (ec)
                               {
                                   return;
                               }
                               logger.info("main", "signal ", signal, " received, shutting down");
                               manager.stop();
                               // Let the close handshake finish, then leave run().
                               signals.cancel();
                           });

        manager.start();
        io_context.run();
        logger.info("main", "stopped");
        return EXIT_SUCCESS;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
