#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "clawbridge/client/transport.hpp"

namespace clawbridge::client
{

    // Client TLS context verifying peers against the system trust store.
    boost::asio::ssl::context make_client_tls_context();

    // Boost.Beast WebSocket transport; picks TLS when the endpoint is wss.
    std::shared_ptr<Transport> make_websocket_transport(boost::asio::io_context &io_context,
                                                        boost::asio::ssl::context &tls_context,
                                                        const Endpoint &endpoint, Transport::Handlers handlers);

    TransportFactory websocket_transport_factory(boost::asio::io_context &io_context,
                                                 boost::asio::ssl::context &tls_context);

} // namespace clawbridge::client
