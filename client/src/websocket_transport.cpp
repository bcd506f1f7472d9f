#include "clawbridge/client/websocket_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include <chrono>
#include <deque>
#include <string>
#include <type_traits>
#include <utility>

#include "clawbridge/version.hpp"

namespace clawbridge::client
{

    namespace
    {

        namespace beast = boost::beast;
        namespace http = beast::http;
        namespace websocket = beast::websocket;
        namespace net = boost::asio;
        namespace ssl = net::ssl;
        using tcp = net::ip::tcp;

        constexpr auto kConnectTimeout = std::chrono::seconds(30);
        constexpr auto kIdleTimeout = std::chrono::seconds(60);

        template <bool Secure>
        class WebSocketTransport final : public Transport,
                                         public std::enable_shared_from_this<WebSocketTransport<Secure>>
        {
            using Layer = std::conditional_t<Secure, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
            using Stream = websocket::stream<Layer>;

        public:
            WebSocketTransport(net::io_context &io_context, ssl::context &tls_context, Handlers handlers)
                : resolver_(io_context),
                  ws_(make_stream(io_context, tls_context)),
                  handlers_(std::move(handlers)) {}

            void open(const Endpoint &endpoint) override
            {
                endpoint_ = endpoint;
                auto self = this->shared_from_this();
                resolver_.async_resolve(endpoint_.host, endpoint_.port,
                                        [self](const beast::error_code &ec, tcp::resolver::results_type results)
                                        { self->on_resolve(ec, std::move(results)); });
            }

            void send(std::string text) override
            {
                if (!open_ || closing_ || finished_)
                {
                    return;
                }
                outbox_.push_back(std::move(text));
                if (!writing_)
                {
                    write_next();
                }
            }

            void close() override
            {
                if (finished_ || closing_)
                {
                    return;
                }
                closing_ = true;
                if (open_)
                {
                    auto self = this->shared_from_this();
                    ws_.async_close(websocket::close_code::normal,
                                    [self](const beast::error_code &ec)
                                    {
                                        if (ec)
                                        {
                                            self->fail("close", ec);
                                            return;
                                        }
                                        self->finish(CloseInfo{
                                            .code = static_cast<std::uint16_t>(websocket::close_code::normal),
                                            .reason = "closed by client"});
                                    });
                    return;
                }
                // Still resolving, connecting or handshaking: abort the pending operation.
                resolver_.cancel();
                beast::error_code ignored;
                beast::get_lowest_layer(ws_).socket().close(ignored);
            }

            void detach() noexcept override
            {
                handlers_ = Handlers{};
            }

        private:
            static Stream make_stream(net::io_context &io_context, ssl::context &tls_context)
            {
                if constexpr (Secure)
                {
                    return Stream(io_context, tls_context);
                }
                else
                {
                    (void)tls_context;
                    return Stream(io_context);
                }
            }

            void on_resolve(const beast::error_code &ec, tcp::resolver::results_type results)
            {
                if (ec)
                {
                    fail("resolve", ec);
                    return;
                }
                if (closing_)
                {
                    finish(CloseInfo{.code = static_cast<std::uint16_t>(websocket::close_code::normal),
                                     .reason = "closed before connect"});
                    return;
                }
                beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
                auto self = this->shared_from_this();
                beast::get_lowest_layer(ws_).async_connect(
                    results, [self](const beast::error_code &connect_ec, const tcp::endpoint &)
                    { self->on_connect(connect_ec); });
            }

            void on_connect(const beast::error_code &ec)
            {
                if (ec)
                {
                    fail("connect", ec);
                    return;
                }
                if constexpr (Secure)
                {
                    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str()))
                    {
                        fail("tls", beast::error_code(static_cast<int>(::ERR_get_error()),
                                                      net::error::get_ssl_category()));
                        return;
                    }
                    ws_.next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
                    auto self = this->shared_from_this();
                    ws_.next_layer().async_handshake(ssl::stream_base::client,
                                                     [self](const beast::error_code &tls_ec)
                                                     {
                                                         if (tls_ec)
                                                         {
                                                             self->fail("tls handshake", tls_ec);
                                                             return;
                                                         }
                                                         self->start_upgrade();
                                                     });
                }
                else
                {
                    start_upgrade();
                }
            }

            void start_upgrade()
            {
                beast::get_lowest_layer(ws_).expires_never();

                auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
                timeouts.idle_timeout = kIdleTimeout;
                timeouts.keep_alive_pings = true;
                ws_.set_option(timeouts);
                ws_.set_option(websocket::stream_base::decorator(
                    [](websocket::request_type &request)
                    {
                        request.set(http::field::user_agent, std::string("clawbridge/") + std::string(version()));
                    }));

                auto self = this->shared_from_this();
                ws_.async_handshake(upgrade_response_, endpoint_.authority, endpoint_.target,
                                    [self](const beast::error_code &ec)
                                    { self->on_upgrade(ec); });
            }

            void on_upgrade(const beast::error_code &ec)
            {
                if (ec)
                {
                    const auto status = upgrade_response_.result();
                    if (ec == websocket::error::upgrade_declined &&
                        (status == http::status::unauthorized || status == http::status::forbidden))
                    {
                        report_error("upgrade rejected with HTTP " + std::to_string(upgrade_response_.result_int()));
                        finish(CloseInfo{.code = kCloseAbnormal,
                                         .reason = std::string(upgrade_response_.reason()),
                                         .authentication_rejected = true});
                        return;
                    }
                    fail("upgrade", ec);
                    return;
                }
                if (closing_)
                {
                    open_ = true;
                    closing_ = false;
                    close();
                    return;
                }
                open_ = true;
                ws_.text(true);
                if (auto on_open = handlers_.on_open)
                {
                    on_open();
                }
                read_next();
            }

            void read_next()
            {
                if (finished_)
                {
                    return;
                }
                auto self = this->shared_from_this();
                ws_.async_read(buffer_, [self](const beast::error_code &ec, std::size_t)
                               { self->on_read(ec); });
            }

            void on_read(const beast::error_code &ec)
            {
                if (ec == websocket::error::closed)
                {
                    const auto &reason = ws_.reason();
                    finish(CloseInfo{.code = static_cast<std::uint16_t>(reason.code),
                                     .reason = std::string(reason.reason.c_str())});
                    return;
                }
                if (ec)
                {
                    fail("read", ec);
                    return;
                }
                auto text = beast::buffers_to_string(buffer_.data());
                buffer_.consume(buffer_.size());
                if (auto on_message = handlers_.on_message)
                {
                    on_message(std::move(text));
                }
                read_next();
            }

            void write_next()
            {
                writing_ = true;
                auto self = this->shared_from_this();
                ws_.async_write(net::buffer(outbox_.front()),
                                [self](const beast::error_code &ec, std::size_t)
                                { self->on_write(ec); });
            }

            void on_write(const beast::error_code &ec)
            {
                if (ec)
                {
                    writing_ = false;
                    outbox_.clear();
                    fail("write", ec);
                    return;
                }
                outbox_.pop_front();
                if (outbox_.empty() || finished_)
                {
                    writing_ = false;
                    return;
                }
                write_next();
            }

            void fail(const std::string &stage, const beast::error_code &ec)
            {
                if (finished_)
                {
                    return;
                }
                if (closing_ && ec == net::error::operation_aborted)
                {
                    finish(CloseInfo{.code = static_cast<std::uint16_t>(websocket::close_code::normal),
                                     .reason = "closed by client"});
                    return;
                }
                report_error(stage + ": " + ec.message());
                beast::error_code ignored;
                beast::get_lowest_layer(ws_).socket().close(ignored);
                finish(CloseInfo{.code = kCloseAbnormal, .reason = ec.message()});
            }

            void report_error(const std::string &message)
            {
                if (auto on_error = handlers_.on_error)
                {
                    on_error(message);
                }
            }

            void finish(const CloseInfo &info)
            {
                if (finished_)
                {
                    return;
                }
                finished_ = true;
                open_ = false;
                if (auto on_close = handlers_.on_close)
                {
                    on_close(info);
                }
            }

            tcp::resolver resolver_;
            Stream ws_;
            Handlers handlers_;
            Endpoint endpoint_{};
            beast::flat_buffer buffer_;
            websocket::response_type upgrade_response_;
            std::deque<std::string> outbox_;
            bool writing_{false};
            bool open_{false};
            bool closing_{false};
            bool finished_{false};
        };

    } // namespace

    boost::asio::ssl::context make_client_tls_context()
    {
        ssl::context context{ssl::context::tls_client};
        context.set_default_verify_paths();
        context.set_verify_mode(ssl::verify_peer);
        return context;
    }

    std::shared_ptr<Transport> make_websocket_transport(boost::asio::io_context &io_context,
                                                        boost::asio::ssl::context &tls_context,
                                                        const Endpoint &endpoint, Transport::Handlers handlers)
    {
        if (endpoint.secure)
        {
            return std::make_shared<WebSocketTransport<true>>(io_context, tls_context, std::move(handlers));
        }
        return std::make_shared<WebSocketTransport<false>>(io_context, tls_context, std::move(handlers));
    }

    TransportFactory websocket_transport_factory(boost::asio::io_context &io_context,
                                                 boost::asio::ssl::context &tls_context)
    {
        return [&io_context, &tls_context](const Endpoint &endpoint, Transport::Handlers handlers)
        {
            return make_websocket_transport(io_context, tls_context, endpoint, std::move(handlers));
        };
    }

} // namespace clawbridge::client
