#include "clawbridge/client/health_probe.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>

#include <memory>
#include <type_traits>
#include <utility>

#include "clawbridge/endpoint.hpp"
#include "clawbridge/error_codes.hpp"
#include "clawbridge/version.hpp"

namespace clawbridge::client
{

    namespace
    {

        namespace beast = boost::beast;
        namespace http = beast::http;
        namespace net = boost::asio;
        namespace ssl = net::ssl;
        using tcp = net::ip::tcp;

        template <bool Secure>
        class HealthRequest : public std::enable_shared_from_this<HealthRequest<Secure>>
        {
            using Stream = std::conditional_t<Secure, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

        public:
            HealthRequest(net::io_context &io_context, ssl::context &tls_context, BaseAddress base,
                          std::chrono::seconds timeout, ProbeResult &result)
                : resolver_(io_context),
                  stream_(make_stream(io_context, tls_context)),
                  base_(std::move(base)),
                  timeout_(timeout),
                  result_(result) {}

            void run()
            {
                request_.version(11);
                request_.method(http::verb::get);
                request_.target(base_.path_prefix + "/health");
                request_.set(http::field::host, base_.authority);
                request_.set(http::field::user_agent, std::string("clawbridge/") + std::string(version()));

                auto self = this->shared_from_this();
                resolver_.async_resolve(base_.host, base_.port,
                                        [self](const beast::error_code &ec, tcp::resolver::results_type results)
                                        {
                                            if (ec)
                                            {
                                                self->fail("resolve", ec);
                                                return;
                                            }
                                            self->connect(results);
                                        });
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

            void connect(const tcp::resolver::results_type &results)
            {
                beast::get_lowest_layer(stream_).expires_after(timeout_);
                auto self = this->shared_from_this();
                beast::get_lowest_layer(stream_).async_connect(
                    results, [self](const beast::error_code &ec, const tcp::endpoint &)
                    {
                        if (ec)
                        {
                            self->fail("connect", ec);
                            return;
                        }
                        self->handshake();
                    });
            }

            void handshake()
            {
                if constexpr (Secure)
                {
                    if (!SSL_set_tlsext_host_name(stream_.native_handle(), base_.host.c_str()))
                    {
                        fail("tls", beast::error_code(static_cast<int>(::ERR_get_error()),
                                                      net::error::get_ssl_category()));
                        return;
                    }
                    stream_.set_verify_callback(ssl::host_name_verification(base_.host));
                    auto self = this->shared_from_this();
                    stream_.async_handshake(ssl::stream_base::client, [self](const beast::error_code &ec)
                                            {
                                                if (ec)
                                                {
                                                    self->fail("tls handshake", ec);
                                                    return;
                                                }
                                                self->write(); });
                }
                else
                {
                    write();
                }
            }

            void write()
            {
                auto self = this->shared_from_this();
                http::async_write(stream_, request_, [self](const beast::error_code &ec, std::size_t)
                                  {
                                      if (ec)
                                      {
                                          self->fail("write", ec);
                                          return;
                                      }
                                      self->read(); });
            }

            void read()
            {
                auto self = this->shared_from_this();
                http::async_read(stream_, buffer_, response_, [self](const beast::error_code &ec, std::size_t)
                                 {
                                     if (ec)
                                     {
                                         self->fail("read", ec);
                                         return;
                                     }
                                     self->result_.status = self->response_.result_int();
                                     self->result_.ok = self->result_.status >= 200 && self->result_.status < 300;
                                     self->result_.detail = self->response_.body();
                                     beast::error_code ignored;
                                     beast::get_lowest_layer(self->stream_).socket().shutdown(tcp::socket::shutdown_both,
                                                                                              ignored); });
            }

            void fail(const std::string &stage, const beast::error_code &ec)
            {
                result_.ok = false;
                result_.detail = stage + ": " + ec.message();
            }

            tcp::resolver resolver_;
            Stream stream_;
            BaseAddress base_;
            std::chrono::seconds timeout_;
            ProbeResult &result_;
            beast::flat_buffer buffer_;
            http::request<http::empty_body> request_;
            http::response<http::string_body> response_;
        };

    } // namespace

    ProbeResult probe_health(std::string_view base_url, boost::asio::ssl::context &tls_context,
                             std::chrono::seconds timeout)
    {
        ProbeResult result;
        BaseAddress base;
        try
        {
            base = parse_base_address(base_url);
        }
        catch (const BridgeError &ex)
        {
            result.detail = ex.what();
            return result;
        }

        net::io_context io_context;
        if (base.secure)
        {
            std::make_shared<HealthRequest<true>>(io_context, tls_context, base, timeout, result)->run();
        }
        else
        {
            std::make_shared<HealthRequest<false>>(io_context, tls_context, base, timeout, result)->run();
        }
        io_context.run();
        return result;
    }

} // namespace clawbridge::client
