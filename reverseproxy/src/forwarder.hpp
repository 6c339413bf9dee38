#pragma once
#include "common_defs.hpp"
#include "url.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sslproxy
{
constexpr std::size_t RelayBufferSize = 32 * 1024;

// Headers that only describe one connection leg, plus anything the
// Connection header names.
template <typename Message>
void stripHopByHopHeaders(Message& msg)
{
    std::vector<std::string> named;
    for (auto token : http::token_list{msg[http::field::connection]})
    {
        named.emplace_back(token);
    }
    for (const auto& name : named)
    {
        msg.erase(name);
    }
    static constexpr std::array<http::field, 9> hopByHop = {
        http::field::connection,          http::field::proxy_connection,
        http::field::keep_alive,          http::field::proxy_authenticate,
        http::field::proxy_authorization, http::field::te,
        http::field::trailer,             http::field::transfer_encoding,
        http::field::upgrade};
    for (auto field : hopByHop)
    {
        msg.erase(field);
    }
}

template <typename Message>
void appendForwardedFor(Message& msg, const std::string& clientAddress)
{
    if (clientAddress.empty())
    {
        return;
    }
    std::string prior(msg[http::field::x_forwarded_for]);
    msg.set(http::field::x_forwarded_for,
            prior.empty() ? clientAddress : prior + ", " + clientAddress);
}

template <typename Stream>
std::string remoteAddress(Stream& stream)
{
    beast::error_code ec{};
    auto endpoint = beast::get_lowest_layer(stream).socket().remote_endpoint(ec);
    return ec ? std::string{} : endpoint.address().to_string();
}

inline void closeStream(beast::tcp_stream& stream, net::yield_context)
{
    beast::error_code ec{};
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

inline void closeStream(SslStream& stream, net::yield_context yield)
{
    beast::error_code ec{};
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));
    stream.async_shutdown(yield[ec]);
    if (ec && ec != net::ssl::error::stream_truncated)
    {
        REACTOR_LOG_DEBUG("TLS shutdown: {}", ec.message());
    }
}

// Origin connections carry one exchange; close_notify is not awaited.
inline void releaseUpstream(beast::tcp_stream& stream)
{
    beast::error_code ec{};
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
}

inline void releaseUpstream(SslStream& stream)
{
    releaseUpstream(beast::get_lowest_layer(stream));
}

/**
 * Pumps the remaining body of the message held by p from input to output.
 * The header must already have been written through sr. Only
 * RelayBufferSize bytes are held at any time.
 */
template <bool isRequest, typename Output, typename Input>
void relayBody(Output& output, Input& input, beast::flat_buffer& buffer,
               http::parser<isRequest, http::buffer_body>& p,
               http::serializer<isRequest, http::buffer_body>& sr,
               std::vector<char>& relay, beast::error_code& ec,
               net::yield_context yield)
{
    do
    {
        if (!p.is_done())
        {
            p.get().body().data = relay.data();
            p.get().body().size = relay.size();
            http::async_read(input, buffer, p, yield[ec]);
            if (ec == http::error::need_buffer)
            {
                ec = {};
            }
            if (ec)
            {
                return;
            }
            p.get().body().size = relay.size() - p.get().body().size;
            p.get().body().data = relay.data();
            p.get().body().more = !p.is_done();
        }
        else
        {
            p.get().body().data = nullptr;
            p.get().body().size = 0;
            p.get().body().more = false;
        }
        http::async_write(output, sr, yield[ec]);
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec)
        {
            return;
        }
    } while (!p.is_done() || !sr.is_done());
}

/**
 * Forwards every request of a client connection to a single origin and
 * streams the origin's answer back. Each request gets its own origin
 * connection; an unreachable origin is answered with 502 and the client
 * connection stays usable.
 */
class ReverseProxyForwarder
{
  public:
    using RequestParser = http::request_parser<http::buffer_body>;
    using ResponseParser = http::response_parser<http::buffer_body>;

    explicit ReverseProxyForwarder(ForwardTarget t) : target(std::move(t))
    {
        sslctx.set_default_verify_paths();
        sslctx.set_verify_mode(ssl::verify_peer);
    }
    static ReverseProxyForwarder build(ForwardTarget target)
    {
        return ReverseProxyForwarder(std::move(target));
    }

    void setIoContext(std::reference_wrapper<net::io_context> ioc)
    {
        this->ioc = ioc;
    }
    const ForwardTarget& forwardTarget() const
    {
        return target;
    }
    ssl::context& upstreamContext()
    {
        return sslctx;
    }

    template <typename Stream>
    void handleRead(Stream stream, net::yield_context yield)
    {
        beast::flat_buffer buffer;
        for (;;)
        {
            RequestParser parser;
            parser.body_limit(boost::none);
            beast::error_code ec{};
            http::async_read_header(stream, buffer, parser, yield[ec]);
            if (ec == http::error::end_of_stream)
            {
                break;
            }
            if (ec)
            {
                REACTOR_LOG_DEBUG("Reading request failed: {}", ec.message());
                if (ec.category() ==
                    http::make_error_code(http::error::bad_target).category())
                {
                    sendStatus(stream, http::status::bad_request, 11, false,
                               yield);
                }
                break;
            }
            if (!forward(stream, buffer, parser, yield))
            {
                break;
            }
        }
        closeStream(stream, yield);
    }

    // Returns whether the client connection can carry another request.
    template <typename Stream>
    bool forward(Stream& client, beast::flat_buffer& buffer,
                 RequestParser& parser, net::yield_context yield)
    {
        auto& req = parser.get();
        Exchange exchange{req.version(), req.keep_alive(),
                          req.method() == http::verb::head};
        if (beast::iequals(req[http::field::expect], "100-continue"))
        {
            req.erase(http::field::expect);
            http::response<http::empty_body> cont{http::status::continue_,
                                                  req.version()};
            beast::error_code ec{};
            http::async_write(client, cont, yield[ec]);
            if (ec)
            {
                return false;
            }
        }
        prepareRequest(parser, remoteAddress(client));

        beast::error_code ec{};
        if (target.secure())
        {
            SslStream upstream(ioc->get(), sslctx);
            if (!connect(upstream, yield, ec))
            {
                return checkFail(client, parser, exchange, ec, yield);
            }
            bool keepAlive = relay(client, buffer, parser, upstream, exchange,
                                   yield);
            releaseUpstream(upstream);
            return keepAlive;
        }
        beast::tcp_stream upstream(ioc->get());
        if (!connect(upstream, yield, ec))
        {
            return checkFail(client, parser, exchange, ec, yield);
        }
        bool keepAlive = relay(client, buffer, parser, upstream, exchange,
                               yield);
        releaseUpstream(upstream);
        return keepAlive;
    }

  private:
    struct Exchange
    {
        unsigned version;
        bool keepAlive;
        bool head;
    };

    void prepareRequest(RequestParser& parser,
                        const std::string& clientAddress) const
    {
        auto& req = parser.get();
        bool chunked = parser.chunked();
        stripHopByHopHeaders(req);
        std::string outTarget = target.requestTarget(req.target());
        req.target(outTarget);
        req.set(http::field::host, target.authority);
        req.version(11);
        if (chunked)
        {
            req.chunked(true);
        }
        req.keep_alive(false);
        appendForwardedFor(req, clientAddress);
    }

    bool connect(beast::tcp_stream& upstream, net::yield_context yield,
                 beast::error_code& ec)
    {
        tcp::resolver resolver(ioc->get());
        auto endpoints = resolver.async_resolve(target.host, target.port,
                                                yield[ec]);
        if (ec)
        {
            return false;
        }
        upstream.async_connect(endpoints, yield[ec]);
        return !ec;
    }
    bool connect(SslStream& upstream, net::yield_context yield,
                 beast::error_code& ec)
    {
        if (!connect(beast::get_lowest_layer(upstream), yield, ec))
        {
            return false;
        }
        if (!SSL_set_tlsext_host_name(upstream.native_handle(),
                                      target.host.c_str()))
        {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                   net::error::get_ssl_category());
            return false;
        }
        upstream.set_verify_callback(ssl::host_name_verification(target.host));
        upstream.async_handshake(ssl::stream_base::client, yield[ec]);
        return !ec;
    }

    template <typename Stream, typename Upstream>
    bool relay(Stream& client, beast::flat_buffer& buffer,
               RequestParser& parser, Upstream& upstream,
               const Exchange& exchange, net::yield_context yield)
    {
        beast::error_code ec{};
        std::vector<char> chunk(RelayBufferSize);

        http::request_serializer<http::buffer_body> reqSr{parser.get()};
        http::async_write_header(upstream, reqSr, yield[ec]);
        if (!ec)
        {
            relayBody(upstream, client, buffer, parser, reqSr, chunk, ec,
                      yield);
        }
        if (ec)
        {
            return checkFail(client, parser, exchange, ec, yield);
        }

        beast::flat_buffer upstreamBuffer;
        std::optional<ResponseParser> resParser;
        do
        {
            resParser.emplace();
            resParser->body_limit(boost::none);
            resParser->skip(exchange.head);
            http::async_read_header(upstream, upstreamBuffer, *resParser,
                                    yield[ec]);
            if (ec)
            {
                return checkFail(client, parser, exchange, ec, yield);
            }
        } while (resParser->get().result_int() / 100 == 1 &&
                 resParser->get().result() !=
                     http::status::switching_protocols);

        auto& res = resParser->get();
        bool unframed = !resParser->is_done() && !resParser->chunked() &&
                        !resParser->content_length();
        bool chunked = resParser->chunked() || unframed;
        stripHopByHopHeaders(res);
        res.version(exchange.version);
        bool keepAlive = exchange.keepAlive;
        if (chunked)
        {
            if (exchange.version >= 11)
            {
                res.chunked(true);
            }
            else
            {
                keepAlive = false;
            }
        }
        res.keep_alive(keepAlive);

        http::response_serializer<http::buffer_body> resSr{res};
        http::async_write_header(client, resSr, yield[ec]);
        if (ec)
        {
            REACTOR_LOG_DEBUG("Writing response header failed: {}",
                              ec.message());
            return false;
        }
        if (!resParser->is_done())
        {
            relayBody(client, upstream, upstreamBuffer, *resParser, resSr,
                      chunk, ec, yield);
            if (ec)
            {
                REACTOR_LOG_ERROR("Relaying response from {} failed: {}",
                                  target.url(), ec.message());
                return false;
            }
        }
        return keepAlive;
    }

    template <typename Stream>
    bool checkFail(Stream& client, RequestParser& parser,
                   const Exchange& exchange, const beast::error_code& ec,
                   net::yield_context yield)
    {
        REACTOR_LOG_ERROR("http: proxy error: {} ({})", ec.message(),
                          target.url());
        return sendStatus(client, http::status::bad_gateway, exchange.version,
                          exchange.keepAlive && parser.is_done(), yield);
    }

    template <typename Stream>
    static bool sendStatus(Stream& client, http::status status,
                           unsigned version, bool keepAlive,
                           net::yield_context yield)
    {
        http::response<http::empty_body> res{status, version};
        res.keep_alive(keepAlive);
        res.content_length(0);
        beast::error_code ec{};
        http::async_write(client, res, yield[ec]);
        return !ec && keepAlive;
    }

    ForwardTarget target;
    ssl::context sslctx{ssl::context::tls_client};
    std::optional<std::reference_wrapper<net::io_context>> ioc;
};
} // namespace sslproxy
