#pragma once
#include "common_defs.hpp"

#include <functional>
#include <memory>

namespace sslproxy
{
template <typename Stream, typename Work>
void acceptLoop(net::io_context& ioc, tcp::acceptor& acceptor, Work work,
                std::function<void(Stream&, Work&, net::yield_context)> serve)
{
    net::spawn(ioc, [&ioc, &acceptor, work = std::move(work),
                     serve = std::move(serve)](net::yield_context yield) {
        for (;;)
        {
            beast::error_code ec{};
            tcp::socket socket(ioc);
            acceptor.async_accept(socket, yield[ec]);
            if (ec == net::error::operation_aborted || !acceptor.is_open())
            {
                return;
            }
            if (ec)
            {
                REACTOR_LOG_ERROR("Accept failed: {}", ec.message());
                continue;
            }
            net::spawn(acceptor.get_executor(),
                       [serve, work, socket = std::move(socket)](
                           net::yield_context yield) mutable {
                Stream stream(std::move(socket));
                serve(stream, work, yield);
            });
        }
    });
}

struct TcpStreamMaker
{
    using Stream = beast::tcp_stream;

    template <typename Work>
    void acceptAsyncConnection(net::io_context& ioc, tcp::acceptor& acceptor,
                               Work&& work)
    {
        using WorkType = std::decay_t<Work>;
        acceptLoop<Stream, WorkType>(
            ioc, acceptor, std::forward<Work>(work),
            [](Stream& stream, WorkType& w, net::yield_context yield) {
            w(std::move(stream), yield);
        });
    }
};

struct SslStreamMaker
{
    using Stream = SslStream;
    std::shared_ptr<ssl::context> ctx;

    explicit SslStreamMaker(ssl::context&& context) :
        ctx(std::make_shared<ssl::context>(std::move(context)))
    {}

    template <typename Work>
    void acceptAsyncConnection(net::io_context& ioc, tcp::acceptor& acceptor,
                               Work&& work)
    {
        using WorkType = std::decay_t<Work>;
        acceptLoop<beast::tcp_stream, WorkType>(
            ioc, acceptor, std::forward<Work>(work),
            [ctx = ctx](beast::tcp_stream& tcpStream, WorkType& w,
                        net::yield_context yield) {
            Stream stream(std::move(tcpStream), *ctx);
            beast::error_code ec{};
            stream.async_handshake(ssl::stream_base::server, yield[ec]);
            if (ec)
            {
                REACTOR_LOG_DEBUG("TLS handshake failed: {}", ec.message());
                return;
            }
            w(std::move(stream), yield);
        });
    }
};
} // namespace sslproxy
