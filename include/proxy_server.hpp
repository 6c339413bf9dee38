#pragma once
#include "errors.hpp"
#include "proxy_streams.hpp"

#include <sstream>

namespace sslproxy
{

template <typename StreamMaker, typename Handler>
struct AsyncServer
{
    net::io_context& ioc_;
    Handler& handler;
    tcp::acceptor acceptor_;
    StreamMaker streamMaker;

    AsyncServer(net::io_context& ioc, Handler& h, const tcp::endpoint& endpoint,
                StreamMaker&& streamMaker) :
        ioc_(ioc), handler(h), acceptor_(ioc),
        streamMaker(std::move(streamMaker))
    {
        handler.setIoContext(std::ref(ioc_));
        bind(endpoint);
    }
    tcp::endpoint localEndpoint() const
    {
        return acceptor_.local_endpoint();
    }
    void listen()
    {
        beast::error_code ec{};
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
        {
            throw ListenError("listen: " + ec.message());
        }
        waitForAsyncConnection();
    }
    void start()
    {
        listen();
        ioc_.run();
    }
    void waitForAsyncConnection()
    {
        auto asyncWork = [this](auto streamReader, net::yield_context yield) {
            handler.handleRead(std::move(streamReader), yield);
        };
        streamMaker.acceptAsyncConnection(ioc_, acceptor_,
                                          std::move(asyncWork));
    }

  private:
    void bind(const tcp::endpoint& endpoint)
    {
        beast::error_code ec{};
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec)
        {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec)
        {
            acceptor_.bind(endpoint, ec);
        }
        if (ec)
        {
            std::ostringstream where;
            where << endpoint;
            throw ListenError("Unable to bind " + where.str() + ": " +
                              ec.message());
        }
    }
};
} // namespace sslproxy
