#pragma once
#include "common_defs.hpp"
#include "persistence.hpp"
#include "proxy_config.hpp"
#include "proxy_server.hpp"
#include "url.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace sslproxy
{
using RedirectRequest = http::request<http::string_body>;
using TargetHostResolver = std::function<std::string(const RedirectRequest&)>;

constexpr std::string_view AcmeChallengePrefix = "/.well-known/acme-challenge/";

// A configured domain always wins; otherwise the request's own Host (port
// stripped), falling back to the listen address when Host is unusable.
inline TargetHostResolver makeTargetHostResolver(const ProxyConfig& config)
{
    return [domain = config.domain, fallback = config.listenAddress](
               const RedirectRequest& req) -> std::string {
        if (!domain.empty())
        {
            return domain;
        }
        auto host = urlHostOf(req[http::field::host]);
        return host ? *host : fallback;
    };
}

struct RedirectHandler
{
    TargetHostResolver resolver;
    std::optional<std::filesystem::path> challengeDir;

    void setIoContext(std::reference_wrapper<net::io_context>) {}

    std::string location(const RedirectRequest& req) const
    {
        return HTTPSPrefix + resolver(req) + std::string(req.target());
    }

    http::response<http::string_body> handle(const RedirectRequest& req) const
    {
        if (challengeDir && req.method() == http::verb::get &&
            req.target().starts_with(AcmeChallengePrefix))
        {
            return challenge(req);
        }
        http::response<http::string_body> res{
            http::status::temporary_redirect, req.version()};
        auto url = location(req);
        res.set(http::field::location, url);
        if (req.method() == http::verb::get || req.method() == http::verb::head)
        {
            res.set(http::field::content_type, "text/html; charset=utf-8");
            res.body() = "<a href=\"" + url + "\">Temporary Redirect</a>.\n\n";
        }
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }

    template <typename Stream>
    void handleRead(Stream stream, net::yield_context yield)
    {
        beast::flat_buffer buffer;
        for (;;)
        {
            RedirectRequest req;
            beast::error_code ec{};
            http::async_read(stream, buffer, req, yield[ec]);
            if (ec)
            {
                if (ec != http::error::end_of_stream)
                {
                    REACTOR_LOG_DEBUG("Redirect read failed: {}", ec.message());
                }
                break;
            }
            auto res = handle(req);
            bool keepAlive = res.keep_alive();
            if (req.method() == http::verb::head)
            {
                http::response_serializer<http::string_body> sr{res};
                http::async_write_header(stream, sr, yield[ec]);
            }
            else
            {
                http::async_write(stream, res, yield[ec]);
            }
            if (ec || !keepAlive)
            {
                break;
            }
        }
        beast::error_code ec{};
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

  private:
    http::response<http::string_body> challenge(const RedirectRequest& req) const
    {
        auto token = req.target().substr(AcmeChallengePrefix.size());
        http::response<http::string_body> res{http::status::not_found,
                                              req.version()};
        if (!token.empty() && token.find('/') == std::string_view::npos &&
            token.find("..") == std::string_view::npos)
        {
            auto body = readFile(*challengeDir / std::string(token));
            if (!body.empty())
            {
                res.result(http::status::ok);
                res.set(http::field::content_type, "text/plain");
                res.body() = std::move(body);
            }
        }
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }
};

/**
 * Plaintext listener that sends every request to its https:// equivalent.
 * Construction binds the port and throws ListenError on failure.
 */
class RedirectListener
{
  public:
    RedirectListener(net::io_context& ioc, unsigned short port,
                     TargetHostResolver resolver,
                     std::optional<std::filesystem::path> challengeDir =
                         std::nullopt) :
        handler{std::move(resolver), std::move(challengeDir)},
        server(ioc, handler, tcp::endpoint(tcp::v4(), port), TcpStreamMaker{})
    {}
    RedirectListener(const RedirectListener&) = delete;
    RedirectListener& operator=(const RedirectListener&) = delete;

    tcp::endpoint localEndpoint() const
    {
        return server.localEndpoint();
    }
    void start()
    {
        server.listen();
    }

  private:
    RedirectHandler handler;
    AsyncServer<TcpStreamMaker, RedirectHandler> server;
};
} // namespace sslproxy
