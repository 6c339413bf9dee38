#pragma once
#include "certificate_provisioner.hpp"
#include "common_defs.hpp"
#include "forwarder.hpp"
#include "proxy_config.hpp"
#include "proxy_server.hpp"
#include "redirect_listener.hpp"
#include "url.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace sslproxy
{
class ServerBootstrap
{
  public:
    explicit ServerBootstrap(const ProxyConfig& config) : config(config) {}
    ServerBootstrap(const ServerBootstrap&) = delete;
    ServerBootstrap& operator=(const ServerBootstrap&) = delete;
    ~ServerBootstrap()
    {
        redirectIoc.stop();
        if (redirectThread.joinable())
        {
            redirectThread.join();
        }
    }

    // Does not return while the HTTPS listener is healthy. Every startup
    // failure is thrown to the caller.
    void run()
    {
        start();
        runThreads(ioc);
    }

    // Provisions TLS, launches the redirect listener and binds HTTPS on
    // ioContext() without running it. Throws on every failure that must
    // stop startup; redirect failures are only logged.
    void start()
    {
        auto target = ForwardTarget::parse(config.origin);
        CertificateProvisioner provisioner;
        // Outlives the HTTPS context: the ACME SNI callback points into it.
        source = provisioner.resolve(config);
        REACTOR_LOG_DEBUG("Certificate strategy: {}", strategyName(*source));
        REACTOR_LOG_INFO("Proxying calls from https://{} (SSL/TLS) to {}",
                         config.listenAddress, config.origin);

        if (config.redirectPort > 0)
        {
            startRedirect(*source);
        }
        if (config.hasDomain())
        {
            if (!config.listenAddress.ends_with(":443"))
            {
                REACTOR_LOG_WARNING(
                    "-domain is set but -from is not :443, ACME TLS challenges will not reach this server");
            }
            if (config.redirectPort == 0)
            {
                REACTOR_LOG_WARNING(
                    "-domain is set without -redirectHTTP, nothing answers ACME HTTP-01 challenges");
            }
        }

        auto endpoint = resolveListenEndpoint(ioc, config.listenAddress);
        auto context = makeServerContext(*source);
        handler.emplace(ReverseProxyForwarder::build(std::move(target)));
        server.emplace(ioc, *handler, endpoint,
                       SslStreamMaker(std::move(context)));
        server->listen();
    }

    net::io_context& ioContext()
    {
        return ioc;
    }
    tcp::endpoint localEndpoint() const
    {
        return server->localEndpoint();
    }

  private:
    void startRedirect(const TlsSource& source)
    {
        std::optional<std::filesystem::path> challengeDir;
        if (const auto* acme = std::get_if<AcmeManaged>(&source))
        {
            challengeDir = acme->manager->challengeDir();
        }
        auto port = static_cast<unsigned short>(config.redirectPort);
        redirectThread = std::thread(
            [this, port, resolver = makeTargetHostResolver(config),
             challengeDir = std::move(challengeDir)]() {
            try
            {
                RedirectListener listener(redirectIoc, port, resolver,
                                          challengeDir);
                listener.start();
                REACTOR_LOG_INFO("Redirecting http://:{} to HTTPS", port);
                redirectIoc.run();
            }
            catch (const std::exception& e)
            {
                REACTOR_LOG_ERROR("HTTP redirection server failure: {}",
                                  e.what());
            }
        });
    }

    void runThreads(net::io_context& ioc)
    {
        std::mutex failureLock;
        std::exception_ptr failure;
        auto work = [&]() {
            try
            {
                ioc.run();
            }
            catch (const std::exception& e)
            {
                REACTOR_LOG_ERROR("HTTPS server failure: {}", e.what());
                std::lock_guard<std::mutex> lock(failureLock);
                if (!failure)
                {
                    failure = std::current_exception();
                }
                ioc.stop();
            }
        };
        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < config.threads; ++i)
        {
            workers.emplace_back(work);
        }
        work();
        for (auto& worker : workers)
        {
            worker.join();
        }
        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }

    using HttpsServer = AsyncServer<SslStreamMaker, ReverseProxyForwarder>;

    const ProxyConfig& config;
    net::io_context ioc;
    std::optional<TlsSource> source;
    std::optional<ReverseProxyForwarder> handler;
    std::optional<HttpsServer> server;
    net::io_context redirectIoc;
    std::thread redirectThread;
};
} // namespace sslproxy
