#include "common/command_line_parser.hpp"
#include "proxy_config.hpp"
#include "server_bootstrap.hpp"

#include <string>

using namespace reactor;

static std::string toString(std::string_view v)
{
    return std::string{v.data(), v.length()};
}

static void setLogLevel(const std::string& level)
{
    if (level == "debug")
    {
        getLogger().setLogLevel(LogLevel::DEBUG);
    }
    else if (level == "warning")
    {
        getLogger().setLogLevel(LogLevel::WARNING);
    }
    else if (level == "error")
    {
        getLogger().setLogLevel(LogLevel::ERROR);
    }
    else
    {
        getLogger().setLogLevel(LogLevel::INFO);
    }
}

int main(int argc, const char* argv[])
{
    auto [to, from, cert, key, domain, redirectHTTP, altnames,
          conf] = getArgs(parseCommandline(argc, argv), "-to", "-from",
                          "-cert", "-key", "-domain", "-redirectHTTP",
                          "-altnames", "-c");
    try
    {
        sslproxy::ProxyOptions options{toString(to),       toString(from),
                                       toString(cert),     toString(key),
                                       toString(domain),   toString(redirectHTTP),
                                       toString(altnames), toString(conf)};
        auto config = sslproxy::makeProxyConfig(std::move(options));
        setLogLevel(config.logLevel);

        sslproxy::ServerBootstrap bootstrap(config);
        bootstrap.run();
    }
    catch (const std::exception& e)
    {
        REACTOR_LOG_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
