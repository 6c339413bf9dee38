#include "persistence.hpp"
#include "proxy_config.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>

using namespace sslproxy;
namespace fs = std::filesystem;

TEST(ProxyConfig, Defaults)
{
    auto config = makeProxyConfig(ProxyOptions{});
    EXPECT_EQ(config.origin, "http://127.0.0.1:80");
    EXPECT_EQ(config.listenAddress, "127.0.0.1:4430");
    EXPECT_EQ(config.altNames, std::vector<std::string>{"localhost"});
    EXPECT_EQ(config.redirectPort, 0);
    EXPECT_FALSE(config.hasDomain());
    EXPECT_FALSE(config.hasExplicitFiles());
    EXPECT_EQ(config.threads, 1u);
    EXPECT_EQ(fs::path(config.defaultCertPath).filename().string(), "cert.pem");
    EXPECT_EQ(fs::path(config.defaultKeyPath).filename().string(), "key.pem");
    EXPECT_EQ(fs::path(config.defaultCertPath).parent_path().filename().string(),
              ".ssl-proxy");
}

TEST(ProxyConfig, OriginWithoutSchemeGetsHttp)
{
    EXPECT_EQ(normalizeOrigin("127.0.0.1:9000"), "http://127.0.0.1:9000");
    EXPECT_EQ(normalizeOrigin("https://backend:8443"), "https://backend:8443");
    EXPECT_EQ(normalizeOrigin("http://backend"), "http://backend");

    ProxyOptions options;
    options.to = "localhost:8080";
    EXPECT_EQ(makeProxyConfig(options).origin, "http://localhost:8080");
}

TEST(ProxyConfig, BadOriginIsConfigError)
{
    ProxyOptions options;
    options.to = "ftp://host";
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
    options.to = "http://bad host";
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
    options.to = "http://host:99999";
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
}

TEST(ProxyConfig, SplitAltNames)
{
    EXPECT_EQ(splitAltNames("localhost,example.com"),
              (std::vector<std::string>{"localhost", "example.com"}));
    EXPECT_EQ(splitAltNames(" a.test , ,b.test,"),
              (std::vector<std::string>{"a.test", "b.test"}));
    EXPECT_TRUE(splitAltNames("").empty());
    EXPECT_TRUE(splitAltNames(" , ").empty());
}

TEST(ProxyConfig, EmptyAltNamesRejected)
{
    ProxyOptions options;
    options.altnames = " , ";
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
}

TEST(ProxyConfig, RedirectPort)
{
    EXPECT_EQ(parseRedirectPort(""), 0);
    EXPECT_EQ(parseRedirectPort("0"), 0);
    EXPECT_EQ(parseRedirectPort("80"), 80);
    EXPECT_EQ(parseRedirectPort("65535"), 65535);
    EXPECT_THROW(parseRedirectPort("65536"), ConfigError);
    EXPECT_THROW(parseRedirectPort("-1"), ConfigError);
    EXPECT_THROW(parseRedirectPort("http"), ConfigError);
}

TEST(ProxyConfig, CertWithoutKeyFallsBackToSelfSigned)
{
    ProxyOptions options;
    options.cert = "cert.pem";
    auto config = makeProxyConfig(options);
    EXPECT_FALSE(config.hasExplicitFiles());
    EXPECT_TRUE(config.certPath.empty());
    EXPECT_TRUE(config.keyPath.empty());

    options.cert.clear();
    options.key = "key.pem";
    config = makeProxyConfig(options);
    EXPECT_FALSE(config.hasExplicitFiles());
    EXPECT_TRUE(config.keyPath.empty());
    EXPECT_EQ(fs::path(config.defaultKeyPath).filename().string(), "key.pem");

    options.domain = "example.com";
    config = makeProxyConfig(options);
    EXPECT_TRUE(config.hasDomain());
}

TEST(ProxyConfig, ConfigFileOverlay)
{
    auto path = fs::temp_directory_path() /
                ("sslproxy-config-" + std::to_string(::getpid()) + ".json");
    writeOwnerOnly(path, R"({
        "to": "backend:9000",
        "from": "0.0.0.0:8443",
        "redirectHTTP": 8080,
        "altnames": ["localhost", "proxy.test"],
        "acmeEmail": "ops@example.com",
        "threads": 4,
        "logLevel": "debug"
    })");

    ProxyOptions options;
    options.configFile = path.string();
    options.from = "127.0.0.1:9443";
    auto config = makeProxyConfig(options);
    fs::remove(path);

    EXPECT_EQ(config.origin, "http://backend:9000");
    EXPECT_EQ(config.listenAddress, "127.0.0.1:9443");
    EXPECT_EQ(config.redirectPort, 8080);
    EXPECT_EQ(config.altNames,
              (std::vector<std::string>{"localhost", "proxy.test"}));
    EXPECT_EQ(config.acmeEmail, "ops@example.com");
    EXPECT_EQ(config.acmeClient, "certbot");
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(ProxyConfig, ConfigFileErrors)
{
    ProxyOptions options;
    options.configFile = "/nonexistent/sslproxy.json";
    EXPECT_THROW(makeProxyConfig(options), ConfigError);

    auto path = fs::temp_directory_path() /
                ("sslproxy-bad-" + std::to_string(::getpid()) + ".json");
    writeOwnerOnly(path, "{ not json");
    options.configFile = path.string();
    EXPECT_THROW(makeProxyConfig(options), ConfigError);

    writeOwnerOnly(path, R"({"redirectHTTP": [1]})");
    EXPECT_THROW(makeProxyConfig(options), ConfigError);

    writeOwnerOnly(path, R"({"threads": -1})");
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
    writeOwnerOnly(path, R"({"threads": 0})");
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
    writeOwnerOnly(path, R"({"threads": "four"})");
    EXPECT_THROW(makeProxyConfig(options), ConfigError);
    fs::remove(path);
}
