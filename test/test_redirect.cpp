#include "redirect_listener.hpp"
#include "test_origin.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace sslproxy;
using sslproxy::test::RunningContext;
namespace fs = std::filesystem;

namespace
{
RedirectRequest requestFor(std::string_view host, std::string_view target,
                           http::verb method = http::verb::get)
{
    RedirectRequest req{method, target, 11};
    if (!host.empty())
    {
        req.set(http::field::host, host);
    }
    return req;
}

RedirectHandler handlerFor(const ProxyConfig& config)
{
    return RedirectHandler{makeTargetHostResolver(config), std::nullopt};
}
} // namespace

TEST(RedirectPolicy, UsesRequestHost)
{
    ProxyConfig config;
    auto handler = handlerFor(config);
    auto res = handler.handle(requestFor("foo.com", "/bar"));
    EXPECT_EQ(res.result(), http::status::temporary_redirect);
    EXPECT_EQ(res[http::field::location], "https://foo.com/bar");
    EXPECT_EQ(res.body(),
              "<a href=\"https://foo.com/bar\">Temporary Redirect</a>.\n\n");
}

TEST(RedirectPolicy, DomainWins)
{
    ProxyConfig config;
    config.domain = "example.com";
    auto handler = handlerFor(config);
    auto res = handler.handle(requestFor("foo.com", "/bar"));
    EXPECT_EQ(res[http::field::location], "https://example.com/bar");
}

TEST(RedirectPolicy, HostPortIsDropped)
{
    ProxyConfig config;
    auto handler = handlerFor(config);
    EXPECT_EQ(handler.location(requestFor("foo.com:8080", "/a?b=c")),
              "https://foo.com/a?b=c");
    EXPECT_EQ(handler.location(requestFor("[::1]:8080", "/")),
              "https://[::1]/");
}

TEST(RedirectPolicy, MissingHostFallsBackToListenAddress)
{
    ProxyConfig config;
    config.listenAddress = "127.0.0.1:4430";
    auto handler = handlerFor(config);
    EXPECT_EQ(handler.location(requestFor("", "/bar")),
              "https://127.0.0.1:4430/bar");
    EXPECT_EQ(handler.location(requestFor("not a host", "/bar")),
              "https://127.0.0.1:4430/bar");
}

TEST(RedirectPolicy, NonGetHasNoBody)
{
    ProxyConfig config;
    auto handler = handlerFor(config);
    auto res = handler.handle(requestFor("foo.com", "/form", http::verb::post));
    EXPECT_EQ(res.result(), http::status::temporary_redirect);
    EXPECT_EQ(res[http::field::location], "https://foo.com/form");
    EXPECT_TRUE(res.body().empty());
}

class RedirectListenerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        challengeDir = fs::temp_directory_path() /
                       ("sslproxy-challenge-" + std::to_string(::getpid()));
        fs::create_directories(challengeDir);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(challengeDir, ec);
    }
    http::response<http::string_body> fetch(unsigned short port,
                                            RedirectRequest req)
    {
        net::io_context clientIoc;
        beast::tcp_stream stream(clientIoc);
        stream.connect(
            tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        http::write(stream, req);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);
        return res;
    }

    net::io_context ioc;
    fs::path challengeDir;
};

TEST_F(RedirectListenerTest, AnswersWithTemporaryRedirect)
{
    ProxyConfig config;
    RedirectListener listener(ioc, 0, makeTargetHostResolver(config));
    listener.start();
    RunningContext running(ioc);
    auto port = listener.localEndpoint().port();

    auto res = fetch(port, requestFor("foo.com", "/bar"));
    EXPECT_EQ(res.result(), http::status::temporary_redirect);
    EXPECT_EQ(res[http::field::location], "https://foo.com/bar");
}

TEST_F(RedirectListenerTest, ServesChallengeFiles)
{
    {
        std::ofstream token(challengeDir / "tok3n");
        token << "tok3n.thumbprint";
    }
    ProxyConfig config;
    config.domain = "example.com";
    RedirectListener listener(ioc, 0, makeTargetHostResolver(config),
                              challengeDir);
    listener.start();
    RunningContext running(ioc);
    auto port = listener.localEndpoint().port();

    auto res = fetch(port, requestFor("example.com",
                                      "/.well-known/acme-challenge/tok3n"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "tok3n.thumbprint");

    res = fetch(port,
                requestFor("example.com", "/.well-known/acme-challenge/none"));
    EXPECT_EQ(res.result(), http::status::not_found);

    res = fetch(port, requestFor("example.com",
                                 "/.well-known/acme-challenge/../tok3n"));
    EXPECT_EQ(res.result(), http::status::not_found);

    res = fetch(port, requestFor("example.com", "/index.html"));
    EXPECT_EQ(res.result(), http::status::temporary_redirect);
    EXPECT_EQ(res[http::field::location], "https://example.com/index.html");
}

TEST_F(RedirectListenerTest, BusyPortIsListenError)
{
    tcp::acceptor busy(ioc, tcp::endpoint(tcp::v4(), 0));
    auto port = busy.local_endpoint().port();
    ProxyConfig config;
    EXPECT_THROW(RedirectListener(ioc, port, makeTargetHostResolver(config)),
                 ListenError);
}
