#pragma once
#include "common_defs.hpp"
#include "errors.hpp"
#include "key_generator.hpp"
#include "persistence.hpp"
#include "url.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/process/args.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/system.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sslproxy
{
struct AcmeOptions
{
    std::filesystem::path cacheDir{"certs"};
    bool acceptTos{true};
    std::vector<std::string> hostWhitelist;
    std::string email;
    std::string client{"certbot"};
    std::chrono::seconds renewBefore{std::chrono::hours(30 * 24)};
    std::chrono::seconds retryBackoff{std::chrono::minutes(10)};
};

/**
 * Serves certificates issued by a public ACME authority.
 *
 * Certificates are picked per handshake from the SNI server name. Issuance
 * and renewal are delegated to an external ACME client run on a worker
 * thread owned by this class; this class only keeps the host policy and an
 * on-disk cache of issued key/chain pairs (<cacheDir>/<host>).
 *
 * A handshake never waits for the client. A host without a valid
 * certificate is refused while issuance runs, and after a failed issuance
 * the client is not started again until retryBackoff has passed. A
 * certificate inside the renewBefore window keeps being served while its
 * replacement is requested. Safe to use from several io threads.
 */
class AcmeManager
{
  public:
    using Clock = std::chrono::system_clock;

    explicit AcmeManager(AcmeOptions options) : options_(std::move(options))
    {
        for (auto& host : options_.hostWhitelist)
        {
            host = toLower(host);
        }
    }
    AcmeManager(const AcmeManager&) = delete;
    AcmeManager& operator=(const AcmeManager&) = delete;
    ~AcmeManager()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        changed_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    const AcmeOptions& options() const
    {
        return options_;
    }
    std::filesystem::path webroot() const
    {
        return options_.cacheDir / "webroot";
    }
    std::filesystem::path challengeDir() const
    {
        return webroot() / ".well-known" / "acme-challenge";
    }
    std::filesystem::path cachePath(const std::string& host) const
    {
        return options_.cacheDir / host;
    }
    bool hostAllowed(std::string_view host) const
    {
        auto lower = toLower(host);
        return std::ranges::find(options_.hostWhitelist, lower) !=
               std::end(options_.hostWhitelist);
    }

    void configure(ssl::context& ctx)
    {
        SSL_CTX_set_tlsext_servername_callback(ctx.native_handle(),
                                               &AcmeManager::onServerName);
        SSL_CTX_set_tlsext_servername_arg(ctx.native_handle(), this);
    }

    // Returns the context to present for serverName, or throws
    // ProvisionError when none is usable yet. Never blocks on the client.
    std::shared_ptr<ssl::context> contextFor(const std::string& serverName)
    {
        if (!hostAllowed(serverName))
        {
            throw ProvisionError("acme: host " + serverName +
                                 " not configured in whitelist");
        }
        auto host = toLower(serverName);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = hosts_[host];
        auto now = Clock::now();
        if (!state.diskChecked)
        {
            state.diskChecked = true;
            if (auto loaded = loadCached(host))
            {
                state.certificate = std::move(*loaded);
            }
        }
        if (state.certificate && state.certificate->notAfter <= now)
        {
            REACTOR_LOG_INFO("acme: certificate for {} expired", host);
            state.certificate.reset();
        }
        if (state.certificate)
        {
            if (state.certificate->notAfter - now < options_.renewBefore)
            {
                scheduleLocked(host, state, now);
            }
            return state.certificate->ctx;
        }
        scheduleLocked(host, state, now);
        if (!state.lastError.empty())
        {
            throw ProvisionError("acme: no usable certificate for " + host +
                                 ": " + state.lastError);
        }
        throw ProvisionError("acme: certificate for " + host +
                             " is being issued");
    }

    // Waits until no issuance is queued or running for host.
    bool awaitIssuance(const std::string& host,
                       std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [this, key = toLower(host)]() {
            auto iter = hosts_.find(key);
            return iter == std::end(hosts_) || !iter->second.issuing;
        });
    }

  private:
    struct LoadedCertificate
    {
        std::shared_ptr<ssl::context> ctx;
        Clock::time_point notAfter;
    };
    struct HostState
    {
        std::optional<LoadedCertificate> certificate;
        bool diskChecked{false};
        bool issuing{false};
        Clock::time_point retryAfter{};
        std::string lastError;
    };

    static int onServerName(SSL* ssl, int* alert, void* arg)
    {
        auto* self = static_cast<AcmeManager*>(arg);
        const char* name = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
        if (name == nullptr || *name == '\0')
        {
            REACTOR_LOG_DEBUG("acme: missing server name");
            *alert = SSL_AD_UNRECOGNIZED_NAME;
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }
        try
        {
            auto ctx = self->contextFor(name);
            if (SSL_set_SSL_CTX(ssl, ctx->native_handle()) == nullptr)
            {
                *alert = SSL_AD_INTERNAL_ERROR;
                return SSL_TLSEXT_ERR_ALERT_FATAL;
            }
            return SSL_TLSEXT_ERR_OK;
        }
        catch (const std::exception& e)
        {
            REACTOR_LOG_ERROR("acme: {}", e.what());
        }
        *alert = SSL_AD_UNRECOGNIZED_NAME;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }

    void scheduleLocked(const std::string& host, HostState& state,
                        Clock::time_point now)
    {
        if (state.issuing || now < state.retryAfter)
        {
            return;
        }
        state.issuing = true;
        queue_.push_back(host);
        if (!worker_.joinable())
        {
            worker_ = std::thread([this]() { issueLoop(); });
        }
        changed_.notify_all();
    }

    void issueLoop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;)
        {
            changed_.wait(lock,
                          [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_)
            {
                return;
            }
            auto host = queue_.front();
            queue_.pop_front();
            lock.unlock();

            std::optional<LoadedCertificate> issued;
            std::string error;
            try
            {
                obtain(host);
                issued = loadCached(host);
                if (!issued)
                {
                    throw ProvisionError("acme: client output for " + host +
                                         " is not usable");
                }
                REACTOR_LOG_INFO("acme: certificate for {} installed", host);
            }
            catch (const std::exception& e)
            {
                error = e.what();
                REACTOR_LOG_ERROR("acme: {}", error);
            }

            lock.lock();
            auto& state = hosts_[host];
            state.issuing = false;
            if (issued)
            {
                state.certificate = std::move(issued);
                state.lastError.clear();
                state.retryAfter = {};
            }
            else
            {
                state.lastError = error;
                state.retryAfter = Clock::now() + options_.retryBackoff;
            }
            changed_.notify_all();
        }
    }

    std::optional<LoadedCertificate> loadCached(const std::string& host) const
    {
        auto pem = readFile(cachePath(host));
        if (pem.empty())
        {
            return std::nullopt;
        }
        try
        {
            auto leaf = loadCert(pem);
            int days = 0;
            int seconds = 0;
            if (ASN1_TIME_diff(&days, &seconds, nullptr,
                               X509_get0_notAfter(leaf.get())) != 1)
            {
                throw ProvisionError(opensslError("Unreadable notAfter"));
            }
            LoadedCertificate loaded;
            loaded.notAfter = Clock::now() + std::chrono::hours(24) * days +
                              std::chrono::seconds(seconds);
            if (loaded.notAfter <= Clock::now())
            {
                REACTOR_LOG_INFO("acme: cached certificate for {} expired", host);
                return std::nullopt;
            }
            loaded.ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
            loaded.ctx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 |
                ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                ssl::context::no_tlsv1_1);
            loaded.ctx->use_certificate_chain(net::buffer(pem));
            loaded.ctx->use_private_key(net::buffer(pem), ssl::context::pem);
            return loaded;
        }
        catch (const std::exception& e)
        {
            REACTOR_LOG_ERROR("acme: ignoring cache entry for {}: {}", host,
                              e.what());
        }
        return std::nullopt;
    }

    boost::filesystem::path clientExecutable() const
    {
        namespace bp = boost::process;
        if (options_.client.find('/') != std::string::npos)
        {
            return boost::filesystem::path(options_.client);
        }
        return bp::search_path(options_.client);
    }

    // Runs on the issuance worker only.
    void obtain(const std::string& host) const
    {
        namespace bp = boost::process;
        auto exe = clientExecutable();
        if (exe.empty() || !boost::filesystem::exists(exe))
        {
            throw ProvisionError("acme: client " + options_.client +
                                 " not found");
        }
        auto clientDir = options_.cacheDir / "client";
        makePrivateDirectory(challengeDir());
        makePrivateDirectory(clientDir);

        std::vector<std::string> args{"certonly",
                                      "--non-interactive",
                                      "--webroot",
                                      "-w",
                                      webroot().string(),
                                      "-d",
                                      host,
                                      "--cert-name",
                                      host,
                                      "--config-dir",
                                      (clientDir / "config").string(),
                                      "--work-dir",
                                      (clientDir / "work").string(),
                                      "--logs-dir",
                                      (clientDir / "logs").string()};
        if (options_.acceptTos)
        {
            args.emplace_back("--agree-tos");
        }
        if (options_.email.empty())
        {
            args.emplace_back("--register-unsafely-without-email");
        }
        else
        {
            args.emplace_back("--email");
            args.emplace_back(options_.email);
        }
        REACTOR_LOG_INFO("acme: requesting certificate for {} via {}", host,
                         exe.string());
        int rc = bp::system(exe, bp::args(args));
        if (rc != 0)
        {
            throw ProvisionError("acme: client exited with status " +
                                 std::to_string(rc) + " for " + host);
        }
        auto live = clientDir / "config" / "live" / host;
        auto chain = readFile(live / "fullchain.pem");
        auto key = readFile(live / "privkey.pem");
        if (chain.empty() || key.empty())
        {
            throw ProvisionError("acme: client produced no certificate in " +
                                 live.string());
        }
        writeOwnerOnly(cachePath(host), key + chain);
    }

    AcmeOptions options_;
    std::mutex mutex_;
    std::condition_variable changed_;
    std::map<std::string, HostState> hosts_;
    std::deque<std::string> queue_;
    bool stopping_{false};
    std::thread worker_;
};
} // namespace sslproxy
