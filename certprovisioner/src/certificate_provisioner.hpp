#pragma once
#include "acme_manager.hpp"
#include "common_defs.hpp"
#include "errors.hpp"
#include "key_generator.hpp"
#include "persistence.hpp"
#include "proxy_config.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace sslproxy
{
struct ExplicitFiles
{
    std::string certPath;
    std::string keyPath;
};
struct SelfSigned
{
    std::string certPath;
    std::string keyPath;
    bool generated{false};
};
struct AcmeManaged
{
    std::shared_ptr<AcmeManager> manager;
};
using TlsSource = std::variant<ExplicitFiles, SelfSigned, AcmeManaged>;

template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline const char* strategyName(const TlsSource& source)
{
    return std::visit(
        Overloaded{[](const ExplicitFiles&) { return "explicit files"; },
                   [](const SelfSigned&) { return "self-signed"; },
                   [](const AcmeManaged&) { return "acme"; }},
        source);
}

inline void persistCertificateMaterial(const CertificateMaterial& material,
                                       const std::filesystem::path& certPath,
                                       const std::filesystem::path& keyPath)
{
    writeOwnerOnly(certPath, material.certificate);
    writeOwnerOnly(keyPath, material.privateKey);
}

struct CertificateProvisioner
{
    KeyGenerator generator;
    std::chrono::seconds validity{std::chrono::hours(365 * 24)};

    TlsSource resolve(const ProxyConfig& config) const
    {
        if (config.hasDomain())
        {
            AcmeOptions options;
            options.cacheDir = config.acmeCacheDir;
            options.acceptTos = true;
            options.hostWhitelist = {config.domain};
            options.email = config.acmeEmail;
            options.client = config.acmeClient;
            return AcmeManaged{std::make_shared<AcmeManager>(std::move(options))};
        }
        if (config.hasExplicitFiles())
        {
            for (const auto& path : {config.certPath, config.keyPath})
            {
                if (!std::filesystem::exists(path))
                {
                    throw ProvisionError("No such certificate file: " + path);
                }
            }
            return ExplicitFiles{config.certPath, config.keyPath};
        }
        return selfSigned(config);
    }

  private:
    SelfSigned selfSigned(const ProxyConfig& config) const
    {
        SelfSigned source{config.defaultCertPath, config.defaultKeyPath};
        if (std::filesystem::exists(source.certPath) &&
            std::filesystem::exists(source.keyPath))
        {
            REACTOR_LOG_INFO("Found default cert/key files: using...");
            return source;
        }
        REACTOR_LOG_INFO(
            "No existing cert or key specified, generating some self-signed certs for use ({}, {})",
            source.certPath, source.keyPath);
        auto material = generator.generate(validity, config.altNames);
        persistCertificateMaterial(material, source.certPath, source.keyPath);
        REACTOR_LOG_INFO("SHA256 Fingerprint: {}",
                         formatFingerprint(material.fingerprint));
        source.generated = true;
        return source;
    }
};

inline void loadCertificateFiles(ssl::context& ctx, const std::string& certPath,
                                 const std::string& keyPath)
{
    boost::system::error_code ec;
    ctx.use_certificate_chain_file(certPath, ec);
    if (ec)
    {
        throw ProvisionError("Unable to load certificate " + certPath + ": " +
                             ec.message());
    }
    ctx.use_private_key_file(keyPath, ssl::context::pem, ec);
    if (ec)
    {
        throw ProvisionError("Unable to load private key " + keyPath + ": " +
                             ec.message());
    }
}

inline ssl::context makeServerContext(const TlsSource& source)
{
    ssl::context ctx{ssl::context::tls_server};
    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                    ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                    ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
    std::visit(Overloaded{[&ctx](const ExplicitFiles& files) {
        loadCertificateFiles(ctx, files.certPath, files.keyPath);
    },
                          [&ctx](const SelfSigned& files) {
        loadCertificateFiles(ctx, files.certPath, files.keyPath);
    },
                          [&ctx](const AcmeManaged& acme) {
        acme.manager->configure(ctx);
    }},
               source);
    return ctx;
}
} // namespace sslproxy
