#pragma once
#include "errors.hpp"
#include "logger/logger.hpp"
#include "url.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace sslproxy
{
constexpr const char* HTTPPrefix = "http://";
constexpr const char* HTTPSPrefix = "https://";

// Raw flag text as handed over by the command line parser. Empty means unset.
struct ProxyOptions
{
    std::string to;
    std::string from;
    std::string cert;
    std::string key;
    std::string domain;
    std::string redirectHTTP;
    std::string altnames;
    std::string configFile;
};

struct ProxyConfig
{
    std::string origin{"http://127.0.0.1:80"};
    std::string listenAddress{"127.0.0.1:4430"};
    std::string certPath;
    std::string keyPath;
    std::string domain;
    int redirectPort{0};
    std::vector<std::string> altNames{"localhost"};
    std::string defaultCertPath;
    std::string defaultKeyPath;
    std::string acmeCacheDir{"certs"};
    std::string acmeEmail;
    std::string acmeClient{"certbot"};
    std::size_t threads{1};
    std::string logLevel{"info"};

    bool hasDomain() const
    {
        return !domain.empty();
    }
    bool hasExplicitFiles() const
    {
        return !certPath.empty() && !keyPath.empty();
    }
};

inline std::vector<std::string> splitAltNames(std::string_view names)
{
    std::vector<std::string> result;
    while (!names.empty())
    {
        auto comma = names.find(',');
        auto item = names.substr(0, comma);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front())))
        {
            item.remove_prefix(1);
        }
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))
        {
            item.remove_suffix(1);
        }
        if (!item.empty())
        {
            result.emplace_back(item);
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        names.remove_prefix(comma + 1);
    }
    return result;
}

inline std::string normalizeOrigin(std::string to)
{
    if (!to.starts_with(HTTPPrefix) && !to.starts_with(HTTPSPrefix))
    {
        to = HTTPPrefix + to;
        REACTOR_LOG_INFO("Assuming -to URL is using http://");
    }
    return to;
}

inline int parseRedirectPort(std::string_view text)
{
    if (text.empty() || text == "0")
    {
        return 0;
    }
    if (!isPort(text))
    {
        throw ConfigError("Invalid -redirectHTTP port: " + std::string(text));
    }
    return std::stoi(std::string(text));
}

inline std::filesystem::path defaultStateDir()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
    {
        return std::filesystem::current_path() / ".ssl-proxy";
    }
    return std::filesystem::path(home) / ".ssl-proxy";
}

inline nlohmann::json loadConfigFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw ConfigError("Invalid config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    try
    {
        return nlohmann::json::parse(content);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

inline void applyConfigFile(const nlohmann::json& j, ProxyOptions& options,
                            ProxyConfig& config)
{
    auto setIfEmpty = [&j](const char* key, std::string& value) {
        if (value.empty() && j.contains(key))
        {
            value = j[key].get<std::string>();
        }
    };
    try
    {
        setIfEmpty("to", options.to);
        setIfEmpty("from", options.from);
        setIfEmpty("cert", options.cert);
        setIfEmpty("key", options.key);
        setIfEmpty("domain", options.domain);
        if (options.redirectHTTP.empty() && j.contains("redirectHTTP"))
        {
            const auto& v = j["redirectHTTP"];
            options.redirectHTTP = v.is_number() ? std::to_string(v.get<int>())
                                                 : v.get<std::string>();
        }
        if (options.altnames.empty() && j.contains("altnames"))
        {
            const auto& v = j["altnames"];
            if (v.is_array())
            {
                for (const auto& name : v)
                {
                    options.altnames += (options.altnames.empty() ? "" : ",") +
                                        name.get<std::string>();
                }
            }
            else
            {
                options.altnames = v.get<std::string>();
            }
        }
        config.acmeCacheDir = j.value("acmeCacheDir", config.acmeCacheDir);
        config.acmeEmail = j.value("acmeEmail", config.acmeEmail);
        config.acmeClient = j.value("acmeClient", config.acmeClient);
        if (j.contains("threads"))
        {
            auto threads = j["threads"].get<int>();
            if (threads <= 0)
            {
                throw ConfigError("Invalid config value: threads must be positive");
            }
            config.threads = static_cast<std::size_t>(threads);
        }
        config.logLevel = j.value("logLevel", config.logLevel);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
}

inline ProxyConfig makeProxyConfig(ProxyOptions options)
{
    ProxyConfig config;
    if (!options.configFile.empty())
    {
        applyConfigFile(loadConfigFile(options.configFile), options, config);
    }
    if (!options.to.empty())
    {
        config.origin = options.to;
    }
    config.origin = normalizeOrigin(config.origin);
    ForwardTarget::parse(config.origin);

    if (!options.from.empty())
    {
        config.listenAddress = options.from;
    }
    config.certPath = options.cert;
    config.keyPath = options.key;
    config.domain = options.domain;
    config.redirectPort = parseRedirectPort(options.redirectHTTP);
    if (!options.altnames.empty())
    {
        config.altNames = splitAltNames(options.altnames);
    }
    if (config.altNames.empty())
    {
        throw ConfigError("-altnames must name at least one host");
    }
    if (!config.hasDomain() && config.certPath.empty() != config.keyPath.empty())
    {
        REACTOR_LOG_WARNING(
            "-cert and -key must be given together, using a self-signed certificate");
        config.certPath.clear();
        config.keyPath.clear();
    }
    auto dir = defaultStateDir();
    config.defaultCertPath = (dir / "cert.pem").string();
    config.defaultKeyPath = (dir / "key.pem").string();
    return config;
}
} // namespace sslproxy
