#pragma once
#include "common_defs.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace sslproxy
{
inline bool isPort(std::string_view port)
{
    if (port.empty() || port.size() > 5 ||
        !std::ranges::all_of(port, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    {
        return false;
    }
    int value = std::stoi(std::string(port));
    return value > 0 && value <= 65535;
}

inline bool isRegName(std::string_view name)
{
    return !name.empty() && std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
               c == '.' || c == '_';
    });
}

inline std::string toLower(std::string_view in)
{
    std::string out(in);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

struct HostPort
{
    std::string host; // IPv6 literals without brackets
    std::string port; // may be empty
    bool ipv6{false};
};

// Splits "host", "host:port", "[v6]" or "[v6]:port". Returns nullopt for
// anything that is not a usable authority.
inline std::optional<HostPort> splitHostPort(std::string_view authority)
{
    if (authority.empty())
    {
        return std::nullopt;
    }
    HostPort result;
    std::string_view rest;
    if (authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
        {
            return std::nullopt;
        }
        result.host = std::string(authority.substr(1, close - 1));
        result.ipv6 = true;
        boost::system::error_code ec;
        net::ip::make_address_v6(result.host, ec);
        if (ec)
        {
            return std::nullopt;
        }
        rest = authority.substr(close + 1);
    }
    else
    {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos &&
            authority.find(':', colon + 1) != std::string_view::npos)
        {
            return std::nullopt;
        }
        result.host = std::string(authority.substr(0, colon));
        if (!isRegName(result.host))
        {
            return std::nullopt;
        }
        rest = colon == std::string_view::npos ? std::string_view{}
                                               : authority.substr(colon);
    }
    if (!rest.empty())
    {
        if (rest.front() != ':')
        {
            return std::nullopt;
        }
        result.port = std::string(rest.substr(1));
        if (!result.port.empty() && !isPort(result.port))
        {
            return std::nullopt;
        }
    }
    return result;
}

// Host part of a Host header, ready to be placed in a URL.
inline std::optional<std::string> urlHostOf(std::string_view hostHeader)
{
    auto hp = splitHostPort(hostHeader);
    if (!hp)
    {
        return std::nullopt;
    }
    return hp->ipv6 ? "[" + hp->host + "]" : hp->host;
}

struct ForwardTarget
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string authority;
    std::string pathPrefix;
    std::string query;

    bool secure() const
    {
        return scheme == "https";
    }
    std::string url() const
    {
        std::string out = scheme + "://" + authority + pathPrefix;
        if (!query.empty())
        {
            out += "?" + query;
        }
        return out;
    }

    static ForwardTarget parse(std::string_view url)
    {
        auto sep = url.find("://");
        if (sep == std::string_view::npos)
        {
            throw ConfigError("Unable to parse 'to' url: missing scheme in " +
                              std::string(url));
        }
        ForwardTarget target;
        target.scheme = toLower(url.substr(0, sep));
        if (target.scheme != "http" && target.scheme != "https")
        {
            throw ConfigError("Unable to parse 'to' url: unsupported scheme " +
                              target.scheme);
        }
        auto rest = url.substr(sep + 3);
        auto fragment = rest.find('#');
        rest = rest.substr(0, fragment);
        auto end = rest.find_first_of("/?");
        target.authority = std::string(rest.substr(0, end));
        auto hp = splitHostPort(target.authority);
        if (!hp || target.authority.find('@') != std::string::npos)
        {
            throw ConfigError("Unable to parse 'to' url: bad host in " +
                              std::string(url));
        }
        target.host = hp->host;
        target.port = hp->port.empty() ? (target.secure() ? "443" : "80")
                                       : hp->port;
        if (end != std::string_view::npos)
        {
            auto pathAndQuery = rest.substr(end);
            auto q = pathAndQuery.find('?');
            target.pathPrefix = std::string(pathAndQuery.substr(0, q));
            if (q != std::string_view::npos)
            {
                target.query = std::string(pathAndQuery.substr(q + 1));
            }
        }
        if (target.pathPrefix == "/")
        {
            target.pathPrefix.clear();
        }
        return target;
    }

    // Origin-form target for the outbound request.
    std::string requestTarget(std::string_view inbound) const
    {
        if (pathPrefix.empty() && query.empty())
        {
            return std::string(inbound);
        }
        auto q = inbound.find('?');
        std::string path(inbound.substr(0, q));
        std::string inQuery = q == std::string_view::npos
                                  ? std::string{}
                                  : std::string(inbound.substr(q + 1));
        if (!pathPrefix.empty())
        {
            bool aslash = pathPrefix.ends_with('/');
            bool bslash = path.starts_with('/');
            if (aslash && bslash)
            {
                path = pathPrefix + path.substr(1);
            }
            else if (!aslash && !bslash)
            {
                path = pathPrefix + "/" + path;
            }
            else
            {
                path = pathPrefix + path;
            }
        }
        std::string outQuery = query;
        if (!inQuery.empty())
        {
            outQuery = outQuery.empty() ? inQuery : outQuery + "&" + inQuery;
        }
        return outQuery.empty() ? path : path + "?" + outQuery;
    }
};

// "host:port", ":port" or "[v6]:port" into a bindable endpoint.
inline tcp::endpoint resolveListenEndpoint(net::io_context& ioc,
                                           std::string_view address)
{
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos ||
        !isPort(address.substr(colon + 1)))
    {
        throw ConfigError("Invalid listen address: " + std::string(address));
    }
    auto port = static_cast<unsigned short>(
        std::stoi(std::string(address.substr(colon + 1))));
    auto host = address.substr(0, colon);
    if (host.empty())
    {
        return tcp::endpoint(tcp::v4(), port);
    }
    if (host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
    }
    tcp::resolver resolver(ioc);
    boost::system::error_code ec;
    auto results = resolver.resolve(std::string(host),
                                    std::to_string(port), ec);
    if (ec || results.empty())
    {
        throw ListenError("Unable to resolve listen address " +
                          std::string(address) + ": " + ec.message());
    }
    return results.begin()->endpoint();
}
} // namespace sslproxy
