#pragma once
#include <stdexcept>
#include <string>

namespace sslproxy
{
// Malformed flags or configuration file. Fatal at startup.
struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// The selected certificate source cannot be turned into a TLS setup.
struct ProvisionError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Key or certificate generation failed inside OpenSSL.
struct GenerationError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Certificate or key could not be written.
struct PersistenceError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Bind/listen failure. Fatal for the HTTPS listener only.
struct ListenError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace sslproxy
