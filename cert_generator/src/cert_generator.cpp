#include "certificate_provisioner.hpp"
#include "common/command_line_parser.hpp"
#include "key_generator.hpp"
#include "proxy_config.hpp"

#include <chrono>
#include <iostream>
#include <string>

using namespace reactor;

int main(int argc, const char* argv[])
{
    auto [cert, key, altnames, days] = getArgs(
        parseCommandline(argc, argv), "-cert", "-key", "-altnames", "-days");
    if (cert.empty() || key.empty())
    {
        REACTOR_LOG_ERROR("Invalid arguments");
        REACTOR_LOG_ERROR(
            "eg: cert_generator -cert cert.pem -key key.pem -altnames localhost,example.com -days 365");
        return 1;
    }
    try
    {
        auto names = altnames.empty()
                         ? std::vector<std::string>{"localhost"}
                         : sslproxy::splitAltNames(altnames);
        if (names.empty())
        {
            throw sslproxy::ConfigError("-altnames must name at least one host");
        }
        int validDays = 365;
        if (!days.empty())
        {
            validDays = std::stoi(std::string{days.data(), days.length()});
            if (validDays <= 0)
            {
                throw sslproxy::ConfigError("-days must be positive");
            }
        }
        sslproxy::KeyGenerator generator;
        auto material = generator.generate(std::chrono::hours(24 * validDays),
                                           names);
        sslproxy::persistCertificateMaterial(
            material, std::string{cert.data(), cert.length()},
            std::string{key.data(), key.length()});

        std::cout << "Certificate: " << cert << "\n";
        std::cout << "Private key: " << key << "\n";
        std::cout << "SHA256 Fingerprint: "
                  << sslproxy::formatFingerprint(material.fingerprint) << "\n";
        for (const auto& name : sslproxy::subjectAltNames(material.certificate))
        {
            std::cout << "SAN: " << name << "\n";
        }
    }
    catch (const std::exception& e)
    {
        REACTOR_LOG_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
