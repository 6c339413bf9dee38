#include "key_generator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <ctime>

using namespace sslproxy;

namespace
{
constexpr std::chrono::seconds OneYear{std::chrono::hours(365 * 24)};

EvpPkeyPtr loadKey(const std::string& pem)
{
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    return EvpPkeyPtr(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}
} // namespace

TEST(KeyGenerator, SubjectAltNamesKeepOrder)
{
    KeyGenerator generator;
    auto material = generator.generate(OneYear, {"localhost", "example.com"});
    EXPECT_EQ(subjectAltNames(material.certificate),
              (std::vector<std::string>{"localhost", "example.com"}));
}

TEST(KeyGenerator, SubjectAltNamesKeepCase)
{
    KeyGenerator generator;
    auto material = generator.generate(OneYear, {"Example.COM", "localhost"});
    EXPECT_EQ(subjectAltNames(material.certificate),
              (std::vector<std::string>{"Example.COM", "localhost"}));
}

TEST(KeyGenerator, IpAddressesBecomeIpSans)
{
    KeyGenerator generator;
    auto material = generator.generate(OneYear, {"localhost", "127.0.0.1", "::1"});
    EXPECT_EQ(subjectAltNames(material.certificate),
              (std::vector<std::string>{"localhost", "127.0.0.1", "::1"}));

    auto cert = loadCert(material.certificate);
    EXPECT_EQ(X509_check_ip_asc(cert.get(), "127.0.0.1", 0), 1);
    EXPECT_EQ(X509_check_host(cert.get(), "localhost", 0, 0, nullptr), 1);
}

TEST(KeyGenerator, ValidityWindow)
{
    KeyGenerator generator;
    auto material = generator.generate(std::chrono::hours(48), {"localhost"});
    auto cert = loadCert(material.certificate);

    std::time_t now = std::time(nullptr);
    std::time_t soon = now + 24 * 3600;
    std::time_t late = now + 72 * 3600;
    EXPECT_LE(X509_cmp_time(X509_get0_notBefore(cert.get()), &soon), 0);
    EXPECT_GT(X509_cmp_time(X509_get0_notAfter(cert.get()), &soon), 0);
    EXPECT_LT(X509_cmp_time(X509_get0_notAfter(cert.get()), &late), 0);
}

TEST(KeyGenerator, FingerprintMatchesCertificate)
{
    KeyGenerator generator;
    auto material = generator.generate(OneYear, {"localhost"});
    EXPECT_EQ(material.fingerprint, fingerprintOf(material.certificate));

    auto text = formatFingerprint(material.fingerprint);
    EXPECT_EQ(text.size(), 32 * 3 - 1);
}

TEST(KeyGenerator, KeyMatchesCertificate)
{
    KeyGenerator generator;
    auto material = generator.generate(OneYear, {"localhost"});
    auto cert = loadCert(material.certificate);
    auto key = loadKey(material.privateKey);
    ASSERT_TRUE(key);
    EXPECT_EQ(X509_check_private_key(cert.get(), key.get()), 1);
    EXPECT_EQ(X509_verify(cert.get(), key.get()), 1);
}

TEST(KeyGenerator, EveryCallMakesNewMaterial)
{
    KeyGenerator generator;
    auto first = generator.generate(OneYear, {"localhost"});
    auto second = generator.generate(OneYear, {"localhost"});
    EXPECT_NE(first.privateKey, second.privateKey);
    EXPECT_NE(first.fingerprint, second.fingerprint);
}

TEST(KeyGenerator, RejectsGarbagePem)
{
    EXPECT_THROW(loadCert("not a certificate"), GenerationError);
}
