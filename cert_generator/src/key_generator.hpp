#pragma once
#include "errors.hpp"

#include <arpa/inet.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sslproxy
{
using X509Ptr = std::unique_ptr<X509, decltype([](X509* ptr) { X509_free(ptr); })>;
using EvpPkeyPtr =
    std::unique_ptr<EVP_PKEY, decltype([](EVP_PKEY* ptr) { EVP_PKEY_free(ptr); })>;
using EvpPkeyCtxPtr =
    std::unique_ptr<EVP_PKEY_CTX,
                    decltype([](EVP_PKEY_CTX* ptr) { EVP_PKEY_CTX_free(ptr); })>;
using BioPtr = std::unique_ptr<BIO, decltype([](BIO* ptr) { BIO_free(ptr); })>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype([](BIGNUM* ptr) { BN_free(ptr); })>;
using ExtensionPtr =
    std::unique_ptr<X509_EXTENSION,
                    decltype([](X509_EXTENSION* ptr) { X509_EXTENSION_free(ptr); })>;
using GeneralNamesPtr =
    std::unique_ptr<GENERAL_NAMES,
                    decltype([](GENERAL_NAMES* ptr) { GENERAL_NAMES_free(ptr); })>;

using Fingerprint = std::array<unsigned char, 32>;

struct CertificateMaterial
{
    std::string certificate;
    std::string privateKey;
    Fingerprint fingerprint{};
};

inline std::string opensslError(std::string_view what)
{
    std::string message(what);
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0)
    {
        std::array<char, 256> buf{};
        ERR_error_string_n(code, buf.data(), buf.size());
        message += ": ";
        message += buf.data();
    }
    return message;
}

inline std::string formatFingerprint(const Fingerprint& fingerprint)
{
    std::string out;
    for (auto byte : fingerprint)
    {
        std::array<char, 4> hex{};
        std::snprintf(hex.data(), hex.size(), "%02X", byte);
        if (!out.empty())
        {
            out += ' ';
        }
        out += hex.data();
    }
    return out;
}

inline std::string pemOf(X509* cert)
{
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1)
    {
        throw GenerationError(opensslError("Unable to encode certificate"));
    }
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio.get(), &mem);
    return std::string(mem->data, mem->length);
}

inline std::string pemOf(EVP_PKEY* key)
{
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0,
                                         nullptr, nullptr) != 1)
    {
        throw GenerationError(opensslError("Unable to encode private key"));
    }
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio.get(), &mem);
    return std::string(mem->data, mem->length);
}

inline X509Ptr loadCert(std::string_view pem)
{
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert)
    {
        throw GenerationError(opensslError("Unable to parse certificate"));
    }
    return cert;
}

inline Fingerprint fingerprintOf(X509* cert)
{
    Fingerprint fingerprint{};
    unsigned int len = 0;
    if (X509_digest(cert, EVP_sha256(), fingerprint.data(), &len) != 1 ||
        len != fingerprint.size())
    {
        throw GenerationError(opensslError("Unable to fingerprint certificate"));
    }
    return fingerprint;
}

inline Fingerprint fingerprintOf(std::string_view pem)
{
    return fingerprintOf(loadCert(pem).get());
}

// DNS and IP entries of the subjectAltName extension, in certificate order.
inline std::vector<std::string> subjectAltNames(std::string_view pem)
{
    auto cert = loadCert(pem);
    std::vector<std::string> names;
    GeneralNamesPtr sans(static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert.get(), NID_subject_alt_name, nullptr, nullptr)));
    if (!sans)
    {
        return names;
    }
    for (int i = 0; i < sk_GENERAL_NAME_num(sans.get()); i++)
    {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(sans.get(), i);
        if (name->type == GEN_DNS)
        {
            const ASN1_IA5STRING* dns = name->d.dNSName;
            names.emplace_back(
                reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                ASN1_STRING_length(dns));
        }
        else if (name->type == GEN_IPADD)
        {
            const ASN1_OCTET_STRING* ip = name->d.iPAddress;
            std::array<char, INET6_ADDRSTRLEN> text{};
            int family = ASN1_STRING_length(ip) == 4 ? AF_INET : AF_INET6;
            if (inet_ntop(family, ASN1_STRING_get0_data(ip), text.data(),
                          text.size()) != nullptr)
            {
                names.emplace_back(text.data());
            }
        }
    }
    return names;
}

struct KeyGenerator
{
    int keyBits{2048};

    CertificateMaterial generate(std::chrono::seconds validity,
                                 const std::vector<std::string>& subjectNames) const
    {
        auto key = generateKey();
        X509Ptr cert(X509_new());
        if (!cert)
        {
            throw GenerationError(opensslError("Unable to allocate certificate"));
        }
        X509_set_version(cert.get(), 2);
        setRandomSerial(cert.get());
        if (X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) == nullptr ||
            X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                            static_cast<long>(validity.count())) == nullptr)
        {
            throw GenerationError(opensslError("Unable to set validity"));
        }
        if (X509_set_pubkey(cert.get(), key.get()) != 1)
        {
            throw GenerationError(opensslError("Unable to set public key"));
        }

        X509_NAME* name = X509_get_subject_name(cert.get());
        std::string commonName = subjectNames.empty() ? "ssl-proxy"
                                                      : subjectNames.front();
        if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                       (const unsigned char*)"ssl-proxy", -1,
                                       -1, 0) != 1 ||
            X509_NAME_add_entry_by_txt(
                name, "CN", MBSTRING_ASC,
                (const unsigned char*)commonName.c_str(), -1, -1, 0) != 1)
        {
            throw GenerationError(opensslError("Unable to set subject name"));
        }
        X509_set_issuer_name(cert.get(), name);

        addExtension(cert.get(), NID_basic_constraints, "critical,CA:FALSE");
        addExtension(cert.get(), NID_key_usage,
                     "critical,digitalSignature,keyEncipherment");
        addExtension(cert.get(), NID_ext_key_usage, "serverAuth");
        if (!subjectNames.empty())
        {
            addSubjectAltNames(cert.get(), subjectNames);
        }

        if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0)
        {
            throw GenerationError(opensslError("Unable to sign certificate"));
        }

        CertificateMaterial material;
        material.certificate = pemOf(cert.get());
        material.privateKey = pemOf(key.get());
        material.fingerprint = fingerprintOf(cert.get());
        return material;
    }

  private:
    EvpPkeyPtr generateKey() const
    {
        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), keyBits) <= 0)
        {
            throw GenerationError(opensslError("Unable to set up key generation"));
        }
        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
        {
            throw GenerationError(opensslError("Unable to generate private key"));
        }
        return EvpPkeyPtr(raw);
    }
    static void setRandomSerial(X509* cert)
    {
        BignumPtr serial(BN_new());
        if (!serial ||
            BN_rand(serial.get(), 127, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
            BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert)) ==
                nullptr)
        {
            throw GenerationError(opensslError("Unable to set serial number"));
        }
    }
    static void addExtension(X509* cert, int nid, const char* value)
    {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
        ExtensionPtr ext(X509V3_EXT_nconf_nid(nullptr, &ctx, nid, value));
        if (!ext || X509_add_ext(cert, ext.get(), -1) != 1)
        {
            throw GenerationError(opensslError("Unable to add extension"));
        }
    }
    static void addSubjectAltNames(X509* cert,
                                   const std::vector<std::string>& subjectNames)
    {
        GeneralNamesPtr names(sk_GENERAL_NAME_new_null());
        if (!names)
        {
            throw GenerationError(opensslError("Unable to allocate SAN list"));
        }
        for (const auto& subject : subjectNames)
        {
            GENERAL_NAME* gen = GENERAL_NAME_new();
            if (gen == nullptr)
            {
                throw GenerationError(opensslError("Unable to allocate SAN"));
            }
            if (ASN1_OCTET_STRING* ip = a2i_IPADDRESS(subject.c_str()))
            {
                GENERAL_NAME_set0_value(gen, GEN_IPADD, ip);
            }
            else
            {
                ERR_clear_error();
                ASN1_IA5STRING* dns = ASN1_IA5STRING_new();
                if (dns == nullptr ||
                    ASN1_STRING_set(dns, subject.data(),
                                    static_cast<int>(subject.size())) != 1)
                {
                    ASN1_IA5STRING_free(dns);
                    GENERAL_NAME_free(gen);
                    throw GenerationError(opensslError("Unable to encode SAN"));
                }
                GENERAL_NAME_set0_value(gen, GEN_DNS, dns);
            }
            if (sk_GENERAL_NAME_push(names.get(), gen) == 0)
            {
                GENERAL_NAME_free(gen);
                throw GenerationError(opensslError("Unable to add SAN"));
            }
        }
        if (X509_add1_ext_i2d(cert, NID_subject_alt_name, names.get(), 0,
                              X509V3_ADD_DEFAULT) != 1)
        {
            throw GenerationError(opensslError("Unable to add subjectAltName"));
        }
    }
};
} // namespace sslproxy
