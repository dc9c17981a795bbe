// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: peer_certificate.cpp
//  描述: PeerCertificate类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/peer_certificate.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/x509.h>

namespace h2_mux_client {
namespace protocol {

// ==================== RAII资源包装器 ====================
namespace details {

void X509Deleter::operator()(X509* x509) const {
    if (x509) {
        X509_free(x509);
    }
}

struct BioDeleter {
    void operator()(BIO* bio) const {
        if (bio) {
            BIO_free(bio);
        }
    }
};

using UniqueBioPtr = std::unique_ptr<BIO, BioDeleter>;

// X509_NAME转为RFC2253单行格式
static std::string name_to_string(X509_NAME* name) {
    if (name == nullptr) {
        return std::string();
    }
    UniqueBioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return std::string();
    }
    if (X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
        return std::string();
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || data == nullptr) {
        return std::string();
    }
    return std::string(data, static_cast<size_t>(len));
}

} // namespace details

// ==================== PeerCertificate实现 ====================

utils::Result<std::shared_ptr<PeerCertificate>> PeerCertificate::from_der(const std::string& der) {
    if (der.empty()) {
        return utils::make_err<std::shared_ptr<PeerCertificate>>(
            utils::ErrorCode::TLS_CERT_ERROR, "Empty certificate");
    }

    const unsigned char* ptr = reinterpret_cast<const unsigned char*>(der.data());
    details::UniqueX509Ptr x509(d2i_X509(nullptr, &ptr, static_cast<long>(der.size())));
    if (!x509) {
        unsigned long err = ERR_get_error();
        char buf[256] = {0};
        ERR_error_string_n(err, buf, sizeof(buf));
        return utils::make_err<std::shared_ptr<PeerCertificate>>(
            utils::ErrorCode::TLS_CERT_ERROR, std::string("Failed to parse certificate: ") + buf);
    }

    std::shared_ptr<PeerCertificate> cert(new PeerCertificate(std::move(x509), der));
    return utils::make_ok(std::move(cert));
}

PeerCertificate::PeerCertificate(details::UniqueX509Ptr x509, std::string der)
    : x509_(std::move(x509))
    , der_(std::move(der))
{
    subject_ = details::name_to_string(X509_get_subject_name(x509_.get()));
    issuer_ = details::name_to_string(X509_get_issuer_name(x509_.get()));
}

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
