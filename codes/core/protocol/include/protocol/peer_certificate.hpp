// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: peer_certificate.hpp
//  描述: 对端证书（OpenSSL X509封装，只读）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <memory>
#include <string>

// 前向声明，避免在头文件中暴露OpenSSL
struct x509_st;

namespace h2_mux_client {
namespace protocol {

namespace details {

struct X509Deleter {
    void operator()(x509_st* x509) const;
};

using UniqueX509Ptr = std::unique_ptr<x509_st, X509Deleter>;

} // namespace details

// ==================== 对端证书类 ====================
class PeerCertificate {
public:
    /**
     * @brief 从DER编码解析证书
     * @param der DER字节
     * @return 成功返回证书；为空或解析失败返回TLS_CERT_ERROR
     */
    static utils::Result<std::shared_ptr<PeerCertificate>> from_der(const std::string& der);

    // 禁止拷贝
    PeerCertificate(const PeerCertificate&) = delete;
    PeerCertificate& operator=(const PeerCertificate&) = delete;

    // 单行格式的主题/颁发者名称，如 "CN=example.com,O=Example"
    const std::string& subject() const { return subject_; }
    const std::string& issuer() const { return issuer_; }

    // 原始DER字节
    const std::string& der() const { return der_; }

    x509_st* native_handle() const { return x509_.get(); }

private:
    PeerCertificate(details::UniqueX509Ptr x509, std::string der);

    details::UniqueX509Ptr x509_;
    std::string der_;
    std::string subject_;
    std::string issuer_;
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
