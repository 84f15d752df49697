#pragma once

#include <map>
#include <string>

namespace kube_auth_proxy {

/// PEM encoded key pair handed to the proxy.
struct CertificatePair {
    std::string privateKey;
    std::string cert;
};

/// Source of the serving certificate for an API hostname.
class CertificateProvider {
public:
    virtual ~CertificateProvider() = default;
    virtual CertificatePair certificateFor(const std::string& hostname) = 0;
};

/// Reads <dir>/<hostname>.key and <dir>/<hostname>.crt, once per hostname.
class FileCertificateProvider : public CertificateProvider {
public:
    explicit FileCertificateProvider(std::string directory);

    /// @throws std::runtime_error if either file is missing or empty.
    CertificatePair certificateFor(const std::string& hostname) override;

private:
    std::string                            mDirectory;
    std::map<std::string, CertificatePair> mCache;
};

} // namespace kube_auth_proxy
