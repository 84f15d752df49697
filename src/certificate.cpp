#include "certificate.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace kube_auth_proxy {

namespace {

std::string readPemFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open certificate file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    std::string pem = contents.str();
    if (pem.empty()) {
        throw std::runtime_error("Certificate file is empty: " + path);
    }
    return pem;
}

} // namespace

FileCertificateProvider::FileCertificateProvider(std::string directory)
    : mDirectory(std::move(directory)) {}

CertificatePair FileCertificateProvider::certificateFor(const std::string& hostname) {
    auto it = mCache.find(hostname);
    if (it != mCache.end()) {
        return it->second;
    }

    if (hostname.empty() || hostname.find('/') != std::string::npos) {
        throw std::runtime_error("Invalid hostname for certificate lookup: " + hostname);
    }

    const std::string base = mDirectory + "/" + hostname;
    CertificatePair pair;
    pair.privateKey = readPemFile(base + ".key");
    pair.cert       = readPemFile(base + ".crt");

    mCache.emplace(hostname, pair);
    return pair;
}

} // namespace kube_auth_proxy
