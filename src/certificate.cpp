#include "streamdl/certificate.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace streamdl {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const {
        if (bio) {
            BIO_free(bio);
        }
    }
};

struct X509Deleter {
    void operator()(X509* cert) const {
        if (cert) {
            X509_free(cert);
        }
    }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

} // namespace

std::optional<Certificate> Certificate::fromPem(const std::string& pem) {
    if (pem.empty()) {
        return std::nullopt;
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::nullopt;
    }

    X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!cert) {
        ERR_clear_error();
        return std::nullopt;
    }
    return Certificate(std::shared_ptr<X509>(cert, X509Deleter{}));
}

std::string Certificate::subject() const {
    char* name = X509_NAME_oneline(X509_get_subject_name(cert_.get()), nullptr, 0);
    if (!name) {
        return {};
    }
    std::string result{name};
    OPENSSL_free(name);
    return result;
}

std::optional<Certificate> loadRootCertificate(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    const std::string pem{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::nullopt;
    }
    return Certificate::fromPem(pem);
}

} // namespace streamdl
