#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

typedef struct x509_st X509;

namespace streamdl {

// An immutable parsed X509 certificate. Copies share the same certificate.
class Certificate {
public:
    // Parses the first PEM certificate in `pem`; std::nullopt if there is none.
    static std::optional<Certificate> fromPem(const std::string& pem);

    [[nodiscard]] X509* native() const noexcept { return cert_.get(); }
    [[nodiscard]] std::string subject() const;

private:
    explicit Certificate(std::shared_ptr<X509> cert) : cert_(std::move(cert)) {}

    std::shared_ptr<X509> cert_;
};

// Best effort: a missing, unreadable or malformed file yields std::nullopt so
// that the default trust store is used instead.
std::optional<Certificate> loadRootCertificate(const std::filesystem::path& path);

} // namespace streamdl
