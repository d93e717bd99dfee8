#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace streamdl {

// Picks the proxy for a URL from the usual *_proxy / no_proxy variables.
class ProxyResolver {
public:
    using Environment = std::function<std::optional<std::string>(const std::string&)>;

    // Uses the process environment.
    ProxyResolver();
    explicit ProxyResolver(Environment env);

    static ProxyResolver fromMap(std::map<std::string, std::string> vars);

    [[nodiscard]] std::optional<std::string> proxyFor(const std::string& url) const;

private:
    [[nodiscard]] std::optional<std::string> lookup(const std::string& name) const;
    [[nodiscard]] bool bypassed(const std::string& host) const;

    Environment env_;
};

} // namespace streamdl
