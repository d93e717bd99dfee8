#include "streamdl/proxy.hpp"

#include "streamdl/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <utility>

namespace streamdl {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

struct UrlParts {
    std::string scheme;
    std::string host;
};

std::optional<UrlParts> splitUrl(const std::string& url) {
    detail::CurlUrlHandle handle{curl_url()};
    if (!handle) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    auto part = [&handle](CURLUPart which) -> std::optional<std::string> {
        char* value = nullptr;
        if (curl_url_get(handle.get(), which, &value, 0) != CURLUE_OK || !value) {
            return std::nullopt;
        }
        std::string result{value};
        curl_free(value);
        return result;
    };

    auto scheme = part(CURLUPART_SCHEME);
    auto host = part(CURLUPART_HOST);
    if (!scheme || !host) {
        return std::nullopt;
    }
    return UrlParts{toLower(*scheme), toLower(*host)};
}

} // namespace

ProxyResolver::ProxyResolver()
    : env_([](const std::string& name) -> std::optional<std::string> {
          const char* value = std::getenv(name.c_str());
          if (!value) {
              return std::nullopt;
          }
          return std::string{value};
      }) {}

ProxyResolver::ProxyResolver(Environment env) : env_(std::move(env)) {}

ProxyResolver ProxyResolver::fromMap(std::map<std::string, std::string> vars) {
    auto shared = std::make_shared<const std::map<std::string, std::string>>(std::move(vars));
    return ProxyResolver([shared](const std::string& name) -> std::optional<std::string> {
        const auto it = shared->find(name);
        if (it == shared->end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::optional<std::string> ProxyResolver::lookup(const std::string& name) const {
    auto value = env_(name);
    if (!value || trim(*value).empty()) {
        return std::nullopt;
    }
    return trim(*value);
}

bool ProxyResolver::bypassed(const std::string& host) const {
    auto no_proxy = lookup("no_proxy");
    if (!no_proxy) {
        no_proxy = lookup("NO_PROXY");
    }
    if (!no_proxy) {
        return false;
    }

    std::istringstream entries(*no_proxy);
    std::string entry;
    while (std::getline(entries, entry, ',')) {
        entry = toLower(trim(entry));
        if (entry.empty()) {
            continue;
        }
        if (entry == "*") {
            return true;
        }
        // IPv6 literals keep their brackets; only strip a trailing :port otherwise.
        const auto colon = entry.rfind(':');
        if (colon != std::string::npos && entry.find(']') == std::string::npos
            && entry.find(':') == colon) {
            entry.erase(colon);
        }
        if (!entry.empty() && entry.front() == '.') {
            entry.erase(0, 1);
        }
        // A bare ":port" or "." names no host.
        if (entry.empty()) {
            continue;
        }
        if (host == entry) {
            return true;
        }
        if (host.size() > entry.size()
            && host.compare(host.size() - entry.size(), entry.size(), entry) == 0
            && host[host.size() - entry.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

std::optional<std::string> ProxyResolver::proxyFor(const std::string& url) const {
    const auto parts = splitUrl(url);
    if (!parts || bypassed(parts->host)) {
        return std::nullopt;
    }

    std::optional<std::string> proxy;
    if (parts->scheme == "http") {
        // HTTP_PROXY is settable by request headers under CGI.
        proxy = lookup("http_proxy");
    } else if (parts->scheme == "https") {
        proxy = lookup("https_proxy");
        if (!proxy) {
            proxy = lookup("HTTPS_PROXY");
        }
    }
    if (!proxy) {
        proxy = lookup("all_proxy");
    }
    if (!proxy) {
        proxy = lookup("ALL_PROXY");
    }
    if (!proxy) {
        return std::nullopt;
    }

    if (proxy->find("://") == std::string::npos) {
        proxy = "http://" + *proxy;
    }
    return proxy;
}

} // namespace streamdl
