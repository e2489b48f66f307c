#include "Net/UrlParts.h"

#include <algorithm>
#include <cctype>

std::optional<UrlParts> parse_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = url.substr(0, scheme_end);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        return std::nullopt;
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, path_start == std::string::npos
                                                            ? std::string::npos
                                                            : path_start - authority_start);
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    // Bracketed IPv6 literals keep their colons.
    std::string::size_type port_sep = std::string::npos;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
        parts.host = authority.substr(0, port_sep);
    }

    if (port_sep != std::string::npos) {
        parts.port = authority.substr(port_sep + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    } else {
        parts.port = parts.isTls() ? "443" : "80";
    }
    if (parts.host.empty()) {
        return std::nullopt;
    }

    if (path_start == std::string::npos) {
        parts.target = "/";
    } else {
        parts.target = url.substr(path_start);
        if (auto hash = parts.target.find('#'); hash != std::string::npos) {
            parts.target.erase(hash);
        }
        if (parts.target.empty() || parts.target.front() != '/') {
            parts.target.insert(0, "/");
        }
    }
    return parts;
}
