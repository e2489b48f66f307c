#ifndef URLPARTS_H
#define URLPARTS_H

#include <optional>
#include <string>

struct UrlParts {
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;
    std::string target; // path plus query, never empty

    bool isTls() const { return scheme == "https"; }
};

// Splits an absolute http(s) URL. Returns nullopt for anything else.
std::optional<UrlParts> parse_url(const std::string& url);

#endif // URLPARTS_H
