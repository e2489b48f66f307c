#include "Core/UrlFallbackChain.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>

#include "MediaItem.h"

namespace {
    constexpr const char* UPLOAD_MARKER = "/upload/";
    constexpr const char* MINIMAL_TRANSFORMATION = "q_auto:low,f_auto";

    // Ordered rewrite rules, the first one that applies wins.
    const std::array<std::pair<const char*, const char*>, 5> QUALITY_STEPS = {{
        {"sp_hd", "sp_sd"},
        {"sp_sd", "sp_auto"},
        {"q_auto:best", "q_auto:good"},
        {"q_auto:good", "q_auto:eco"},
        {"q_auto:eco", "q_auto:low"},
    }};

    std::string replace_all(std::string value, const std::string& from, const std::string& to) {
        std::string::size_type pos = 0;
        while ((pos = value.find(from, pos)) != std::string::npos) {
            value.replace(pos, from.size(), to);
            pos += to.size();
        }
        return value;
    }

    // Transformation segments are comma separated key_value pairs (w_720,q_auto)
    // or a version marker (v1712345678).
    bool is_transformation_segment(const std::string& segment) {
        static const std::regex parameter(R"(^(w|h|c|q|f|b|e|g|t|ar|br|du|fl|ki|sp|vc|ac|ab|so|eo|fps|dpr)_.+$)");
        static const std::regex version(R"(^v\d+$)");
        if (segment.empty()) {
            return false;
        }
        if (std::regex_match(segment, version) || segment.rfind("s--", 0) == 0) {
            return true;
        }
        std::string::size_type start = 0;
        while (true) {
            auto comma = segment.find(',', start);
            auto part = segment.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
            if (!std::regex_match(part, parameter)) {
                return false;
            }
            if (comma == std::string::npos) {
                return true;
            }
            start = comma + 1;
        }
    }

    void push_unique(std::vector<std::string>& list, const std::string& value) {
        if (!value.empty() && std::find(list.begin(), list.end(), value) == list.end()) {
            list.push_back(value);
        }
    }
} // namespace

namespace UrlFallbackChain {

std::optional<std::string> reducedQuality(const std::string& url) {
    // Stage order matters: profile steps are exhausted before quality steps.
    for (int i = 0; i < 2; ++i) {
        const auto& [from, to] = QUALITY_STEPS[i];
        if (url.find(from) != std::string::npos) {
            return replace_all(url, from, to);
        }
    }
    if (url.find("sp_auto") != std::string::npos) {
        static const std::regex profile(R"(sp_[^,/]+,)");
        std::string stripped = std::regex_replace(url, profile, "");
        if (stripped != url) {
            return stripped;
        }
    }
    for (std::size_t i = 2; i < QUALITY_STEPS.size(); ++i) {
        const auto& [from, to] = QUALITY_STEPS[i];
        if (url.find(from) != std::string::npos) {
            return replace_all(url, from, to);
        }
    }
    return std::nullopt;
}

std::optional<std::string> canonical(const std::string& url) {
    const auto marker = url.find(UPLOAD_MARKER);
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    const auto prefix_end = marker + std::string(UPLOAD_MARKER).size();
    std::string rest = url.substr(prefix_end);
    std::string query;
    if (auto q = rest.find('?'); q != std::string::npos) {
        query = rest.substr(q);
        rest.erase(q);
    }

    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (start <= rest.size()) {
        auto slash = rest.find('/', start);
        segments.push_back(rest.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }

    // The public id is whatever follows the leading transformation segments.
    std::size_t first_id_segment = 0;
    while (first_id_segment + 1 < segments.size() && is_transformation_segment(segments[first_id_segment])) {
        ++first_id_segment;
    }

    std::string public_id;
    for (std::size_t i = first_id_segment; i < segments.size(); ++i) {
        if (!public_id.empty())
            public_id += "/";
        public_id += segments[i];
    }
    if (public_id.empty()) {
        return std::nullopt;
    }
    return url.substr(0, prefix_end) + public_id + query;
}

std::optional<std::string> minimalQuality(const std::string& url) {
    auto base = canonical(url);
    if (!base) {
        return std::nullopt;
    }
    const auto prefix_end = base->find(UPLOAD_MARKER) + std::string(UPLOAD_MARKER).size();
    return base->substr(0, prefix_end) + MINIMAL_TRANSFORMATION + "/" + base->substr(prefix_end);
}

std::vector<std::string> degradedVariants(const std::string& url) {
    std::vector<std::string> variants;
    for (const auto& variant : {reducedQuality(url), canonical(url), minimalQuality(url)}) {
        if (variant && *variant != url) {
            push_unique(variants, *variant);
        }
    }
    return variants;
}

bool isAdaptive(const std::string& url) {
    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (auto q = lower.find('?'); q != std::string::npos) {
        lower.erase(q);
    }
    // HLS playlists and DASH manifests.
    for (const char* marker : {".m3u8", "/hls/", ".mpd", "/dash/"}) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> candidateUrls(const MediaItem& item) {
    std::vector<std::string> all;
    push_unique(all, item.url);
    for (const auto& url : item.fallback_urls) {
        push_unique(all, url);
    }

    std::vector<std::string> ordered;
    for (const auto& url : all) {
        if (isAdaptive(url))
            push_unique(ordered, url);
    }
    for (const auto& url : all) {
        if (!isAdaptive(url))
            push_unique(ordered, url);
    }
    if (!ordered.empty()) {
        const std::string first = ordered.front();
        for (const auto& variant : degradedVariants(first)) {
            push_unique(ordered, variant);
        }
    }
    return ordered;
}

} // namespace UrlFallbackChain
