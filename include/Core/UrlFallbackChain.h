#ifndef URLFALLBACKCHAIN_H
#define URLFALLBACKCHAIN_H

#include <optional>
#include <string>
#include <vector>

struct MediaItem;

// Degraded URL variants shared by the fetch cache and the resource pool.
namespace UrlFallbackChain {

// One notch lower streaming profile or quality preset, if the URL names one.
std::optional<std::string> reducedQuality(const std::string& url);

// The asset URL with every delivery transformation removed.
std::optional<std::string> canonical(const std::string& url);

// The canonical URL with the cheapest quality preset applied.
std::optional<std::string> minimalQuality(const std::string& url);

// reducedQuality, canonical, minimalQuality in that order, without the
// input URL and without duplicates.
std::vector<std::string> degradedVariants(const std::string& url);

bool isAdaptive(const std::string& url);

// Playback candidates in preference order: adaptive playlists, then direct
// files (each in item order), then the degraded variants of the first.
std::vector<std::string> candidateUrls(const MediaItem& item);

} // namespace UrlFallbackChain

#endif // URLFALLBACKCHAIN_H
