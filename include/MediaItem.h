#ifndef MEDIAITEM_H
#define MEDIAITEM_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// One entry of the feed. Supplied by the data layer and never mutated by the engine.
struct MediaItem {
    std::string id;
    std::string url;
    std::vector<std::string> fallback_urls;
    double duration_s = 0.0;
    double aspect_ratio = 9.0 / 16.0;
};

void to_json(nlohmann::json& j, const MediaItem& item);
void from_json(const nlohmann::json& j, MediaItem& item);

// The ordered feed as seen by the scheduler.
class IFeedSource {
  public:
    virtual ~IFeedSource() = default;

    virtual std::size_t itemCount() const = 0;
    // Out-of-range indices yield nullopt. May block on the data service.
    virtual std::optional<MediaItem> itemAt(int index) = 0;
};

// Feed backed by an in-memory list, e.g. loaded from a feed file.
class StaticFeedSource : public IFeedSource {
  public:
    explicit StaticFeedSource(std::vector<MediaItem> items);

    std::size_t itemCount() const override;
    std::optional<MediaItem> itemAt(int index) override;

  private:
    std::vector<MediaItem> m_items;
};

#endif // MEDIAITEM_H
