#ifndef CACHEDFEEDSOURCE_H
#define CACHEDFEEDSOURCE_H

#include <cstddef>
#include <optional>
#include <vector>

#include "MediaItem.h"

class SwrCache;

// Page of feed items as stored in the MediaList cache category.
struct FeedPage {
    std::vector<MediaItem> items;
};

void to_json(nlohmann::json& j, const FeedPage& page);
void from_json(const nlohmann::json& j, FeedPage& page);

// Fronts a slow feed source with the metadata cache, one cache entry per page.
class CachedFeedSource : public IFeedSource {
  public:
    CachedFeedSource(IFeedSource& upstream, SwrCache& cache, std::size_t page_size = 10);

    std::size_t itemCount() const override;
    std::optional<MediaItem> itemAt(int index) override;

    void invalidate();

  private:
    FeedPage fetchPage(std::size_t page) const;

    IFeedSource& m_upstream;
    SwrCache& m_cache;
    std::size_t m_page_size;
};

#endif // CACHEDFEEDSOURCE_H
