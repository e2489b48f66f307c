#ifndef MESSAGE_H
#define MESSAGE_H

#include <string>
#include <variant>

#include "Core/CacheCategory.h"
#include "Core/NetworkQualityEstimator.h" // For ConnectivityState

// Every message the engine actor understands.
namespace Msg {
    struct ViewportChanged {
        int index;
    };
    struct ConnectivityChanged {
        ConnectivityState state;
    };
    // Drops metadata cache entries of a category whose id starts with id_prefix.
    struct InvalidateCache {
        CacheCategory category;
        std::string id_prefix;
    };
    struct PlayCurrent {};
    struct PauseCurrent {};
    struct PauseAll {};
    struct UpdateAndPoll {};
    struct Quit {};
}

using EngineMessage = std::variant<Msg::ViewportChanged,
                                   Msg::ConnectivityChanged,
                                   Msg::InvalidateCache,
                                   Msg::PlayCurrent,
                                   Msg::PauseCurrent,
                                   Msg::PauseAll,
                                   Msg::UpdateAndPoll,
                                   Msg::Quit>;

#endif // MESSAGE_H
