#include "Core/SystemHandler.h"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

#include "Core/UpdateManager.h"
#include "MediaEngine.h"

void SystemHandler::process_system(MediaEngine& engine, const EngineMessage& msg) {
    std::visit([this, &engine](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if      constexpr (std::is_same_v<T, Msg::UpdateAndPoll>) handle_updateAndPoll(engine);
        else if constexpr (std::is_same_v<T, Msg::Quit>)         handle_quit(engine);
    }, msg);
}

void SystemHandler::handle_updateAndPoll(MediaEngine& engine) {
    engine.m_update_manager->process_updates(engine);
}

void SystemHandler::handle_quit(MediaEngine& engine) {
    spdlog::debug("SystemHandler: quit requested");
    engine.m_quit_flag = true;
}
