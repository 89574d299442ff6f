#pragma once

#include <SDL.h>

namespace blockfall::gui_sdl {

class Application;

// Base interface for screens hosted by Application
class Screen {
public:
    virtual ~Screen() = default;

    // Handle SDL events (keyboard/mouse/window)
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Advance the simulation; called once per display refresh
    virtual void update(Application& app) = 0;

    // Render ImGui + any SDL rendering
    virtual void render(Application& app) = 0;
};

} // namespace blockfall::gui_sdl
