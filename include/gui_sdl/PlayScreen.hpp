#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gui_sdl/Screen.hpp"
#include "controller/FrameScheduler.hpp"
#include "controller/GameLoop.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"

namespace blockfall::gui_sdl {

// Hosts one game: feeds arrow keys to the loop, delivers one frame per
// display refresh and paints whatever the last render request carried.
class PlayScreen final : public Screen {
public:
    explicit PlayScreen(const core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app) override;
    void render(Application& app) override;

private:
    struct Layout {
        int cell = 28;
        int boardX = 0;
        int boardY = 0;
        int boardW = 0;
        int boardH = 0;
    };

    // Copy of the last state handed to the render callback
    struct Snapshot {
        int rows = 0;
        int cols = 0;
        std::vector<core::CellValue> cells;
        std::string score;
        bool over = false;
    };

    void newGame();
    void onRender(const core::GameState& game);

    Layout computeLayout(int windowW, int windowH) const;
    void renderBoard(SDL_Renderer* renderer, const Layout& L) const;
    void renderOverlayText(const Layout& L) const;

private:
    core::GameConfig config_;
    controller::FrameQueue frames_;

    std::unique_ptr<core::GameState> game_;
    std::unique_ptr<controller::GameLoop> loop_;

    Snapshot snapshot_;
};

} // namespace blockfall::gui_sdl
