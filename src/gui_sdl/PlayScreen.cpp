#include "gui_sdl/PlayScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdio>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "view/FrameView.hpp"

namespace blockfall::gui_sdl {

PlayScreen::PlayScreen(const core::GameConfig& config)
    : config_{config}
{
    newGame();
}

void PlayScreen::newGame()
{
    // Old loop must stop before the state it points to goes away
    loop_.reset();
    game_ = std::make_unique<core::GameState>(controller::createGame(config_));
    loop_ = controller::startGameLoop(
        *game_, frames_,
        [this](const core::GameState& game) { onRender(game); },
        config_);
}

void PlayScreen::onRender(const core::GameState& game)
{
    snapshot_.rows = game.board().rows();
    snapshot_.cols = game.board().cols();
    snapshot_.cells = view::composeFrame(game);
    snapshot_.score = view::scoreText(game);

    if (game.isOver() && !snapshot_.over) {
        std::fprintf(stderr, "[SDL] Game over, final score %llu\n",
                     static_cast<unsigned long long>(game.score()));
    }
    snapshot_.over = game.isOver();
}

PlayScreen::Layout PlayScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int margin = 20;
    const int hintReserve = 40;

    const int usableW = std::max(windowW - margin * 2, 1);
    const int usableH = std::max(windowH - margin * 2 - hintReserve, 1);

    L.cell = view::fitCellSize(usableW, usableH, snapshot_.rows, snapshot_.cols);
    L.boardW = snapshot_.cols * L.cell;
    L.boardH = snapshot_.rows * L.cell;
    L.boardX = (windowW - L.boardW) / 2;
    L.boardY = margin;
    return L;
}

void PlayScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN) return;

    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
            loop_->handleAction(controller::InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
            loop_->handleAction(controller::InputAction::MoveRight);
            break;
        case SDLK_DOWN:
            loop_->handleAction(controller::InputAction::SoftDrop);
            break;
        case SDLK_UP:
            loop_->handleAction(controller::InputAction::Rotate);
            break;
        case SDLK_RETURN:
            if (loop_->isFinished()) {
                newGame();
            }
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void PlayScreen::update(Application&)
{
    frames_.runFrame(controller::Clock::now());
}

void PlayScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    if (snapshot_.rows <= 0 || snapshot_.cols <= 0) return;

    const Layout L = computeLayout(winW, winH);
    renderBoard(app.renderer(), L);
    renderOverlayText(L);
}

void PlayScreen::renderBoard(SDL_Renderer* renderer, const Layout& L) const
{
    const int rows = snapshot_.rows;
    const int cols = snapshot_.cols;

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const auto value = snapshot_.cells[static_cast<std::size_t>(r * cols + c)];
            const view::Rgb rgb = view::colorFor(value);

            SDL_Rect cell{L.boardX + c * L.cell, L.boardY + r * L.cell, L.cell, L.cell};
            SDL_SetRenderDrawColor(renderer, rgb.r, rgb.g, rgb.b, 255);
            SDL_RenderFillRect(renderer, &cell);

            // Black outline around every block
            SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
            SDL_RenderDrawRect(renderer, &cell);
        }
    }

    if (snapshot_.over) {
        // Dark band across the middle third of the board
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 190);
        SDL_Rect band{L.boardX, L.boardY + L.boardH / 3, L.boardW, L.boardH / 3};
        SDL_RenderFillRect(renderer, &band);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void PlayScreen::renderOverlayText(const Layout& L) const
{
    ImDrawList* dl = ImGui::GetForegroundDrawList();
    ImGuiIO& io = ImGui::GetIO();
    ImFont* bigFont = (io.Fonts->Fonts.Size > 1) ? io.Fonts->Fonts[1] : ImGui::GetFont();

    // Score in the top-left corner of the board
    const float scoreSize = std::max(L.cell * 0.6f, 10.0f);
    dl->AddText(bigFont, scoreSize,
                ImVec2(L.boardX + L.cell * 0.5f, L.boardY + L.cell * 0.5f),
                IM_COL32(255, 255, 255, 255),
                snapshot_.score.c_str());

    // Hint under the board
    const ImVec2 hintSize = ImGui::CalcTextSize(view::ControlsHint);
    dl->AddText(ImVec2(L.boardX + (L.boardW - hintSize.x) * 0.5f, L.boardY + L.boardH + 8.0f),
                IM_COL32(156, 163, 175, 255),
                view::ControlsHint);

    if (!snapshot_.over) return;

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;
    const float captionSize = static_cast<float>(std::max(L.cell, 12));

    const ImVec2 tSize = bigFont->CalcTextSizeA(captionSize, FLT_MAX, 0.0f, view::GameOverCaption);
    dl->AddText(bigFont, captionSize,
                ImVec2(cx - tSize.x * 0.5f, cy - tSize.y * 0.5f),
                IM_COL32(255, 0, 0, 255),
                view::GameOverCaption);

    const char* hint = "Press Enter to play again";
    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + tSize.y),
                IM_COL32(220, 220, 220, 255),
                hint);
}

} // namespace blockfall::gui_sdl
