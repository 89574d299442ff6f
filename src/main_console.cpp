#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"
#include "controller/FrameScheduler.hpp"
#include "controller/GameLoop.hpp"
#include "core/GameState.hpp"
#include "view/FrameView.hpp"

using namespace blockfall;

namespace {

// One ASCII glyph per cell value
constexpr char Glyphs[] = ".IOSZTJL";

// Helper: render the composed frame (board + active piece) as ASCII
void printGame(const core::GameState& game) {
    const int rows = game.board().rows();
    const int cols = game.board().cols();
    const auto frame = view::composeFrame(game);

    std::cout << "\n==== BLOCKFALL CONSOLE VIEW ====\n";
    std::cout << view::scoreText(game)
              << " | Lines: " << game.linesCleared()
              << " | Pieces: " << game.lockedPieces() << '\n';

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|';
        for (int c = 0; c < cols; ++c) {
            const auto v = frame[static_cast<std::size_t>(r * cols + c)];
            std::cout << (core::isValidCellValue(v) ? Glyphs[v] : '?');
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    if (game.isOver()) {
        std::cout << view::GameOverCaption << '\n';
    }
}

void printCommands() {
    std::cout << "Commands:\n"
              << "  a = left, d = right, s = soft drop, w = rotate\n"
              << "  g = wait one gravity interval, . = next frame, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    app::CommandLine options;
    try {
        options = app::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "blockfall_console: " << e.what() << "\n\n"
                  << app::usage(argv[0]);
        return 1;
    }

    if (options.showHelp) {
        std::cout << app::usage(argv[0]);
        return 0;
    }

    const core::GameConfig& config = options.config;
    std::cerr << "[CONSOLE] Board " << config.rows << "x" << config.cols
              << ", gravity " << config.gravityIntervalMs << " ms\n";

    try {
        core::GameState game = controller::createGame(config);
        controller::FrameQueue frames;

        // Virtual clock: frames advance only when the player types a command
        const auto frameStep = std::chrono::milliseconds{16};
        auto now = controller::Clock::now();

        auto loop = controller::startGameLoop(game, frames, printGame, config);

        std::string cmd;
        printCommands();

        while (!loop->isFinished()) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, cmd)) {
                break; // EOF
            }
            if (cmd.empty()) {
                continue;
            }

            const char c = cmd[0];
            if (c == 'q' || c == 'Q') {
                std::cout << "Quitting.\n";
                break;
            }

            auto step = std::chrono::duration_cast<controller::Clock::duration>(frameStep);

            switch (c) {
            case 'a': case 'A':
                loop->moveLeft();
                break;
            case 'd': case 'D':
                loop->moveRight();
                break;
            case 's': case 'S':
                loop->softDrop();
                break;
            case 'w': case 'W':
                loop->rotate();
                break;
            case 'g': case 'G':
                step = loop->gravityInterval() + std::chrono::milliseconds{1};
                break;
            case '.':
                break;
            default:
                std::cout << "Unknown command: " << c << '\n';
                printCommands();
                continue;
            }

            now += step;
            frames.runFrame(now);
        }

        loop->stop();
        std::cerr << "[CONSOLE] Final score " << game.score()
                  << ", lines " << game.linesCleared() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "blockfall_console: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
