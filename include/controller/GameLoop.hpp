#pragma once

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/PieceController.hpp"
#include "controller/FrameScheduler.hpp"
#include "controller/InputAction.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace blockfall::controller {

class GameLoop {
public:
    using Duration = std::chrono::milliseconds;
    using RenderCallback = std::function<void(const core::GameState&)>;

    static constexpr Duration DefaultGravityInterval{1000};

    /// The loop does not own the GameState or the scheduler; both must outlive it.
    /// Throws std::invalid_argument for a non-positive gravity interval.
    GameLoop(core::GameState& game,
             IFrameScheduler& scheduler,
             RenderCallback onRender,
             Duration gravityInterval = DefaultGravityInterval,
             std::optional<std::uint32_t> seed = std::nullopt);

    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    // Spawns the first piece if needed, renders, and schedules the next frame.
    // `now` starts the frame clock. No-op if already started or stopped.
    void start(Clock::time_point now = Clock::now());

    // Cancels the pending frame. Idempotent; once stopped, nothing mutates the game.
    void stop();

    bool isRunning() const noexcept { return started_ && !stopped_ && !finished_; }
    bool isStopped() const noexcept { return stopped_; }

    // True once the game-over frame has been rendered
    bool isFinished() const noexcept { return finished_; }

    // Player input, applied immediately (no buffering)
    void handleAction(InputAction action);
    void moveLeft();
    void moveRight();
    void softDrop();
    void rotate();

    Duration gravityInterval() const noexcept { return gravityInterval_; }
    Clock::duration accumulated() const noexcept { return accumulated_; }

    const core::GameState& game() const noexcept { return game_; }
    core::PieceController& pieces() noexcept { return pieces_; }

private:
    core::GameState& game_;
    IFrameScheduler& scheduler_;
    RenderCallback onRender_;
    core::PieceController pieces_;

    Duration gravityInterval_;
    Clock::duration accumulated_{Clock::duration::zero()};
    std::optional<Clock::time_point> lastFrame_;

    std::optional<IFrameScheduler::FrameId> pendingFrame_;
    std::uint64_t generation_{0}; // bumped on every schedule/stop; stale callbacks carry an old value

    bool started_{false};
    bool stopped_{false};
    bool finished_{false};

    bool acceptsInput() const noexcept { return started_ && !stopped_ && !finished_; }

    void onFrame(std::uint64_t generation, Clock::time_point now);
    void iterate(Clock::duration elapsed);
    void scheduleNext();
    void render();
};

/// Fresh GameState sized from the config
core::GameState createGame(const core::GameConfig& config);

/// Build and start a loop; the returned handle stops the loop when destroyed.
std::unique_ptr<GameLoop> startGameLoop(core::GameState& game,
                                        IFrameScheduler& scheduler,
                                        GameLoop::RenderCallback onRender,
                                        const core::GameConfig& config = core::GameConfig{});

} // namespace blockfall::controller
