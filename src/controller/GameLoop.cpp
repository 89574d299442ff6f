#include "controller/GameLoop.hpp"

#include <stdexcept>
#include <utility>

namespace blockfall::controller {

GameLoop::GameLoop(core::GameState& game,
                   IFrameScheduler& scheduler,
                   RenderCallback onRender,
                   Duration gravityInterval,
                   std::optional<std::uint32_t> seed)
    : game_{game}
    , scheduler_{scheduler}
    , onRender_{std::move(onRender)}
    , pieces_{game, seed}
    , gravityInterval_{gravityInterval}
{
    if (gravityInterval_ <= Duration::zero()) {
        throw std::invalid_argument("GameLoop: gravity interval must be positive");
    }
}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::start(Clock::time_point now) {
    if (started_ || stopped_) return;
    started_ = true;
    lastFrame_ = now;

    if (!game_.activePiece() && !game_.isOver()) {
        pieces_.spawn();
    }

    // First iteration runs right away with no elapsed time
    if (game_.isOver()) {
        render();
        finished_ = true;
        return;
    }
    iterate(Clock::duration::zero());
}

void GameLoop::stop() {
    if (stopped_) return;
    stopped_ = true;
    ++generation_;

    if (pendingFrame_) {
        scheduler_.cancelFrame(*pendingFrame_);
        pendingFrame_.reset();
    }
}

void GameLoop::scheduleNext() {
    const std::uint64_t generation = ++generation_;
    pendingFrame_ = scheduler_.requestFrame(
        [this, generation](Clock::time_point now) { onFrame(generation, now); });
}

void GameLoop::onFrame(std::uint64_t generation, Clock::time_point now) {
    // Stale delivery (loop stopped or rescheduled since): leave the game alone
    if (generation != generation_ || stopped_ || finished_) return;
    pendingFrame_.reset();

    if (game_.isOver()) {
        // Final frame shows the terminal board; nothing is scheduled after it
        render();
        finished_ = true;
        return;
    }

    Clock::duration elapsed = Clock::duration::zero();
    if (lastFrame_) {
        elapsed = now - *lastFrame_;
    }
    lastFrame_ = now;

    iterate(elapsed);
}

void GameLoop::iterate(Clock::duration elapsed) {
    accumulated_ += elapsed;

    // At most one drop per iteration, even after a long pause
    if (accumulated_ > gravityInterval_) {
        pieces_.drop();
        accumulated_ = Clock::duration::zero();
    }

    render();

    // The render callback may have stopped the loop
    if (!stopped_) {
        scheduleNext();
    }
}

void GameLoop::render() {
    if (onRender_) {
        onRender_(game_);
    }
}

void GameLoop::handleAction(InputAction action) {
    switch (action) {
    case InputAction::MoveLeft:
        moveLeft();
        break;
    case InputAction::MoveRight:
        moveRight();
        break;
    case InputAction::SoftDrop:
        softDrop();
        break;
    case InputAction::Rotate:
        rotate();
        break;
    }
}

void GameLoop::moveLeft() {
    if (!acceptsInput()) return;
    pieces_.moveLeft();
}

void GameLoop::moveRight() {
    if (!acceptsInput()) return;
    pieces_.moveRight();
}

void GameLoop::softDrop() {
    if (!acceptsInput()) return;
    pieces_.drop();
    // Manual drop restarts the gravity countdown
    accumulated_ = Clock::duration::zero();
}

void GameLoop::rotate() {
    if (!acceptsInput()) return;
    pieces_.rotate();
}

core::GameState createGame(const core::GameConfig& config) {
    config.validate();
    return core::createGame(config.rows, config.cols);
}

std::unique_ptr<GameLoop> startGameLoop(core::GameState& game,
                                        IFrameScheduler& scheduler,
                                        GameLoop::RenderCallback onRender,
                                        const core::GameConfig& config)
{
    config.validate();
    auto loop = std::make_unique<GameLoop>(game,
                                           scheduler,
                                           std::move(onRender),
                                           GameLoop::Duration{config.gravityIntervalMs},
                                           config.seed);
    loop->start();
    return loop;
}

} // namespace blockfall::controller
