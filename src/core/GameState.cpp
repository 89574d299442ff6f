#include "core/GameState.hpp"

namespace blockfall::core {

GameState::GameState(int rows, int cols)
    : board_{rows, cols}
    , scoreManager_{}
    , activePiece_{}
{
}

GameState createGame(int rows, int cols) {
    return GameState{rows, cols};
}

} // namespace blockfall::core
