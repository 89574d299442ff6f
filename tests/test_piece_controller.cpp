#include <catch2/catch.hpp>

#include <random>
#include <set>
#include <stdexcept>
#include <vector>

#include "core/GameState.hpp"
#include "core/PieceController.hpp"
#include "core/PieceGenerator.hpp"
#include "core/Types.hpp"

using namespace blockfall::core;

TEST_CASE("PieceController spawns centered on the top row", "[pieces][spawn]") {
    GameState game{20, 10};
    PieceController pieces{game, 1u};

    REQUIRE(pieces.phase() == PiecePhase::Spawning);

    REQUIRE(pieces.spawn(PieceType::O));
    REQUIRE(pieces.phase() == PiecePhase::Falling);
    CHECK(game.activePiece()->origin.row == 0);
    CHECK(game.activePiece()->origin.col == 4);

    REQUIRE(pieces.spawn(PieceType::I));
    CHECK(game.activePiece()->origin.col == 3);

    REQUIRE(pieces.spawn(PieceType::T));
    CHECK(game.activePiece()->origin.col == 4);
}

TEST_CASE("PieceController random spawn picks one of the seven shapes", "[pieces][spawn]") {
    GameState game{20, 10};
    PieceController pieces{game, 7u};

    REQUIRE(pieces.spawn());
    REQUIRE(game.activePiece().has_value());
    REQUIRE(game.activePiece()->origin.row == 0);
}

TEST_CASE("PieceController stops at the left wall", "[pieces][move]") {
    GameState game{20, 10};
    PieceController pieces{game};
    pieces.spawn(PieceType::O);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(pieces.moveLeft());
    }
    REQUIRE(game.activePiece()->origin.col == 0);

    REQUIRE_FALSE(pieces.moveLeft());
    REQUIRE(game.activePiece()->origin.col == 0);
}

TEST_CASE("PieceController stops at the right wall", "[pieces][move]") {
    GameState game{20, 10};
    PieceController pieces{game};
    pieces.spawn(PieceType::O);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(pieces.moveRight());
    }
    REQUIRE(game.activePiece()->origin.col == 8);

    REQUIRE_FALSE(pieces.moveRight());
    REQUIRE(game.activePiece()->origin.col == 8);
}

TEST_CASE("PieceController will not move into locked cells", "[pieces][move]") {
    GameState game{20, 10};
    game.board().setCell(0, 3, 1);

    PieceController pieces{game};
    pieces.spawn(PieceType::O);

    REQUIRE_FALSE(pieces.moveLeft());
    REQUIRE(game.activePiece()->origin.col == 4);
}

TEST_CASE("PieceController::move only accepts unit directions", "[pieces][move]") {
    GameState game{20, 10};
    PieceController pieces{game};
    pieces.spawn(PieceType::O);

    REQUIRE_THROWS_AS(pieces.move(2), std::invalid_argument);
    REQUIRE_THROWS_AS(pieces.move(0), std::invalid_argument);
}

TEST_CASE("PieceController four rotations in open space restore the piece", "[pieces][rotate]") {
    GameState game{20, 10};
    PieceController pieces{game};

    for (PieceType type : AllPieceTypes) {
        pieces.spawn(type);
        const PieceShape original = game.activePiece()->shape;
        const Position origin = game.activePiece()->origin;

        for (int i = 0; i < 4; ++i) {
            REQUIRE(pieces.rotate());
        }

        REQUIRE(game.activePiece()->shape == original);
        REQUIRE(game.activePiece()->origin.col == origin.col);
        REQUIRE(game.activePiece()->origin.row == origin.row);
    }
}

TEST_CASE("PieceController kick search shifts a blocked rotation sideways", "[pieces][rotate][kick]") {
    GameState game{20, 10};
    PieceController pieces{game};

    // Vertical I at column 7
    pieces.spawn(PieceType::I);
    REQUIRE(pieces.rotate());
    REQUIRE(game.activePiece()->shape.width() == 1);
    for (int i = 0; i < 4; ++i) {
        REQUIRE(pieces.moveRight());
    }
    REQUIRE(game.activePiece()->origin.col == 7);

    // Horizontal at 7 and 8 overhang the wall; the search lands on 6
    REQUIRE(pieces.rotate());
    CHECK(game.activePiece()->shape.width() == 4);
    CHECK(game.activePiece()->origin.col == 6);
}

TEST_CASE("PieceController abandons a rotation the kick search cannot place", "[pieces][rotate][kick]") {
    GameState game{20, 10};
    PieceController pieces{game};

    // Vertical I against the right wall
    pieces.spawn(PieceType::I);
    REQUIRE(pieces.rotate());
    while (pieces.moveRight()) {
    }
    REQUIRE(game.activePiece()->origin.col == 9);

    const PieceShape vertical = game.activePiece()->shape;

    REQUIRE_FALSE(pieces.rotate());
    CHECK(game.activePiece()->shape == vertical);
    CHECK(game.activePiece()->origin.col == 9);
}

TEST_CASE("PieceController drop descends, then locks at the floor", "[pieces][drop]") {
    GameState game{20, 10};
    PieceController pieces{game, 3u};
    pieces.spawn(PieceType::O);

    for (int i = 0; i < 18; ++i) {
        REQUIRE(pieces.drop());
    }
    REQUIRE(game.activePiece()->origin.row == 18);

    // Blocked by the floor: locks and spawns the next piece
    REQUIRE_FALSE(pieces.drop());

    CHECK(game.board().cell(18, 4) == 2);
    CHECK(game.board().cell(18, 5) == 2);
    CHECK(game.board().cell(19, 4) == 2);
    CHECK(game.board().cell(19, 5) == 2);
    CHECK(game.lockedPieces() == 1);
    CHECK(game.score() == 0);

    REQUIRE(game.activePiece().has_value());
    CHECK(game.activePiece()->origin.row == 0);
    CHECK_FALSE(game.isOver());
}

TEST_CASE("PieceController drop without an active piece spawns one", "[pieces][drop]") {
    GameState game{20, 10};
    PieceController pieces{game};

    REQUIRE_FALSE(pieces.drop());
    REQUIRE(game.activePiece().has_value());
    REQUIRE(pieces.phase() == PiecePhase::Falling);
}

TEST_CASE("PieceController lock clears a completed line and scores it", "[pieces][lines]") {
    GameState game{20, 10};
    for (int c = 4; c < 10; ++c) {
        game.board().setCell(19, c, 1);
    }

    PieceController pieces{game};
    pieces.spawn(PieceType::I);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(pieces.moveLeft());
    }
    REQUIRE(game.activePiece()->origin.col == 0);

    while (pieces.drop()) {
    }

    CHECK(game.score() == 10);
    CHECK(game.linesCleared() == 1);

    // Row 19 now holds the empty row that was above it
    for (int c = 0; c < 10; ++c) {
        CHECK(game.board().cell(19, c) == EmptyCell);
    }
}

TEST_CASE("PieceController scores two lines from one lock as 40", "[pieces][lines]") {
    GameState game{20, 10};
    for (int c = 2; c < 10; ++c) {
        game.board().setCell(18, c, 3);
        game.board().setCell(19, c, 3);
    }

    PieceController pieces{game};
    pieces.spawn(PieceType::O);
    while (pieces.moveLeft()) {
    }

    while (pieces.drop()) {
    }

    CHECK(game.score() == 40);
    CHECK(game.linesCleared() == 2);
}

TEST_CASE("PieceController scores four lines from one lock as 160", "[pieces][lines]") {
    GameState game{20, 10};
    for (int r = 16; r < 20; ++r) {
        for (int c = 1; c < 10; ++c) {
            game.board().setCell(r, c, 5);
        }
    }

    PieceController pieces{game};
    pieces.spawn(PieceType::I);
    REQUIRE(pieces.rotate());
    while (pieces.moveLeft()) {
    }
    REQUIRE(game.activePiece()->origin.col == 0);

    while (pieces.drop()) {
    }

    CHECK(game.score() == 160);
    for (CellValue v : game.board().cells()) {
        REQUIRE(v == EmptyCell);
    }
}

TEST_CASE("PieceController ends the game when a piece cannot spawn", "[pieces][gameover]") {
    GameState game{20, 10};
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 10; ++c) {
            game.board().setCell(r, c, 1);
        }
    }

    PieceController pieces{game, 11u};
    REQUIRE_FALSE(pieces.spawn());
    REQUIRE(game.isOver());
    REQUIRE(pieces.phase() == PiecePhase::GameOver);

    const Position before = game.activePiece()->origin;
    const std::vector<CellValue> cellsBefore = game.board().cells();

    REQUIRE_FALSE(pieces.moveLeft());
    REQUIRE_FALSE(pieces.moveRight());
    REQUIRE_FALSE(pieces.rotate());
    REQUIRE_FALSE(pieces.drop());
    REQUIRE_FALSE(pieces.spawn(PieceType::O));

    CHECK(game.activePiece()->origin.col == before.col);
    CHECK(game.activePiece()->origin.row == before.row);
    CHECK(game.board().cells() == cellsBefore);
    CHECK(game.isOver());
}

TEST_CASE("PieceGenerator is deterministic for a seed and covers all types", "[pieces][generator]") {
    PieceGenerator a{42u};
    PieceGenerator b{42u};

    std::set<PieceType> seen;
    for (int i = 0; i < 500; ++i) {
        const PieceType t = a.next();
        REQUIRE(t == b.next());
        const int id = static_cast<int>(t);
        REQUIRE(id >= 1);
        REQUIRE(id <= 7);
        seen.insert(t);
    }
    REQUIRE(seen.size() == 7);
}

TEST_CASE("Random play keeps every cell valid and the grid size fixed", "[pieces][invariants]") {
    GameState game{20, 10};
    PieceController pieces{game, 2024u};
    std::mt19937 rng{99u};
    std::uniform_int_distribution<int> action(0, 4);

    pieces.spawn();
    std::uint64_t lastScore = 0;

    for (int step = 0; step < 20000 && !game.isOver(); ++step) {
        switch (action(rng)) {
        case 0: pieces.moveLeft(); break;
        case 1: pieces.moveRight(); break;
        case 2: pieces.rotate(); break;
        default: pieces.drop(); break;
        }

        REQUIRE(game.board().cells().size() == 200);
        REQUIRE(game.score() >= lastScore);
        lastScore = game.score();
    }

    for (CellValue v : game.board().cells()) {
        REQUIRE(isValidCellValue(v));
    }
}
