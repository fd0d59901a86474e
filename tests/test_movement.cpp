#include <catch2/catch.hpp>

#include "core/GameSession.hpp"
#include "TestSupport.hpp"

using namespace snake_escape::core;

namespace {

// No-overlap: every cell holds at most one snake segment and no solid object
void requireNoOverlap(const World& world) {
    const Board& board = world.board();
    for (int y = 0; y < board.height(); ++y) {
        for (int x = 0; x < board.width(); ++x) {
            int segments = 0;
            for (const auto& s : world.snakes()) {
                for (const auto& c : s.body()) {
                    if (c == Cell{x, y}) ++segments;
                }
            }
            REQUIRE(segments <= 1);
            if (segments == 1) {
                REQUIRE_FALSE(board.hasOfKind<Wall>({x, y}));
                REQUIRE_FALSE(board.hasOfKind<Box>({x, y}));
                REQUIRE_FALSE(board.hasOfKind<IceCube>({x, y}));
            }
        }
    }
}

} // namespace

TEST_CASE("Head steps onto an adjacent floor cell", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Blue, {{2, 2}, {1, 2}, {0, 2}}});

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    const auto result = session.requestMove(headTo(0, 2, 3));
    REQUIRE(result.accepted());

    const Snake* s = session.world().findSnake(0);
    REQUIRE(s != nullptr);
    CHECK(s->head() == Cell{2, 3});
    CHECK(s->tail() == Cell{1, 2});
    CHECK(s->length() == 3);

    REQUIRE(rec.events.size() == 1);
    REQUIRE(std::holds_alternative<SnakeMoved>(rec.events[0]));
    CHECK(std::get<SnakeMoved>(rec.events[0]).snakeId == 0);
}

TEST_CASE("Targets must be exactly one step away", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Blue, {{2, 2}, {1, 2}}});

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    CHECK(session.requestMove(headTo(0, 4, 2)).status == MoveStatus::NotAdjacent);
    CHECK(session.requestMove(headTo(0, 3, 3)).status == MoveStatus::NotAdjacent);
    CHECK(session.requestMove(headTo(0, 2, 2)).status == MoveStatus::NotAdjacent);
    CHECK(rec.events.empty());
    CHECK(session.world().findSnake(0)->head() == Cell{2, 2});
}

TEST_CASE("Walls, board edges, holes and other snakes obstruct", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Blue, {{0, 2}, {0, 1}, {0, 0}}});
    level.snakes.push_back({SnakeColor::Yellow, {{2, 3}, {2, 4}}});
    level.walls = {{1, 2}};
    level.holes = {{0, 3}};

    GameSession session;
    session.loadLevel(level);

    CHECK(session.requestMove(headTo(0, 1, 2)).status == MoveStatus::Obstructed);
    CHECK(session.requestMove(headTo(0, -1, 2)).status == MoveStatus::Obstructed);
    CHECK(session.requestMove(headTo(0, 0, 3)).status == MoveStatus::Obstructed);
    CHECK(session.requestMove(headTo(0, 0, 1)).status == MoveStatus::Obstructed); // own body
    CHECK(session.requestMove(headTo(1, 2, 4)).status == MoveStatus::Obstructed);

    LevelData blocked = emptyLevel(6, 6);
    blocked.snakes.push_back({SnakeColor::Blue, {{1, 1}, {0, 1}}});
    blocked.snakes.push_back({SnakeColor::Yellow, {{2, 1}, {3, 1}}});
    session.loadLevel(blocked);
    CHECK(session.requestMove(headTo(0, 2, 1)).status == MoveStatus::Obstructed);

    requireNoOverlap(session.world());
}

TEST_CASE("Only the reversible color may move its tail", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Red, {{2, 2}, {3, 2}}});
    level.snakes.push_back({SnakeColor::Blue, {{2, 4}, {3, 4}}});

    GameSession session;
    session.loadLevel(level);

    CHECK(session.requestMove(tailTo(1, 4, 4)).status == MoveStatus::IllegalEnd);

    REQUIRE(session.requestMove(tailTo(0, 4, 2)).accepted());
    const Snake* red = session.world().findSnake(0);
    CHECK(red->head() == Cell{3, 2});
    CHECK(red->tail() == Cell{4, 2});
    CHECK(red->length() == 2);
}

TEST_CASE("Reversible color may be configured", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Red, {{2, 2}, {3, 2}}});
    level.snakes.push_back({SnakeColor::Blue, {{2, 4}, {3, 4}}});

    RuleConfig config;
    config.reversibleColor = SnakeColor::Blue;
    GameSession session{config};
    session.loadLevel(level);

    CHECK(session.requestMove(tailTo(0, 4, 2)).status == MoveStatus::IllegalEnd);
    CHECK(session.requestMove(tailTo(1, 4, 4)).accepted());
}

TEST_CASE("A tail may crawl into the cell its head is leaving", "[movement]") {
    LevelData level = emptyLevel(4, 4);
    level.snakes.push_back({SnakeColor::Red, {{1, 1}, {2, 1}}});

    GameSession session;
    session.loadLevel(level);

    REQUIRE(session.requestMove(tailTo(0, 1, 1)).accepted());
    const Snake* red = session.world().findSnake(0);
    CHECK(red->head() == Cell{2, 1});
    CHECK(red->tail() == Cell{1, 1});
}

TEST_CASE("Wrapping color crosses board edges", "[movement]") {
    LevelData level = emptyLevel(5, 5);
    level.snakes.push_back({SnakeColor::Green, {{0, 2}, {1, 2}}});
    level.snakes.push_back({SnakeColor::Blue, {{0, 0}, {1, 0}}});

    GameSession session;
    session.loadLevel(level);

    REQUIRE(session.requestMove(headTo(0, -1, 2)).accepted());
    CHECK(session.world().findSnake(0)->head() == Cell{4, 2});

    // the wrapped coordinate of the neighbour is accepted as well
    REQUIRE(session.requestMove(headTo(0, 4, 1)).accepted());
    REQUIRE(session.requestMove(headTo(0, 4, 0)).accepted());
    REQUIRE(session.requestMove(headTo(0, 4, 4)).accepted());
    CHECK(session.world().findSnake(0)->head() == Cell{4, 4});
    CHECK(session.world().findSnake(0)->tail() == Cell{4, 0});

    // other colors stop at the edge
    CHECK(session.requestMove(headTo(1, -1, 0)).status == MoveStatus::Obstructed);
    CHECK(session.requestMove(headTo(1, 0, 4)).status == MoveStatus::NotAdjacent);
}

TEST_CASE("Wrapping color may be configured", "[movement]") {
    LevelData level = emptyLevel(5, 5);
    level.snakes.push_back({SnakeColor::Blue, {{0, 2}, {1, 2}}});

    RuleConfig config;
    config.wrappingColor = SnakeColor::Blue;
    GameSession session{config};
    session.loadLevel(level);

    REQUIRE(session.requestMove(headTo(0, -1, 2)).accepted());
    CHECK(session.world().findSnake(0)->head() == Cell{4, 2});
}

TEST_CASE("Eating a matching fruit grows the snake", "[movement]") {
    LevelData level = emptyLevel(8, 8);
    level.snakes.push_back({SnakeColor::Red, {{4, 5}, {3, 5}}});
    level.fruits.push_back({{SnakeColor::Red}, {5, 5}});

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    REQUIRE(session.requestMove(headTo(0, 5, 5)).accepted());

    const Snake* red = session.world().findSnake(0);
    CHECK(red->length() == 3);
    CHECK(red->head() == Cell{5, 5});
    CHECK(red->tail() == Cell{3, 5});
    CHECK_FALSE(session.world().board().hasOfKind<Fruit>({5, 5}));

    REQUIRE(rec.events.size() == 2);
    REQUIRE(std::holds_alternative<FruitConsumed>(rec.events[0]));
    CHECK(std::get<FruitConsumed>(rec.events[0]).position == Cell{5, 5});
    REQUIRE(std::holds_alternative<SnakeGrew>(rec.events[1]));
    CHECK(std::get<SnakeGrew>(rec.events[1]).snakeId == 0);
    CHECK(rec.count<SnakeMoved>() == 0);
}

TEST_CASE("Fruit refuses other colors and tails", "[movement]") {
    LevelData level = emptyLevel(8, 8);
    level.snakes.push_back({SnakeColor::Blue, {{4, 5}, {3, 5}}});
    level.snakes.push_back({SnakeColor::Red, {{1, 1}, {2, 1}}});
    level.fruits.push_back({{SnakeColor::Red}, {5, 5}});
    level.fruits.push_back({{SnakeColor::Red}, {3, 1}});

    GameSession session;
    session.loadLevel(level);

    CHECK(session.requestMove(headTo(0, 5, 5)).status == MoveStatus::InteractionDenied);
    CHECK(session.requestMove(tailTo(1, 3, 1)).status == MoveStatus::InteractionDenied);
    CHECK(session.world().board().hasOfKind<Fruit>({5, 5}));
    CHECK(session.world().board().hasOfKind<Fruit>({3, 1}));
}

TEST_CASE("Last snake through its exit wins the level exactly once", "[movement]") {
    LevelData level = emptyLevel(8, 4);
    level.snakes.push_back({SnakeColor::Red, {{3, 1}, {2, 1}, {1, 1}}});
    level.exits.push_back({SnakeColor::Red, 3, {4, 1}});

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    REQUIRE(session.requestMove(headTo(0, 4, 1)).accepted());

    CHECK(session.world().snakes().empty());
    CHECK(session.status() == LevelStatus::Won);
    CHECK_FALSE(session.world().board().hasOfKind<Exit>({4, 1}));

    REQUIRE(rec.events.size() == 3);
    REQUIRE(std::holds_alternative<ExitConsumed>(rec.events[0]));
    CHECK(std::get<ExitConsumed>(rec.events[0]).position == Cell{4, 1});
    REQUIRE(std::holds_alternative<SnakeRemoved>(rec.events[1]));
    CHECK(std::get<SnakeRemoved>(rec.events[1]).snakeId == 0);
    CHECK(std::holds_alternative<LevelWon>(rec.events[2]));
    CHECK(rec.count<LevelWon>() == 1);
    CHECK(rec.count<FruitSpawned>() == 0);
    CHECK(rec.count<SnakeMoved>() == 0);

    // nothing left to move
    CHECK(session.requestMove(headTo(0, 5, 1)).status == MoveStatus::UnknownSnake);
    CHECK(rec.count<LevelWon>() == 1);
}

TEST_CASE("Exit refuses short or differently colored snakes", "[movement]") {
    LevelData level = emptyLevel(8, 4);
    level.snakes.push_back({SnakeColor::Red, {{3, 1}, {2, 1}}});
    level.snakes.push_back({SnakeColor::Blue, {{3, 3}, {2, 3}, {1, 3}}});
    level.exits.push_back({SnakeColor::Red, 3, {4, 1}});
    level.exits.push_back({SnakeColor::Red, 1, {4, 3}});

    GameSession session;
    session.loadLevel(level);

    CHECK(session.requestMove(headTo(0, 4, 1)).status == MoveStatus::InteractionDenied);
    CHECK(session.requestMove(headTo(1, 4, 3)).status == MoveStatus::InteractionDenied);
    CHECK(session.world().snakes().size() == 2);
    CHECK(session.status() == LevelStatus::Running);
}

TEST_CASE("Leaving through an exit leaves a fruit for the remaining snakes", "[movement]") {
    LevelData level = emptyLevel(8, 6);
    level.snakes.push_back({SnakeColor::Red, {{3, 1}, {2, 1}}});
    level.snakes.push_back({SnakeColor::Blue, {{3, 3}, {2, 3}}});
    level.snakes.push_back({SnakeColor::Green, {{3, 5}, {2, 5}}});
    level.snakes.push_back({SnakeColor::Blue, {{6, 5}, {7, 5}}});
    level.exits.push_back({SnakeColor::Red, 2, {4, 1}});

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    REQUIRE(session.requestMove(headTo(0, 4, 1)).accepted());
    CHECK(session.status() == LevelStatus::Running);
    CHECK(rec.count<LevelWon>() == 0);

    const auto* spawned = rec.first<FruitSpawned>();
    REQUIRE(spawned != nullptr);
    CHECK(spawned->position == Cell{4, 1});
    CHECK(spawned->colors == std::vector<SnakeColor>{SnakeColor::Blue, SnakeColor::Green});

    const Fruit* fruit = session.world().board().firstOfKind<Fruit>({4, 1});
    REQUIRE(fruit != nullptr);
    CHECK(fruit->colors == spawned->colors);
}

TEST_CASE("Active laser slices a snake entering it", "[movement]") {
    LevelData level = emptyLevel(8, 6);
    level.snakes.push_back({SnakeColor::Blue, {{2, 1}, {1, 1}}});
    level.snakes.push_back({SnakeColor::Yellow, {{2, 4}}});
    level.plates     = {{GroupColor::Orange, {6, 5}}};
    level.laserGates = {{GroupColor::Orange, {3, 1}}, {GroupColor::Orange, {3, 4}}};

    GameSession session;
    session.loadLevel(level);
    REQUIRE(session.world().board().firstOfKind<LaserGate>({3, 1})->active);

    RecordingListener rec;
    session.addListener(rec);

    SECTION("the head is cut, the rest survives") {
        REQUIRE(session.requestMove(headTo(0, 3, 1)).accepted());
        const Snake* blue = session.world().findSnake(0);
        REQUIRE(blue != nullptr);
        CHECK(blue->length() == 1);
        CHECK(blue->head() == Cell{2, 1});
        CHECK(rec.count<SnakeSliced>() == 1);
        CHECK(rec.count<SnakeMoved>() == 1);
    }

    SECTION("a single-cell snake is removed without winning") {
        REQUIRE(session.requestMove(headTo(1, 3, 4)).accepted());
        CHECK(session.world().findSnake(1) == nullptr);
        CHECK(rec.count<SnakeRemoved>() == 1);
        CHECK(rec.count<SnakeMoved>() == 0);
        CHECK(rec.count<LevelWon>() == 0);
        CHECK(session.status() == LevelStatus::Running);
    }
}

TEST_CASE("Inactive laser is walkable", "[movement]") {
    LevelData level = emptyLevel(8, 6);
    level.snakes.push_back({SnakeColor::Blue, {{2, 1}, {1, 1}}});
    level.snakes.push_back({SnakeColor::Yellow, {{6, 5}}});
    level.plates     = {{GroupColor::Orange, {6, 5}}};
    level.laserGates = {{GroupColor::Orange, {3, 1}}};

    GameSession session;
    session.loadLevel(level);
    REQUIRE_FALSE(session.world().board().firstOfKind<LaserGate>({3, 1})->active);

    REQUIRE(session.requestMove(headTo(0, 3, 1)).accepted());
    CHECK(session.world().findSnake(0)->length() == 2);
}

TEST_CASE("Rejected requests leave the world untouched", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Blue, {{2, 2}, {1, 2}}});
    level.boxes.push_back({{3, 2}});
    level.walls = {{4, 2}};

    GameSession session;
    session.loadLevel(level);
    RecordingListener rec;
    session.addListener(rec);

    CHECK(session.requestMove(headTo(0, 3, 2)).status == MoveStatus::Obstructed);
    CHECK(session.requestMove(headTo(7, 2, 3)).status == MoveStatus::UnknownSnake);

    session.setPresentationBusy(true);
    CHECK(session.requestMove(headTo(0, 2, 3)).status == MoveStatus::AnimationInProgress);
    session.setPresentationBusy(false);

    CHECK(rec.events.empty());
    CHECK(session.world().findSnake(0)->head() == Cell{2, 2});
    CHECK(session.world().board().hasOfKind<Box>({3, 2}));

    CHECK(session.requestMove(headTo(0, 2, 3)).accepted());
}

TEST_CASE("Snakes never overlap across a move sequence", "[movement]") {
    LevelData level = emptyLevel(6, 6);
    level.snakes.push_back({SnakeColor::Red, {{2, 2}, {1, 2}, {0, 2}}});
    level.snakes.push_back({SnakeColor::Green, {{2, 4}, {1, 4}}});
    level.walls = {{3, 3}};

    GameSession session;
    session.loadLevel(level);

    const MoveRequest moves[] = {
        headTo(0, 2, 3), headTo(0, 2, 4), headTo(1, 3, 4), headTo(0, 1, 3),
        tailTo(0, 0, 1), headTo(1, 3, 5), headTo(1, 3, 0), headTo(0, 3, 3),
    };
    for (const auto& move : moves) {
        session.requestMove(move);
        requireNoOverlap(session.world());
    }
}
