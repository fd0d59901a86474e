#include <cctype>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/GameSession.hpp"
#include "core/LevelData.hpp"
#include "controller/CommandLine.hpp"
#include "controller/GameController.hpp"

using namespace snake_escape::core;
using snake_escape::controller::GameController;

namespace {

// Prints every domain event as it is published
class ConsoleEventLog : public IEventListener {
public:
    void onEvent(const DomainEvent& event) override {
        std::cout << "[EVENT] " << describe(event) << '\n';
    }
};

LevelData demoLevel() {
    LevelData level;
    level.width  = 12;
    level.height = 8;

    for (int x = 0; x < level.width; ++x) {
        level.walls.push_back({x, 0});
        level.walls.push_back({x, level.height - 1});
    }
    for (int y = 1; y < level.height - 1; ++y) {
        level.walls.push_back({0, y});
        level.walls.push_back({level.width - 1, y});
    }

    level.snakes.push_back({SnakeColor::Red, {{3, 2}, {2, 2}, {1, 2}}});
    level.snakes.push_back({SnakeColor::Green, {{3, 5}, {2, 5}}});

    level.exits.push_back({SnakeColor::Red, 4, {10, 2}});
    level.exits.push_back({SnakeColor::Green, 2, {10, 5}});
    level.fruits.push_back({{SnakeColor::Red}, {5, 3}});

    level.boxes.push_back({{4, 2}});
    level.iceCubes.push_back({{4, 5}});
    level.holes.push_back({8, 3});

    level.plates.push_back({GroupColor::Yellow, {6, 1}});
    level.liftGates.push_back({GroupColor::Yellow, {8, 2}});
    level.laserGates.push_back({GroupColor::Yellow, {9, 5}});

    level.portals.push_back({1, {6, 6}});
    level.portals.push_back({1, {2, 1}});
    return level;
}

char snakeGlyph(SnakeColor color, bool head) {
    char c = 'r';
    switch (color) {
    case SnakeColor::Red:    c = 'r'; break;
    case SnakeColor::Green:  c = 'g'; break;
    case SnakeColor::Blue:   c = 'b'; break;
    case SnakeColor::Yellow: c = 'y'; break;
    }
    return head ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
}

// Lowest value wins when several entities share a cell
int glyphRank(const EntityData& data, char& glyph) {
    if (std::holds_alternative<Box>(data))     { glyph = 'B'; return 0; }
    if (std::holds_alternative<IceCube>(data)) { glyph = 'I'; return 0; }
    if (std::holds_alternative<Wall>(data))    { glyph = '#'; return 1; }
    if (std::holds_alternative<Exit>(data))    { glyph = 'E'; return 2; }
    if (std::holds_alternative<Fruit>(data))   { glyph = '*'; return 2; }
    if (const auto* g = std::get_if<LiftGate>(&data)) { glyph = g->open ? '=' : 'H'; return 3; }
    if (const auto* l = std::get_if<LaserGate>(&data)) { glyph = l->active ? '!' : ':'; return 3; }
    if (const auto* p = std::get_if<Portal>(&data)) { glyph = p->active ? '@' : 'o'; return 4; }
    if (const auto* p = std::get_if<PressurePlate>(&data)) { glyph = p->active ? '+' : '_'; return 5; }
    if (std::holds_alternative<Hole>(data))    { glyph = 'O'; return 6; }
    glyph = '.';
    return 9;
}

void printSession(const GameSession& session) {
    const World& world = session.world();
    const Board& board = world.board();

    std::vector<std::string> lines(board.height(), std::string(board.width(), '.'));
    for (int y = 0; y < board.height(); ++y) {
        for (int x = 0; x < board.width(); ++x) {
            int best = 9;
            for (EntityId id : board.get({x, y})) {
                char glyph = '.';
                const int rank = glyphRank(board.entity(id).data, glyph);
                if (rank < best) {
                    best = rank;
                    lines[y][x] = glyph;
                }
            }
        }
    }
    for (const auto& snake : world.snakes()) {
        const auto& body = snake.body();
        for (std::size_t i = 0; i < body.size(); ++i) {
            lines[body[i].y][body[i].x] = snakeGlyph(snake.color(), i == 0);
        }
    }

    std::cout << "\n==== SNAKE ESCAPE CONSOLE VIEW ====\n";
    std::cout << "Status: ";
    switch (session.status()) {
    case LevelStatus::NotLoaded: std::cout << "NotLoaded"; break;
    case LevelStatus::Running:   std::cout << "Running";   break;
    case LevelStatus::Won:       std::cout << "Won";       break;
    }
    std::cout << " | Snakes:";
    for (const auto& snake : world.snakes()) {
        std::cout << ' ' << snake.id() << '=' << toString(snake.color())
                  << "(len " << snake.length() << ')';
    }
    std::cout << '\n';

    // origin is bottom-left: print the top row first
    for (int y = board.height() - 1; y >= 0; --y) {
        std::cout << (y % 10) << ' ' << lines[y] << '\n';
    }
    std::cout << "  ";
    for (int x = 0; x < board.width(); ++x) {
        std::cout << (x % 10);
    }
    std::cout << '\n';
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  move <snake> head|tail <x> <y>   move a snake end\n"
              << "  drag <x1> <y1> <x2> <y2>         move the snake end at (x1,y1)\n"
              << "  busy on|off                      simulate an animation in flight\n"
              << "  reload, help, quit\n"
              << "Legend: # wall, B box, I ice, O hole, * fruit, E exit, _/+ plate,\n"
              << "        H/= lift gate closed/open, !/: laser on/off, @/o portal on/off\n";
}

} // namespace

int main(int argc, char** argv) {
    RuleConfig config;
    try {
        config = snake_escape::controller::parseRuleConfig(
            std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n'
                  << "Usage: " << argv[0]
                  << " [--reversible <color>] [--wrapping <color>] [--max-slide <n>]\n";
        return 1;
    }

    GameSession session{config};
    ConsoleEventLog log;
    session.addListener(log);
    GameController controller{session};

    try {
        session.loadLevel(demoLevel());
    } catch (const std::exception& e) {
        std::cerr << "Failed to load level: " << e.what() << '\n';
        return 1;
    }

    printSession(session);
    printHelp();

    std::string line;
    while (!controller.quitRequested()) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }
        if (line.empty()) {
            continue;
        }

        const auto command = snake_escape::controller::parseCommand(line);
        if (!command) {
            std::cout << "Unknown command: " << line << '\n';
            continue;
        }
        if (std::holds_alternative<snake_escape::controller::HelpCommand>(*command)) {
            printHelp();
            continue;
        }

        const auto result = controller.handleCommand(*command);
        if (result && !result->accepted()) {
            std::cout << "[MOVE] rejected: " << toString(result->status) << '\n';
        }
        if (controller.quitRequested()) {
            std::cout << "Quitting.\n";
            break;
        }

        printSession(session);
        if (session.status() == LevelStatus::Won) {
            std::cout << "LEVEL COMPLETE. Type 'reload' to play again or 'quit' to exit.\n";
        }
    }

    return 0;
}
