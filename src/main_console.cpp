#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/MatchConfig.hpp"
#include "core/Piece.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

using namespace blokus::core;
using blokus::controller::GameController;
using blokus::controller::InputAction;

namespace {

struct ConsoleOptions {
    MatchConfig match{};
    bool showHints{true}; // mark usable anchors on the board
};

ConsoleOptions parseOptions(int argc, char* argv[]) {
    ConsoleOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--orange-first") {
            options.match.firstPlayer = PlayerColor::Orange;
        } else if (arg == "--auto-pass") {
            options.match.autoPass = true;
        } else if (arg == "--no-hints") {
            options.showHints = false;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return options;
}

char ownerGlyph(CellOwner owner) {
    switch (owner) {
    case CellOwner::Blue:   return 'B';
    case CellOwner::Orange: return 'O';
    case CellOwner::Empty:  return '.';
    }
    return '?';
}

// Render board, preview ('*') and anchors ('+') as ASCII
void printGame(const GameState& game, const GameController& controller, bool showHints) {
    const Board& board = game.board();

    std::vector<std::string> lines(Board::rows(), std::string(Board::cols(), '.'));
    for (int r = 0; r < Board::rows(); ++r) {
        for (int c = 0; c < Board::cols(); ++c) {
            lines[r][c] = ownerGlyph(board.cell(r, c));
        }
    }

    if (showHints) {
        for (const auto& a : controller.highlightedAnchors()) {
            lines[a.row][a.col] = '+';
        }
    }

    if (controller.preview()) {
        for (const auto& c : controller.preview()->cells) {
            lines[c.row][c.col] = '*';
        }
    }

    std::cout << "\n==== BLOKUS CONSOLE VIEW ====\n";
    std::cout << "Status: " << toString(game.status())
              << " | Turn: " << toString(game.currentTurn())
              << " | Blue: " << game.score(PlayerColor::Blue)
              << " | Orange: " << game.score(PlayerColor::Orange) << '\n';

    std::cout << "   ";
    for (int c = 0; c < Board::cols(); ++c) {
        std::cout << static_cast<char>('0' + c % 10);
    }
    std::cout << '\n';
    for (int r = 0; r < Board::rows(); ++r) {
        std::cout << (r < 10 ? " " : "") << r << ' ' << lines[r] << '\n';
    }

    if (controller.selectedPiece()) {
        const Piece& piece = pieceById(*controller.selectedPiece());
        std::cout << "Selected: " << piece.name << " (id " << piece.id
                  << ", orientation " << controller.orientationIndex() << ")\n";
    }

    std::cout << "Hand:";
    for (const int id : game.remainingPieces(game.currentTurn())) {
        std::cout << ' ' << id << ':' << pieceById(id).name;
    }
    std::cout << '\n';

    std::cout << "Commands:\n"
              << "  p <id> = select piece, c <row> <col> = place preview at cell\n"
              << "  r = rotate CW, e = rotate CCW, f = flip\n"
              << "  n / b = next / previous placement, x = clear preview\n"
              << "  y = confirm, s = pass, q = quit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    ConsoleOptions options;
    try {
        options = parseOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "blokus_console: " << e.what() << '\n'
                  << "usage: blokus_console [--orange-first] [--auto-pass] [--no-hints]\n";
        return 2;
    }

    GameState game{options.match};
    GameController controller{game};
    game.start();

    std::string line;
    printGame(game, controller, options.showHints);

    while (game.status() == GameStatus::Playing) {
        std::cout << "\n[" << toString(game.currentTurn()) << "] Enter command: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }

        std::istringstream in{line};
        std::string cmd;
        if (!(in >> cmd)) {
            continue;
        }

        const char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'p': case 'P': {
            int id = -1;
            if (!(in >> id) || !controller.selectPiece(id)) {
                std::cerr << "Piece not available\n";
            }
            break;
        }
        case 'c': case 'C': {
            int row = -1;
            int col = -1;
            if (!(in >> row >> col)) {
                std::cerr << "usage: c <row> <col>\n";
            } else if (!controller.selectedPiece()) {
                std::cerr << "Select a piece first\n";
            } else if (!controller.clickBoard(row, col)) {
                std::cerr << "No valid placement covers that cell\n";
            }
            break;
        }
        case 'r': case 'R':
            controller.handleAction(InputAction::RotateCW);
            break;
        case 'e': case 'E':
            controller.handleAction(InputAction::RotateCCW);
            break;
        case 'f': case 'F':
            controller.handleAction(InputAction::Flip);
            break;
        case 'n': case 'N':
            controller.handleAction(InputAction::NextPlacement);
            break;
        case 'b': case 'B':
            controller.handleAction(InputAction::PreviousPlacement);
            break;
        case 'x': case 'X':
            controller.handleAction(InputAction::ClearPreview);
            break;
        case 'y': case 'Y':
            controller.handleAction(InputAction::Confirm);
            if (controller.lastResult() != MoveResult::Accepted) {
                std::cerr << toString(controller.lastResult()) << '\n';
            }
            break;
        case 's': case 'S':
            controller.handleAction(InputAction::Pass);
            if (controller.lastResult() != MoveResult::Accepted) {
                std::cerr << toString(controller.lastResult()) << '\n';
            }
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printGame(game, controller, options.showHints);

        if (game.status() == GameStatus::Playing && controller.mustPass()) {
            std::cout << toString(game.currentTurn()) << " has no legal move. Press 's' to pass.\n";
        }
    }

    if (game.status() == GameStatus::Finished && game.winner()) {
        std::cout << "GAME OVER. Winner: " << toString(*game.winner())
                  << " (blue " << game.score(PlayerColor::Blue)
                  << ", orange " << game.score(PlayerColor::Orange) << ")\n";
    }

    return 0;
}
