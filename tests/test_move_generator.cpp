#include <catch2/catch.hpp>

#include "core/Board.hpp"
#include "core/Geometry.hpp"
#include "core/MoveGenerator.hpp"
#include "core/PlacementValidator.hpp"
#include "core/Types.hpp"

#include <algorithm>
#include <vector>

using namespace blokus::core;

namespace {

// Every square orange except the four corners. Blue owns the square
// diagonally inside each corner, so each corner is a one-square pocket
// that blue reaches by a corner only.
Board cornerPocketBoard() {
    Board b;
    for (int r = 0; r < BoardSize; ++r) {
        for (int c = 0; c < BoardSize; ++c) {
            b.setCell(r, c, CellOwner::Orange);
        }
    }
    const int last = BoardSize - 1;
    for (const Cell corner : {Cell{0, 0}, Cell{0, last}, Cell{last, 0}, Cell{last, last}}) {
        b.setCell(corner.row, corner.col, CellOwner::Empty);
    }
    for (const Cell inner : {Cell{1, 1}, Cell{1, last - 1}, Cell{last - 1, 1}, Cell{last - 1, last - 1}}) {
        b.setCell(inner.row, inner.col, CellOwner::Blue);
    }
    return b;
}

bool containsCell(const CellList& cells, Cell target) {
    return std::find(cells.begin(), cells.end(), target) != cells.end();
}

} // namespace

TEST_CASE("MoveGenerator: anchors before the first move are the starting cell", "[moves][anchors]") {
    Board b;

    const auto blue = findCornerAnchors(b, PlayerColor::Blue);
    REQUIRE(blue.size() == 1);
    REQUIRE(blue.front() == Cell{4, 4});

    const auto orange = findCornerAnchors(b, PlayerColor::Orange);
    REQUIRE(orange.size() == 1);
    REQUIRE(orange.front() == Cell{9, 9});
}

TEST_CASE("MoveGenerator: anchors after a single square at (4,4)", "[moves][anchors]") {
    Board b;
    REQUIRE(isValidPlacement(b, CellList{{4, 4}}, PlayerColor::Blue));
    b.applyPlacement(CellList{{4, 4}}, PlayerColor::Blue);

    REQUIRE(b.cell(4, 4) == CellOwner::Blue);

    const std::vector<Cell> expected{{3, 3}, {3, 5}, {5, 3}, {5, 5}};
    REQUIRE(findCornerAnchors(b, PlayerColor::Blue) == expected);

    // Orange still opens on its own starting cell
    const auto orange = findCornerAnchors(b, PlayerColor::Orange);
    REQUIRE(orange == std::vector<Cell>{{9, 9}});
}

TEST_CASE("MoveGenerator: anchors exclude occupied and edge-touching squares", "[moves][anchors]") {
    Board b;
    b.applyPlacement(CellList{{4, 4}, {4, 5}}, PlayerColor::Blue);
    b.applyPlacement(CellList{{3, 3}}, PlayerColor::Orange);

    const auto anchors = findCornerAnchors(b, PlayerColor::Blue);
    const std::vector<Cell> expected{{3, 6}, {5, 3}, {5, 6}};
    REQUIRE(anchors == expected);

    for (const auto& a : anchors) {
        CHECK(b.isEmpty(a.row, a.col));
        CHECK(touchesOwnCorner(b, a.row, a.col, PlayerColor::Blue));
        CHECK_FALSE(touchesOwnEdge(b, a.row, a.col, PlayerColor::Blue));
    }
}

TEST_CASE("MoveGenerator: placements at an anchor pin every cell of every orientation", "[moves]") {
    Board b;

    SECTION("single square") {
        const auto placements = findValidPlacementsAtAnchor(b, 0, 4, 4, PlayerColor::Blue);
        REQUIRE(placements.size() == 1);
        REQUIRE(placements.front().cells == CellList{{4, 4}});
        REQUIRE(placements.front().orientationIndex == 0);
    }

    SECTION("domino opening") {
        const auto placements = findValidPlacementsAtAnchor(b, 1, 4, 4, PlayerColor::Blue);
        // two orientations, two pins each
        REQUIRE(placements.size() == 4);
        for (const auto& p : placements) {
            CHECK(containsCell(p.cells, Cell{4, 4}));
            CHECK(isValidPlacement(b, p.cells, PlayerColor::Blue));
        }
        CHECK(placements[0].orientationIndex == 0);
        CHECK(placements[3].orientationIndex == 1);
    }

    SECTION("nothing fits at a square off the starting cell") {
        REQUIRE(findValidPlacementsAtAnchor(b, 20, 0, 0, PlayerColor::Blue).empty());
    }
}

TEST_CASE("MoveGenerator: all placements are distinct cell sets", "[moves]") {
    Board b;
    // Two separate blue squares: a straight tromino along row 3 reaches
    // both the (3,5) and (3,7) anchors
    b.applyPlacement(CellList{{4, 4}}, PlayerColor::Blue);
    b.applyPlacement(CellList{{4, 8}}, PlayerColor::Blue);

    const auto all = allValidPlacements(b, 2, PlayerColor::Blue);

    std::size_t perAnchorTotal = 0;
    for (const auto& a : findCornerAnchors(b, PlayerColor::Blue)) {
        perAnchorTotal += findValidPlacementsAtAnchor(b, 2, a.row, a.col, PlayerColor::Blue).size();
    }
    REQUIRE(perAnchorTotal > all.size());

    for (std::size_t i = 0; i < all.size(); ++i) {
        CHECK(isValidPlacement(b, all[i].cells, PlayerColor::Blue));
        for (std::size_t j = i + 1; j < all.size(); ++j) {
            CHECK_FALSE(cellsEqual(all[i].cells, all[j].cells));
        }
    }

    const CellList bridge{{3, 5}, {3, 6}, {3, 7}};
    const auto count = std::count_if(all.begin(), all.end(),
                                     [&](const Placement& p) { return cellsEqual(p.cells, bridge); });
    REQUIRE(count == 1);
}

TEST_CASE("MoveGenerator: corner pockets take a single square only", "[moves][pockets]") {
    const Board b = cornerPocketBoard();

    const auto anchors = findCornerAnchors(b, PlayerColor::Blue);
    REQUIRE(anchors.size() == 4);

    REQUIRE(canPlacePiece(b, 0, PlayerColor::Blue));
    REQUIRE_FALSE(canPlacePiece(b, 1, PlayerColor::Blue));
    REQUIRE_FALSE(canPlacePiece(b, 20, PlayerColor::Blue));

    REQUIRE(validAnchorsForPiece(b, 0, PlayerColor::Blue).size() == 4);
    REQUIRE(validAnchorsForPiece(b, 1, PlayerColor::Blue).empty());
    REQUIRE(allValidPlacements(b, 1, PlayerColor::Blue).empty());
    REQUIRE(allValidPlacements(b, 0, PlayerColor::Blue).size() == 4);

    REQUIRE(hasValidMoves(b, std::vector<int>{0, 1}, PlayerColor::Blue));
    REQUIRE_FALSE(hasValidMoves(b, std::vector<int>{1, 2, 3}, PlayerColor::Blue));
    REQUIRE_FALSE(hasValidMoves(b, std::vector<int>{}, PlayerColor::Blue));

    // Orange owns edges next to every pocket and no corners into them
    REQUIRE_FALSE(hasValidMoves(b, std::vector<int>{0}, PlayerColor::Orange));
}

TEST_CASE("MoveGenerator: every piece opens on an empty board", "[moves]") {
    Board b;
    for (int id = 0; id < PieceCount; ++id) {
        CHECK(canPlacePiece(b, id, PlayerColor::Blue));
        CHECK(canPlacePiece(b, id, PlayerColor::Orange));
    }
}

TEST_CASE("MoveGenerator: nearest anchor to a cursor", "[moves][cursor]") {
    const std::vector<Cell> anchors{{3, 3}, {3, 5}, {5, 3}, {5, 5}};

    // Equidistant: earliest wins
    REQUIRE(findNearestValidAnchor(4, 4, anchors) == Cell{3, 3});
    REQUIRE(findNearestValidAnchor(7, 6, anchors) == Cell{5, 5});
    REQUIRE(findNearestValidAnchor(0, 13, anchors) == Cell{3, 5});
    REQUIRE_FALSE(findNearestValidAnchor(4, 4, {}).has_value());
}

TEST_CASE("MoveGenerator: best placement for a cursor", "[moves][cursor]") {
    Board b;
    const auto placements = findValidPlacementsAtAnchor(b, 1, 4, 4, PlayerColor::Blue);

    SECTION("closest centroid") {
        const auto best = findBestPlacementForCursor(5.0, 4.0, placements);
        REQUIRE(best.has_value());
        REQUIRE(cellsEqual(best->cells, CellList{{4, 4}, {5, 4}}));
        REQUIRE(best->orientationIndex == 1);
    }

    SECTION("preferred orientation narrows the choice") {
        const auto best = findBestPlacementForCursor(5.0, 4.0, placements, 0);
        REQUIRE(best.has_value());
        REQUIRE(best->orientationIndex == 0);
        REQUIRE(containsCell(best->cells, Cell{4, 4}));
    }

    SECTION("preferred orientation absent from the list is ignored") {
        const auto best = findBestPlacementForCursor(3.0, 4.0, placements, 5);
        REQUIRE(best.has_value());
        REQUIRE(cellsEqual(best->cells, CellList{{3, 4}, {4, 4}}));
    }

    SECTION("no placements") {
        REQUIRE_FALSE(findBestPlacementForCursor(4.0, 4.0, {}).has_value());
    }
}
