#include <cassert>
#include <iostream>
#include <unordered_set>

#include "TestSupport.hpp"
#include "blitz/core/MatchDetector.hpp"

using namespace blitz::core;
using blitz::test::Layout;

namespace {

bool Disjoint(const std::vector<MatchData>& matches) {
    std::unordered_set<TileId> seen;
    std::size_t total = 0;
    for (const auto& match : matches) {
        total += match.tiles.size();
        for (const auto& tile : match.tiles) {
            seen.insert(tile.id);
        }
    }
    return seen.size() == total;
}

void TestSquareBeatsOverlappingRun() {
    auto grid = Layout({
        "YBGY",
        "RRBG",
        "RRRY",
    });
    auto matches = FindAllMatches(grid);
    assert(matches.size() == 1);
    assert(matches[0].orientation == MatchOrientation::Square);
    assert(matches[0].isSnitchMatch());
    assert(!matches[0].isPowerUpMatch());
    assert(matches[0].count() == 4);
    assert(matches[0].pivot == (Cell{0, 0}));
    assert(!matches[0].contains(grid.get(2, 0)->id));
}

void TestFiveRunPivot() {
    auto grid = Layout({
        "GBYGB",
        "RRRRR",
    });
    auto matches = FindAllMatches(grid);
    assert(matches.size() == 1);
    assert(matches[0].orientation == MatchOrientation::Horizontal);
    assert(matches[0].count() == 5);
    assert(matches[0].isPowerUpMatch());
    assert(matches[0].pivot == (Cell{2, 0}));

    auto seeded = FindMatchesAt(grid, {Cell{4, 0}});
    assert(seeded.size() == 1);
    assert(seeded[0].count() == 5);
    assert(seeded[0].pivot == (Cell{4, 0}));
}

void TestVerticalRun() {
    auto grid = Layout({
        "GR",
        "BR",
        "GR",
        "BY",
    });
    auto matches = FindAllMatches(grid);
    assert(matches.size() == 1);
    assert(matches[0].orientation == MatchOrientation::Vertical);
    assert(matches[0].count() == 3);
    assert(!matches[0].isPowerUpMatch());
    assert(matches[0].pivot == (Cell{1, 2}));
}

void TestPowerUpsNeverMatch() {
    auto grid = Layout({"RRHRR"});
    assert(FindAllMatches(grid).empty());

    auto snitches = Layout({
        "SS",
        "SS",
    });
    assert(FindAllMatches(snitches).empty());

    auto rockets = Layout({"VVV"});
    assert(FindAllMatches(rockets).empty());
}

void TestCrossingRunsAreSeparate() {
    auto grid = Layout({
        "RGB",
        "RBG",
        "RRR",
    });
    auto matches = FindAllMatches(grid);
    assert(matches.size() == 2);
    const TileId corner = grid.get(0, 0)->id;
    assert(matches[0].contains(corner));
    assert(matches[1].contains(corner));
    assert(matches[0].orientation != matches[1].orientation);
}

void TestMatchesNeverShareTilesWithSquares() {
    auto grid = Layout({
        "GGGBY",
        "RRRYB",
        "RRRBY",
    });
    auto matches = FindAllMatches(grid);
    assert(matches.size() == 2);
    assert(matches[0].orientation == MatchOrientation::Square);
    assert(matches[1].orientation == MatchOrientation::Horizontal);
    assert(matches[1].count() == 3);
    assert(Disjoint(matches));
}

void TestSeededSquarePivot() {
    auto grid = Layout({
        "RRB",
        "RRG",
    });
    auto matches = FindMatchesAt(grid, {Cell{1, 1}, Cell{2, 1}});
    assert(matches.size() == 1);
    assert(matches[0].orientation == MatchOrientation::Square);
    assert(matches[0].pivot == (Cell{1, 1}));
}

void TestSeededScanIgnoresDistantMatches() {
    auto grid = Layout({
        "RRRG",
        "BYGB",
        "GBYY",
    });
    assert(FindMatchesAt(grid, {Cell{3, 0}}).empty());
    assert(FindAllMatches(grid).size() == 1);
    assert(FindMatchesAt(grid, {Cell{1, 2}, Cell{1, 2}}).size() == 1);
}

void TestHasMatchAt() {
    auto grid = Layout({
        "RRB",
        "RRG",
        "GBG",
    });
    assert(HasMatchAt(grid, Cell{0, 1}));
    assert(HasMatchAt(grid, Cell{1, 2}));
    assert(!HasMatchAt(grid, Cell{2, 0}));
    assert(!HasMatchAt(grid, Cell{9, 9}));
}

}  // namespace

int main() {
    TestSquareBeatsOverlappingRun();
    TestFiveRunPivot();
    TestVerticalRun();
    TestPowerUpsNeverMatch();
    TestCrossingRunsAreSeparate();
    TestMatchesNeverShareTilesWithSquares();
    TestSeededSquarePivot();
    TestSeededScanIgnoresDistantMatches();
    TestHasMatchAt();
    std::cout << "All match detector tests passed.\n";
    return 0;
}
