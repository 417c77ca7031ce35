#include <cassert>
#include <iostream>

#include "TestSupport.hpp"
#include "blitz/core/Gravity.hpp"

using namespace blitz::core;
using blitz::test::Layout;

namespace {

void TestSingleGapCompaction() {
    // Bottom to top: X, empty, X, empty, empty.
    auto grid = Layout({
        ".",
        ".",
        "R",
        ".",
        "B",
    });
    const TileId upper = grid.get(0, 2)->id;
    auto falls = CalculateFalls(grid);
    assert(falls.size() == 1);
    assert(falls[0].tile.id == upper);
    assert(falls[0].from_y == 2);
    assert(falls[0].to_y == 1);
    assert(falls[0].fallDistance() == 1);

    ApplyFalls(grid, falls);
    assert(FormatLayout(grid) == ".\n.\n.\nR\nB\n");
    assert(grid.checkInvariants());
}

void TestFallDistancesGrowWithGaps() {
    // Bottom to top: empty, X, empty, X, empty.
    auto grid = Layout({
        ".",
        "G",
        ".",
        "R",
        ".",
    });
    auto falls = CalculateFalls(grid);
    assert(falls.size() == 2);
    assert(falls[0].fallDistance() == 1);
    assert(falls[0].to_y == 0);
    assert(falls[1].fallDistance() == 2);
    assert(falls[1].to_y == 1);

    ApplyFalls(grid, falls);
    assert(FormatLayout(grid) == ".\n.\n.\nG\nR\n");
    assert(grid.checkInvariants());
}

void TestFallsKeepRelativeOrder() {
    auto grid = Layout({
        "Y.",
        "G.",
        ".B",
        "R.",
        "..",
    });
    auto falls = CalculateFalls(grid);
    ApplyFalls(grid, falls);
    assert(FormatLayout(grid) == "..\n..\nY.\nG.\nRB\n");
    assert(CalculateFalls(grid).empty());
}

void TestGroupingBySourceRow() {
    auto grid = Layout({
        "RG",
        ".B",
        "Y.",
        "..",
    });
    auto groups = GroupFallsBySourceRow(CalculateFalls(grid));
    assert(groups.size() == 3);
    auto it = groups.begin();
    assert(it->first == 1 && it->second.size() == 1);
    ++it;
    assert(it->first == 2 && it->second.size() == 1);
    ++it;
    assert(it->first == 3 && it->second.size() == 2);
}

void TestSpawnRanks() {
    auto grid = Layout({
        "..",
        ".R",
        "..",
        "GB",
    });
    auto falls = CalculateFalls(grid);
    ApplyFalls(grid, falls);
    auto spawns = CalculateSpawns(grid);
    assert(spawns.size() == 5);
    assert(spawns[0].x == 0 && spawns[0].y == 1 && spawns[0].spawn_rank == 0);
    assert(spawns[2].x == 0 && spawns[2].y == 3 && spawns[2].spawn_rank == 2);
    assert(spawns[3].x == 1 && spawns[3].y == 2 && spawns[3].spawn_rank == 0);
    assert(spawns[4].x == 1 && spawns[4].y == 3 && spawns[4].spawn_rank == 1);
}

void TestRefillOnlyColored() {
    Grid grid(6, 6);
    std::mt19937 rng(99);
    const std::vector<TileType> palette{TileType::Red, TileType::RocketHorizontal, TileType::Snitch,
                                        TileType::Blue};
    auto spawned = ApplySpawns(grid, CalculateSpawns(grid), palette, rng);
    assert(spawned.size() == 36);
    assert(grid.tileCount() == 36);
    for (const auto& tile : spawned) {
        assert(IsColored(tile.type));
        assert(grid.get(tile.pos)->id == tile.id);
    }
    assert(CalculateSpawns(grid).empty());
    assert(grid.checkInvariants());
}

void TestRefillWithoutColors() {
    Grid grid(2, 2);
    std::mt19937 rng(1);
    auto spawned = ApplySpawns(grid, CalculateSpawns(grid), {TileType::Snitch}, rng);
    assert(spawned.empty());
    assert(grid.tileCount() == 0);
}

void TestRefillIsSeeded() {
    const std::vector<TileType> colors{TileType::Red, TileType::Yellow, TileType::Green,
                                       TileType::Blue};
    Grid first(5, 5);
    Grid second(5, 5);
    std::mt19937 rng_a(7);
    std::mt19937 rng_b(7);
    ApplySpawns(first, CalculateSpawns(first), colors, rng_a);
    ApplySpawns(second, CalculateSpawns(second), colors, rng_b);
    assert(FormatLayout(first) == FormatLayout(second));
}

}  // namespace

int main() {
    TestSingleGapCompaction();
    TestFallDistancesGrowWithGaps();
    TestFallsKeepRelativeOrder();
    TestGroupingBySourceRow();
    TestSpawnRanks();
    TestRefillOnlyColored();
    TestRefillWithoutColors();
    TestRefillIsSeeded();
    std::cout << "All gravity tests passed.\n";
    return 0;
}
