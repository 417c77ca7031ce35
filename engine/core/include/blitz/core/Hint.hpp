#pragma once

#include <optional>
#include <vector>

#include "blitz/core/Grid.hpp"
#include "blitz/core/MatchDetector.hpp"

namespace blitz::core::hint {

struct HintResult {
    Move move{};
    // Distinct tiles the swap's own matches would remove (cascades not counted).
    int score = 0;
    std::vector<MatchData> matches;
};

std::optional<HintResult> FindHint(const Grid& grid);

// True when some swap makes a match or a power-up is ready to activate.
bool AnyLegalMoves(const Grid& grid);

}  // namespace blitz::core::hint
