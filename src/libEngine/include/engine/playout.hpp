#pragma once

#include "core/board.hpp"
#include "engine/searchConfig.hpp"

#include <random>
#include <vector>

namespace hoshi::engine {

//! Fixed strategic points of a board size (star points).
std::vector<Intersection> starPoints(std::size_t boardSize);

//! Candidate points to expand a position with.
//! Star points, the liberties of the weakest group of each color and one random empty point, without duplicates.
std::vector<Intersection> candidateMoves(const Board& board, std::mt19937& rng);

//! Play one playout move for color on board. Tries in order:
//! opening book on an empty 19x19 board, capturing an opponent group in atari, saving an own group in atari,
//! playing next to whichever weakest group has more liberties, a random point that is not surrounded.
//! Passes if nothing is legal.
//! \returns The move that was played.
Move playPlayoutMove(Board& board, Color color, std::mt19937& rng);

//! Whether color, being next to move on board, should resign.
bool shouldResign(const Board& board, Color color, const SearchConfig& config);

} // namespace hoshi::engine
