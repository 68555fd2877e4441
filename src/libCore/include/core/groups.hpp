#pragma once

#include "core/board.hpp"

#include <array>
#include <optional>
#include <vector>

namespace hoshi {

//! Connected stones of one color and the empty points next to them.
//! \note Both lists hold padded board indices, sorted ascending.
struct Group {
	Color color;
	std::vector<std::size_t> stones;
	std::vector<std::size_t> liberties;
};

//! The four orthogonal neighbours of a playable index.
inline constexpr std::array<std::size_t, 4> neighbours(std::size_t index, std::size_t stride) {
	return {index + 1u, index - 1u, index + stride, index - stride};
}

//! Flood fill from startIndex over stones of the given color.
//! Returns an empty group if startIndex does not hold a stone of that color.
Group findGroup(const Board& board, std::size_t startIndex, Color color);

//! The group of the given color with the fewest liberties. The first in index order wins ties.
std::optional<Group> weakestGroup(const Board& board, Color color);

} // namespace hoshi
