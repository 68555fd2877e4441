#pragma once

#include "core/board.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace hoshi {

//! Hash of a board grid and the color that moved last.
//! Equal positions give equal hashes; the search tree uses it to find candidates for node reuse.
class ZobristHash {
public:
	explicit ZobristHash(std::size_t boardSize);

	uint64_t stone(std::size_t index, Color color) const; //!< Key of a stone at padded index.
	uint64_t togglePlayer() const;                        //!< Key for white being the last mover.

	uint64_t hash(const Board& board, Color playedLast) const;

private:
	void initRandomTable();

private:
	std::vector<std::array<uint64_t, 2>> m_table{};
	uint64_t m_playerToggle{0}; //!< Hash for player toggle.
};

} // namespace hoshi
