#include "core/zobristHash.hpp"

#include <cassert>
#include <random>

namespace hoshi {

ZobristHash::ZobristHash(const std::size_t boardSize) : m_table((boardSize + 2u) * (boardSize + 2u)) {
	initRandomTable();
}

uint64_t ZobristHash::stone(const std::size_t index, const Color color) const {
	assert(static_cast<int>(color) == 1 || static_cast<int>(color) == 2);
	assert(index < m_table.size());

	return m_table[index][static_cast<unsigned>(color) - 1u];
}

uint64_t ZobristHash::togglePlayer() const {
	return m_playerToggle;
}

uint64_t ZobristHash::hash(const Board& board, const Color playedLast) const {
	assert(board.cellCount() == m_table.size());

	uint64_t h = playedLast == Color::White ? m_playerToggle : 0u;
	for (std::size_t index = 0; index != board.cellCount(); ++index) {
		switch (board.get(index)) {
		case Board::State::Black:
			h ^= stone(index, Color::Black);
			break;
		case Board::State::White:
			h ^= stone(index, Color::White);
			break;
		default:
			break;
		}
	}
	return h;
}

void ZobristHash::initRandomTable() {
	std::mt19937_64 rng(0xA5F3C7E2B1D94ULL); //!< Fixed seed for reproducibility
	std::uniform_int_distribution<uint64_t> dist;

	for (auto& entry: m_table) {
		entry[0] = dist(rng);
		entry[1] = dist(rng);
	}

	m_playerToggle = dist(rng);
}

} // namespace hoshi
