#include "core/board.hpp"
#include "core/groups.hpp"

#include <deque>
#include <utility>

namespace hoshi {

//! Which colors border an empty region.
enum class Reach { Unknown, Black, White, Both };

static Reach merge(const Reach reach, const Board::State stone) {
	const auto color = stone == Board::State::Black ? Reach::Black : Reach::White;
	if (reach == Reach::Unknown || reach == color) {
		return color;
	}
	return Reach::Both;
}

//! Breadth first walk over the empty region containing startIndex.
//! Marks the empty points as seen and returns the region size and the colors it reaches.
static std::pair<int, Reach> emptyRegion(const Board& board, const std::size_t startIndex, std::vector<bool>& seen) {
	int size    = 0;
	Reach reach = Reach::Unknown;

	std::deque<std::size_t> worklist{startIndex};
	seen[startIndex] = true;

	while (!worklist.empty()) {
		const auto index = worklist.front();
		worklist.pop_front();
		++size;

		for (const auto neighbour: neighbours(index, board.stride())) {
			const auto value = board.get(neighbour);
			if (value == Board::State::Empty) {
				if (!seen[neighbour]) {
					seen[neighbour] = true;
					worklist.push_back(neighbour);
				}
			} else if (value != Board::State::Offboard) {
				reach = merge(reach, value);
			}
		}
	}

	return {size, reach};
}

double Board::estimateScore() const {
	std::vector<bool> seen(m_board.size(), false);
	int black = 0;
	int white = 0;

	for (std::size_t index = 0; index != m_board.size(); ++index) {
		if (seen[index]) {
			continue;
		}

		switch (m_board[index]) {
		case State::Offboard:
			break;
		case State::Black:
			seen[index] = true;
			++black;
			break;
		case State::White:
			seen[index] = true;
			++white;
			break;
		case State::Empty: {
			const auto [size, reach] = emptyRegion(*this, index, seen);
			if (reach == Reach::Black) {
				black += size;
			} else if (reach == Reach::White) {
				white += size;
			}
			break;
		}
		}
	}

	return static_cast<double>(black - white) - m_komi;
}

} // namespace hoshi
