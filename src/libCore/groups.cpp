#include "core/groups.hpp"

#include <algorithm>
#include <utility>

namespace hoshi {

Group findGroup(const Board& board, const std::size_t startIndex, const Color color) {
	Group group{.color = color, .stones = {}, .liberties = {}};

	const auto stone = toState(color);
	if (board.get(startIndex) != stone) {
		return group;
	}

	std::vector<bool> visited(board.cellCount(), false);
	std::vector<bool> libertyVisited(board.cellCount(), false);

	std::vector<std::size_t> stack{startIndex};
	visited[startIndex] = true;

	while (!stack.empty()) {
		const auto index = stack.back();
		stack.pop_back();
		group.stones.push_back(index);

		for (const auto neighbour: neighbours(index, board.stride())) {
			const auto value = board.get(neighbour);
			if (value == stone) {
				if (!visited[neighbour]) {
					visited[neighbour] = true;
					stack.push_back(neighbour);
				}
			} else if (value == Board::State::Empty && !libertyVisited[neighbour]) {
				libertyVisited[neighbour] = true;
				group.liberties.push_back(neighbour);
			}
		}
	}

	std::sort(group.stones.begin(), group.stones.end());
	std::sort(group.liberties.begin(), group.liberties.end());
	return group;
}

std::optional<Group> weakestGroup(const Board& board, const Color color) {
	std::optional<Group> weakest{};
	std::vector<bool> seen(board.cellCount(), false);

	const auto stone = toState(color);
	for (std::size_t index = 0; index != board.cellCount(); ++index) {
		if (seen[index] || board.get(index) != stone) {
			continue;
		}

		auto group = findGroup(board, index, color);
		for (const auto s: group.stones) {
			seen[s] = true;
		}

		if (!weakest || group.liberties.size() < weakest->liberties.size()) {
			weakest = std::move(group);
		}
	}

	return weakest;
}

} // namespace hoshi
