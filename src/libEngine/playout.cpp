#include "engine/playout.hpp"

#include "core/groups.hpp"

#include <algorithm>
#include <array>
#include <cassert>

namespace hoshi::engine {

using Column::C;
using Column::D;
using Column::E;
using Column::G;
using Column::K;
using Column::Q;

static constexpr std::array<Intersection, 4> kOpeningBook{{{D, 4u}, {Q, 4u}, {D, 16u}, {Q, 16u}}};

std::vector<Intersection> starPoints(const std::size_t boardSize) {
	switch (boardSize) {
	case 9u:
		return {{C, 3u}, {G, 3u}, {C, 7u}, {G, 7u}, {E, 5u}};
	case 13u:
		return {{D, 4u}, {K, 4u}, {D, 10u}, {K, 10u}, {G, 7u}};
	case 19u:
		return {{D, 4u}, {Q, 4u}, {D, 16u}, {Q, 16u}, {K, 10u}};
	default:
		return {};
	}
}

static std::vector<std::size_t> emptyPoints(const Board& board) {
	std::vector<std::size_t> points;
	for (std::size_t index = 0; index != board.cellCount(); ++index) {
		if (board.get(index) == Board::State::Empty) {
			points.push_back(index);
		}
	}
	return points;
}

static void appendUnique(std::vector<Intersection>& points, const Intersection point) {
	if (std::find(points.begin(), points.end(), point) == points.end()) {
		points.push_back(point);
	}
}

std::vector<Intersection> candidateMoves(const Board& board, std::mt19937& rng) {
	std::vector<Intersection> candidates;
	for (const auto point: starPoints(board.size())) {
		appendUnique(candidates, point);
	}

	for (const auto color: {Color::Black, Color::White}) {
		if (const auto group = weakestGroup(board, color)) {
			for (const auto liberty: group->liberties) {
				if (const auto point = fromIndex(liberty, board.size())) {
					appendUnique(candidates, *point);
				}
			}
		}
	}

	const auto empty = emptyPoints(board);
	if (!empty.empty()) {
		std::uniform_int_distribution<std::size_t> dist(0u, empty.size() - 1u);
		if (const auto point = fromIndex(empty[dist(rng)], board.size())) {
			appendUnique(candidates, *point);
		}
	}

	return candidates;
}

//! Play color at padded index. Board is unchanged if the move is illegal.
static std::optional<Move> tryPlay(Board& board, const std::size_t index, const Color color) {
	const auto point = fromIndex(index, board.size());
	if (!point) {
		return {};
	}

	const Move move = Place{.intersection = *point, .color = color};
	if (!board.play(move)) {
		return {};
	}
	return move;
}

//! Try the liberties of a group in random order, skipping eyes of color.
static std::optional<Move> playLiberty(Board& board, std::vector<std::size_t> liberties, const Color color, std::mt19937& rng) {
	std::shuffle(liberties.begin(), liberties.end(), rng);
	for (const auto liberty: liberties) {
		if (board.diamond(liberty) == color) {
			continue;
		}
		if (auto move = tryPlay(board, liberty, color)) {
			return move;
		}
	}
	return {};
}

static std::optional<Move> playOpeningBook(Board& board, const Color color, std::mt19937& rng) {
	if (board.size() != 19u || board.hasStones()) {
		return {};
	}

	std::uniform_int_distribution<std::size_t> dist(0u, kOpeningBook.size() - 1u);
	const Move move = Place{.intersection = kOpeningBook[dist(rng)], .color = color};
	if (!board.play(move)) {
		return {};
	}
	return move;
}

static std::optional<Move> playRandom(Board& board, const Color color, std::mt19937& rng) {
	auto points = emptyPoints(board);
	std::shuffle(points.begin(), points.end(), rng);

	for (const auto index: points) {
		if (board.diamond(index)) {
			continue;
		}
		if (auto move = tryPlay(board, index, color)) {
			return move;
		}
	}
	return {};
}

Move playPlayoutMove(Board& board, const Color color, std::mt19937& rng) {
	if (auto move = playOpeningBook(board, color, rng)) {
		return *move;
	}

	const auto own   = weakestGroup(board, color);
	const auto enemy = weakestGroup(board, opponent(color));

	// Capture
	if (enemy && enemy->liberties.size() == 1u) {
		if (auto move = tryPlay(board, enemy->liberties.front(), color)) {
			return *move;
		}
	}

	// Escape from atari
	if (own && own->liberties.size() == 1u) {
		if (auto move = tryPlay(board, own->liberties.front(), color)) {
			return *move;
		}
	}

	// Extend or contest at the weakest group with more liberties.
	if (own || enemy) {
		const auto& target = (own && (!enemy || own->liberties.size() > enemy->liberties.size())) ? *own : *enemy;
		if (auto move = playLiberty(board, target.liberties, color, rng)) {
			return *move;
		}
	}

	if (auto move = playRandom(board, color, rng)) {
		return *move;
	}

	[[maybe_unused]] const bool passed = board.play(Pass{});
	assert(passed);
	return Pass{};
}

bool shouldResign(const Board& board, const Color color, const SearchConfig& config) {
	if (board.moveNumber() <= config.resignAfterMove) {
		return false;
	}

	const auto score = board.estimateScore();
	return color == Color::Black ? score < -config.resignThreshold : score > config.resignThreshold;
}

} // namespace hoshi::engine
