#include "core/board.hpp"
#include "core/groups.hpp"

#include <algorithm>
#include <cassert>
#include <format>

namespace hoshi {

Board::Board(const std::size_t size) : m_size(size), m_board((size + 2u) * (size + 2u), State::Empty) {
	assert(isValidBoardSize(size));

	const auto rowLength = stride();
	for (std::size_t i = 0; i != m_board.size(); ++i) {
		const auto row = i / rowLength;
		const auto col = i % rowLength;
		if (row == 0u || row == rowLength - 1u || col == 0u || col == rowLength - 1u) {
			m_board[i] = State::Offboard;
		}
	}
}

std::size_t Board::size() const {
	return m_size;
}
std::size_t Board::stride() const {
	return m_size + 2u;
}
std::size_t Board::cellCount() const {
	return m_board.size();
}

Board::State Board::get(const std::size_t index) const {
	return index < m_board.size() ? m_board[index] : State::Offboard;
}

Board::State Board::get(const Intersection intersection) const {
	const auto index = toIndex(intersection, m_size);
	return index ? m_board[*index] : State::Offboard;
}

bool Board::hasStones() const {
	return std::any_of(m_board.begin(), m_board.end(), [](State s) { return s == State::Black || s == State::White; });
}

bool Board::play(const Move& move) {
	const auto played = std::visit([&](auto&& mv) { return playMove(mv); }, move);
	if (played) {
		++m_moveNumber;
	}
	return played;
}

bool Board::playMove(const Pass&) {
	m_sideToMove = opponent(m_sideToMove);
	return true;
}

bool Board::playMove(const Resign&) {
	return false; // Nothing to place. Callers treat resign as a game end signal.
}

bool Board::playMove(const Place& move) {
	if (m_ko && *m_ko == move.intersection) {
		return false;
	}

	const auto index = toIndex(move.intersection, m_size);
	if (!index || m_board[*index] != State::Empty) {
		return false;
	}

	const auto enemy = opponent(move.color);
	m_board[*index]  = toState(move.color);

	// Captures are resolved for all directions before the suicide check.
	std::optional<Intersection> newKo{};
	for (const auto neighbour: neighbours(*index, stride())) {
		if (m_board[neighbour] != toState(enemy)) {
			continue;
		}

		const auto group = findGroup(*this, neighbour, enemy);
		if (!group.liberties.empty()) {
			continue;
		}

		if (group.stones.size() == 1u && diamond(*index) == enemy) {
			newKo = fromIndex(neighbour, m_size);
		}
		captureGroup(group.stones, move.color);
	}

	if (findGroup(*this, *index, move.color).liberties.empty()) {
		m_board[*index] = State::Empty;
		return false;
	}

	m_ko         = newKo;
	m_sideToMove = enemy;
	m_lastMove   = move;
	return true;
}

bool Board::placeStone(const Intersection intersection, const Color color) {
	const auto index = toIndex(intersection, m_size);
	if (!index || m_board[*index] != State::Empty) {
		return false;
	}

	m_board[*index] = toState(color);
	return true;
}

void Board::captureGroup(const std::vector<std::size_t>& stones, const Color capturer) {
	for (const auto stone: stones) {
		assert(m_board[stone] == State::Black || m_board[stone] == State::White);
		m_board[stone] = State::Empty;
	}

	const auto count = static_cast<unsigned>(stones.size());
	if (capturer == Color::Black) {
		m_blackCaptures += count;
	} else {
		m_whiteCaptures += count;
	}
}

std::optional<Color> Board::diamond(const Intersection intersection) const {
	const auto index = toIndex(intersection, m_size);
	if (!index) {
		return {};
	}
	return diamond(*index);
}

std::optional<Color> Board::diamond(const std::size_t index) const {
	if (get(index) == State::Offboard) {
		return {};
	}

	std::optional<Color> color{};
	for (const auto neighbour: neighbours(index, stride())) {
		switch (m_board[neighbour]) {
		case State::Empty:
			return {};
		case State::Offboard:
			break;
		case State::Black:
		case State::White: {
			const auto stone = m_board[neighbour] == State::Black ? Color::Black : Color::White;
			if (color && *color != stone) {
				return {};
			}
			color = stone;
			break;
		}
		}
	}
	return color;
}

std::string Board::render() const {
	std::string out;

	for (unsigned row = static_cast<unsigned>(m_size); row != 0u; --row) {
		out += std::format("{:>2} ", row);
		for (std::size_t col = 0; col != m_size; ++col) {
			switch (get(Intersection{.column = *columnFromIndex(col), .row = row})) {
			case State::Black:
				out += "X ";
				break;
			case State::White:
				out += "O ";
				break;
			default:
				out += ". ";
				break;
			}
		}
		out += '\n';
	}

	out += "  ";
	for (std::size_t col = 0; col != m_size; ++col) {
		out += std::format(" {}", toLetter(*columnFromIndex(col)));
	}

	out += std::format("\nKomi:     {}", m_komi);
	out += std::format("\nKo:       {}", m_ko ? toString(*m_ko) : "None");
	out += std::format("\nCaptures: [B: {}, W: {}]\n", m_blackCaptures, m_whiteCaptures);
	return out;
}

Color Board::sideToMove() const {
	return m_sideToMove;
}
std::optional<Intersection> Board::ko() const {
	return m_ko;
}
std::optional<Move> Board::lastMove() const {
	return m_lastMove;
}
unsigned Board::captures(const Color capturer) const {
	return capturer == Color::Black ? m_blackCaptures : m_whiteCaptures;
}
unsigned Board::moveNumber() const {
	return m_moveNumber;
}

double Board::komi() const {
	return m_komi;
}
void Board::setKomi(const double komi) {
	m_komi = komi;
}

} // namespace hoshi
