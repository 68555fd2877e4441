#pragma once

#include "core/intersection.hpp"
#include "core/move.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hoshi {

//! Go board with a one-cell offboard border around the playable area.
//! Copies are independent snapshots.
//! \note Flat indices follow toIndex(): row 1 (bottom) has the highest indices.
class Board {
public:
	//! Possible values of cells in the padded board array.
	enum class State : unsigned char { Empty = 0, Black = static_cast<int>(Color::Black), White = static_cast<int>(Color::White), Offboard };

public:
	explicit Board(std::size_t size);

	std::size_t size() const;
	std::size_t stride() const;    //!< Row length of the padded array (size + 2).
	std::size_t cellCount() const; //!< Number of cells in the padded array, border included.

	State get(std::size_t index) const;        //!< Value at padded index. Indices past the array read as Offboard.
	State get(Intersection intersection) const; //!< Value at intersection. Off the board reads as Offboard.
	bool hasStones() const;                    //!< True if any stone is on the board.

	//! Play a move. Pass always succeeds, resign never does.
	//! A placement fails on the ko point, outside the board, on an occupied point or when it is suicide.
	//! \returns True if the move was played. The board is unchanged otherwise.
	bool play(const Move& move);

	//! Put a stone on an empty point without any rule processing (captures, ko, turn, move counter).
	//! Used to set up positions.
	bool placeStone(Intersection intersection, Color color);

	//! The color occupying all four neighbours of a point. Offboard neighbours match any color.
	//! Empty if a neighbour is empty or colors are mixed.
	std::optional<Color> diamond(Intersection intersection) const;
	std::optional<Color> diamond(std::size_t index) const;

	//! Area estimate: stones plus empty regions reaching only one color. Positive favours black.
	double estimateScore() const;

	//! Text diagram of the board with komi, ko and capture information.
	std::string render() const;

	Color sideToMove() const;
	std::optional<Intersection> ko() const;
	std::optional<Move> lastMove() const;
	unsigned captures(Color capturer) const; //!< Number of stones captured by the given color.
	unsigned moveNumber() const;

	double komi() const;
	void setKomi(double komi);

	bool operator==(const Board&) const = default;

private:
	bool playMove(const Pass& move);
	bool playMove(const Place& move);
	bool playMove(const Resign& move);

	void captureGroup(const std::vector<std::size_t>& stones, Color capturer);

private:
	std::size_t m_size;                //!< Board size
	std::vector<State> m_board{};      //!< Padded board values.
	Color m_sideToMove{Color::Black};  //!< Color to play next.
	std::optional<Intersection> m_ko{}; //!< Point that may not be played next.
	double m_komi{DEFAULT_KOMI};       //!< Compensation for white.
	std::optional<Move> m_lastMove{};  //!< Last stone played.
	unsigned m_blackCaptures{0};       //!< Stones captured by black.
	unsigned m_whiteCaptures{0};       //!< Stones captured by white.
	unsigned m_moveNumber{0};          //!< Moves played (passes included).
};

//! Returns the Board::State enum value of input color.
inline constexpr Board::State toState(Color color) {
	return color == Color::White ? Board::State::White : Board::State::Black;
}

} // namespace hoshi
