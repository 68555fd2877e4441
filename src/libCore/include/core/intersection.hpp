#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hoshi {

//! Board columns as used in Go notation. There is no column 'I'.
enum class Column { A, B, C, D, E, F, G, H, J, K, L, M, N, O, P, Q, R, S, T };

inline constexpr std::size_t MAX_COLUMNS = 19u;

//! Column for a zero based column index. Empty if index >= 19.
std::optional<Column> columnFromIndex(std::size_t index);

//! Column for a letter (case-insensitive). Empty for 'I' and letters after 'T'.
std::optional<Column> columnFromLetter(char letter);

inline constexpr std::size_t columnIndex(Column column) {
	return static_cast<std::size_t>(column);
}

char toLetter(Column column);

//! Playable point on the board.
//! \note Row 1 is the bottom row. Rows start at 1, columns at A.
struct Intersection {
	Column column;
	unsigned row;

	bool operator==(const Intersection&) const = default;
};

//! Index into the padded board array of a board of given size.
//! The padded array has a one-cell offboard border on all sides: (size + 2)^2 cells.
//! \returns Empty if the intersection is not on a board of that size.
std::optional<std::size_t> toIndex(Intersection intersection, std::size_t boardSize);

//! Inverse of toIndex. Empty for border cells and indices past the array.
std::optional<Intersection> fromIndex(std::size_t index, std::size_t boardSize);

//! Parses vertices like "Q16" or "d4". Does not check the row against a board size.
std::optional<Intersection> parseIntersection(std::string_view text);

std::string toString(Intersection intersection);

} // namespace hoshi
