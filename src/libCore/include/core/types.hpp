#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hoshi {

enum class Color { Black = 1, White = 2 };

//! Returns the opponent enum value of input color.
inline constexpr Color opponent(Color color) {
	return color == Color::White ? Color::Black : Color::White;
}

//! Supported board sizes.
inline constexpr bool isValidBoardSize(std::size_t size) {
	return size == 9u || size == 13u || size == 19u;
}

inline constexpr double DEFAULT_KOMI = 6.5;

//! Parses "b", "black", "w" or "white" (case-insensitive).
std::optional<Color> parseColor(std::string_view text);

//! Parses a board size of 9, 13 or 19.
std::optional<std::size_t> parseBoardSize(std::string_view text);

std::string toString(Color color);

} // namespace hoshi
