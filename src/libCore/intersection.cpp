#include "core/intersection.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace hoshi {

static constexpr std::array<char, MAX_COLUMNS> kLetters{'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'J', 'K',
                                                        'L', 'M', 'N', 'O', 'P', 'Q', 'R', 'S', 'T'};

std::optional<Column> columnFromIndex(const std::size_t index) {
	if (index >= MAX_COLUMNS) {
		return {};
	}
	return static_cast<Column>(index);
}

std::optional<Column> columnFromLetter(const char letter) {
	const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));

	const auto it = std::find(kLetters.begin(), kLetters.end(), upper);
	if (it == kLetters.end()) {
		return {};
	}
	return static_cast<Column>(std::distance(kLetters.begin(), it));
}

char toLetter(const Column column) {
	return kLetters[columnIndex(column)];
}

std::optional<std::size_t> toIndex(const Intersection intersection, const std::size_t boardSize) {
	const auto col = columnIndex(intersection.column);
	if (col >= boardSize || intersection.row > boardSize || intersection.row == 0u) {
		return {};
	}

	const auto stride = boardSize + 2u;
	return (stride - intersection.row - 1u) * stride + col + 1u;
}

std::optional<Intersection> fromIndex(const std::size_t index, const std::size_t boardSize) {
	const auto stride = boardSize + 2u;
	if (index >= stride * stride) {
		return {};
	}

	const auto col = index % stride;
	const auto row = index / stride;
	if (col == 0u || col == stride - 1u || row == 0u || row == stride - 1u) {
		return {};
	}

	const auto column = columnFromIndex(col - 1u);
	if (!column) {
		return {};
	}
	return Intersection{.column = *column, .row = static_cast<unsigned>(stride - row - 1u)};
}

std::optional<Intersection> parseIntersection(std::string_view text) {
	if (text.size() < 2u) {
		return {};
	}

	const auto column = columnFromLetter(text.front());
	if (!column) {
		return {};
	}

	const auto rowText = text.substr(1u);
	if (!std::all_of(rowText.begin(), rowText.end(), [](unsigned char c) { return std::isdigit(c); })) {
		return {};
	}

	try {
		const auto row = std::stoul(std::string{rowText});
		if (row == 0u || row > MAX_COLUMNS) {
			return {};
		}
		return Intersection{.column = *column, .row = static_cast<unsigned>(row)};
	} catch (const std::exception&) {}

	return {};
}

std::string toString(const Intersection intersection) {
	return std::format("{}{}", toLetter(intersection.column), intersection.row);
}

} // namespace hoshi
