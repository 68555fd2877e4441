#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace hoshi {

static std::string toLower(std::string_view text) {
	std::string lower{text};
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower;
}

std::optional<Color> parseColor(std::string_view text) {
	const auto lower = toLower(text);
	if (lower == "b" || lower == "black") {
		return Color::Black;
	}
	if (lower == "w" || lower == "white") {
		return Color::White;
	}
	return {};
}

std::optional<std::size_t> parseBoardSize(std::string_view text) {
	if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
		return {};
	}

	try {
		const auto size = static_cast<std::size_t>(std::stoul(std::string{text}));
		if (isValidBoardSize(size)) {
			return size;
		}
	} catch (const std::exception&) {}

	return {};
}

std::string toString(const Color color) {
	return color == Color::Black ? "black" : "white";
}

} // namespace hoshi
