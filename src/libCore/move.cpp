#include "core/move.hpp"

#include <algorithm>
#include <cctype>

namespace hoshi {

static bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
	return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
		       return std::tolower(a) == std::tolower(b);
	       });
}

std::optional<Move> parseMove(const Color color, std::string_view text) {
	if (equalsIgnoreCase(text, "pass")) {
		return Pass{};
	}
	if (equalsIgnoreCase(text, "resign")) {
		return Resign{};
	}
	if (const auto intersection = parseIntersection(text)) {
		return Place{.intersection = *intersection, .color = color};
	}
	return {};
}

static std::string toString(const Pass&) {
	return "pass";
}
static std::string toString(const Place& place) {
	return toString(place.intersection);
}
static std::string toString(const Resign&) {
	return "resign";
}

std::string toString(const Move& move) {
	return std::visit([&](auto&& mv) { return toString(mv); }, move);
}

} // namespace hoshi
