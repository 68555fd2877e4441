#pragma once

#include "core/intersection.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hoshi {

struct Pass {
	bool operator==(const Pass&) const = default;
};
struct Place {
	Intersection intersection;
	Color color;

	bool operator==(const Place&) const = default;
};
struct Resign {
	bool operator==(const Resign&) const = default;
};

using Move = std::variant<Pass, Place, Resign>;

//! Parses a vertex, "pass" or "resign" for the given color.
std::optional<Move> parseMove(Color color, std::string_view text);

//! Protocol text of a move: vertex, "pass" or "resign".
std::string toString(const Move& move);

} // namespace hoshi
