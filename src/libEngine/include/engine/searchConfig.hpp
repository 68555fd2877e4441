#pragma once

#include <cstdint>
#include <numbers>
#include <optional>

namespace hoshi::engine {

//! Tunables of the Monte Carlo tree search.
struct SearchConfig {
	double explorationConstant{std::numbers::sqrt2}; //!< UCT exploration weight C.
	unsigned maxPlayoutPlies{1500u};                  //!< Playout length cap.
	double resignThreshold{60.0};                     //!< Score deficit at which the side to move resigns.
	unsigned resignAfterMove{100u};                   //!< Resignation is only considered after this move number.
	std::optional<uint32_t> seed{};                   //!< Fixed random seed. Seeded from std::random_device if empty.
};

} // namespace hoshi::engine
