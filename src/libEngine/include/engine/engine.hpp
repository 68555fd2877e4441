#pragma once

#include "core/board.hpp"
#include "engine/searchConfig.hpp"
#include "engine/searchTree.hpp"

#include <random>
#include <utility>

namespace hoshi::engine {

//! Monte Carlo tree search for one move request.
//! The tree and all its nodes live as long as this object.
class MonteCarloSearch {
public:
	//! Search for a move of color on board. The board is copied into the root node.
	MonteCarloSearch(const Board& board, Color color, SearchConfig config = {});

	//! Run iterations of selection, expansion, simulation and backpropagation.
	//! \returns Resign if color should resign at the root, the move of the most visited root child or Pass.
	Move run(unsigned iterations);

	const SearchTree& tree() const;

private:
	//! True after two passes in a row or when the side to move at the node should resign.
	bool isGameOver(NodeId id) const;

	//! Add children for candidate moves of the side to move.
	//! \returns The first child linked, empty if the game is over at the node or no candidate was legal.
	std::optional<NodeId> expand(NodeId id);

	//! Play out from a node, adding every ply to the tree.
	//! \returns The final node and its score estimate.
	std::pair<NodeId, double> simulate(NodeId id);

private:
	Color m_color;
	SearchConfig m_config;
	SearchTree m_tree;
	std::mt19937 m_rng;
};

//! Generate a move for color on board with the given number of search iterations.
Move generateMove(const Board& board, Color color, unsigned iterations, const SearchConfig& config = {});

} // namespace hoshi::engine
