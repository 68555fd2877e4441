#pragma once

#include "core/board.hpp"
#include "core/move.hpp"
#include "core/zobristHash.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace hoshi::engine {

using NodeId = std::size_t; //!< Handle of a node in the search tree arena.

//! One position reached by one line of play.
struct SearchNode {
	Board board;                       //!< Position at this node.
	Color playedLastMove;              //!< Color that played the move into this node.
	std::optional<Move> move{};        //!< Move into this node. Empty for the root.
	std::optional<NodeId> parent{};    //!< Node this one was first created from.
	std::vector<NodeId> children{};    //!< Positions reached from this one.
	unsigned visits{0};                //!< Simulations passing through this node.
	unsigned wins{0};                  //!< Simulations won by playedLastMove.
	unsigned consecutivePasses{0};     //!< Passes in a row leading into this node.
	std::optional<double> score{};     //!< Outcome of the simulation that ended here.
};

//! UCT priority of a child. Unvisited children have infinite priority.
double uctScore(unsigned wins, unsigned visits, unsigned parentVisits, double explorationConstant);

//! Arena of search nodes. Parent and child links are handles into the arena.
//! Nodes with equal board and last mover are stored once.
class SearchTree {
public:
	//! Create the tree with a root at board. playedLastMove is the color not to move.
	SearchTree(Board board, Color playedLastMove);

	NodeId root() const;
	std::size_t size() const;
	const SearchNode& node(NodeId id) const;

	//! Link the node for (board, playedLastMove) below parent, creating it if it is not in the tree yet.
	//! \note Invalidates references returned by node().
	NodeId addChild(NodeId parent, Board board, Color playedLastMove, const Move& move);

	//! Descend from the root to a node without children, following the highest UCT score.
	//! The first child with the maximum score wins ties.
	NodeId select(double explorationConstant) const;

	//! Count a simulation with given outcome (positive favours black) from node up to the root.
	void backpropagate(NodeId id, double outcome);

	void setScore(NodeId id, double score);

	//! True if the two last moves into the node were passes.
	bool isTerminal(NodeId id) const;

	//! Move into the most visited child of the root. Empty if the root has no children.
	std::optional<Move> bestMove() const;

private:
	std::optional<NodeId> find(uint64_t hash, const Board& board, Color playedLastMove) const;

private:
	std::vector<SearchNode> m_nodes{};                  //!< Node arena. The root is at index 0.
	ZobristHash m_hasher;                               //!< Hasher for the board size of this tree.
	std::unordered_multimap<uint64_t, NodeId> m_index{}; //!< Position hash to nodes holding it.
};

} // namespace hoshi::engine
