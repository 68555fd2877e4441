#include "engine/searchTree.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>

namespace hoshi::engine {

double uctScore(const unsigned wins, const unsigned visits, const unsigned parentVisits, const double explorationConstant) {
	if (visits == 0u) {
		return std::numeric_limits<double>::infinity();
	}

	const auto n        = static_cast<double>(visits);
	const auto exploit  = static_cast<double>(wins) / n;
	const auto explore  = std::sqrt(std::log(static_cast<double>(std::max(parentVisits, 1u))) / n);
	return exploit + explorationConstant * explore;
}

SearchTree::SearchTree(Board board, const Color playedLastMove) : m_hasher{board.size()} {
	const auto hash = m_hasher.hash(board, playedLastMove);
	m_nodes.push_back(SearchNode{.board = std::move(board), .playedLastMove = playedLastMove});
	m_index.emplace(hash, NodeId{0});
}

NodeId SearchTree::root() const {
	return 0u;
}

std::size_t SearchTree::size() const {
	return m_nodes.size();
}

const SearchNode& SearchTree::node(const NodeId id) const {
	assert(id < m_nodes.size());
	return m_nodes[id];
}

std::optional<NodeId> SearchTree::find(const uint64_t hash, const Board& board, const Color playedLastMove) const {
	const auto [first, last] = m_index.equal_range(hash);
	for (auto it = first; it != last; ++it) {
		const auto& candidate = m_nodes[it->second];
		if (candidate.playedLastMove == playedLastMove && candidate.board == board) {
			return it->second;
		}
	}
	return {};
}

NodeId SearchTree::addChild(const NodeId parent, Board board, const Color playedLastMove, const Move& move) {
	assert(parent < m_nodes.size());

	const auto hash = m_hasher.hash(board, playedLastMove);
	auto id         = find(hash, board, playedLastMove);
	if (!id) {
		const auto passes = std::holds_alternative<Pass>(move) ? m_nodes[parent].consecutivePasses + 1u : 0u;

		id = m_nodes.size();
		m_nodes.push_back(SearchNode{
		        .board             = std::move(board),
		        .playedLastMove    = playedLastMove,
		        .move              = move,
		        .parent            = parent,
		        .consecutivePasses = passes,
		});
		m_index.emplace(hash, *id);
	}

	// Board equality includes the move number, so a reused node is never an ancestor of parent.
	auto& children = m_nodes[parent].children;
	if (std::find(children.begin(), children.end(), *id) == children.end()) {
		children.push_back(*id);
	}
	return *id;
}

NodeId SearchTree::select(const double explorationConstant) const {
	NodeId current = root();

	while (!m_nodes[current].children.empty()) {
		const auto& parent = m_nodes[current];

		NodeId best     = parent.children.front();
		double bestUct = -std::numeric_limits<double>::infinity();
		for (const auto childId: parent.children) {
			const auto& child = m_nodes[childId];
			const auto uct    = uctScore(child.wins, child.visits, parent.visits, explorationConstant);
			if (uct > bestUct) {
				bestUct = uct;
				best    = childId;
			}
		}
		current = best;
	}

	return current;
}

void SearchTree::backpropagate(const NodeId id, const double outcome) {
	std::optional<NodeId> current = id;
	while (current) {
		auto& node = m_nodes[*current];
		++node.visits;

		const bool blackWins = outcome > 0.0;
		const bool whiteWins = outcome < 0.0;
		if ((blackWins && node.playedLastMove == Color::Black) || (whiteWins && node.playedLastMove == Color::White)) {
			++node.wins;
		}

		current = node.parent;
	}
}

void SearchTree::setScore(const NodeId id, const double score) {
	assert(id < m_nodes.size());
	m_nodes[id].score = score;
}

bool SearchTree::isTerminal(const NodeId id) const {
	return node(id).consecutivePasses >= 2u;
}

std::optional<Move> SearchTree::bestMove() const {
	const auto& children = m_nodes[root()].children;

	std::optional<NodeId> best{};
	for (const auto childId: children) {
		if (!best || m_nodes[childId].visits > m_nodes[*best].visits) {
			best = childId;
		}
	}

	if (!best) {
		return {};
	}
	return m_nodes[*best].move;
}

} // namespace hoshi::engine
