#include "engine/engine.hpp"

#include "Logging.hpp"
#include "engine/playout.hpp"

#include <format>

namespace hoshi::engine {

static std::mt19937 makeRng(const SearchConfig& config) {
	if (config.seed) {
		return std::mt19937{*config.seed};
	}
	std::random_device rd;
	return std::mt19937{rd()};
}

MonteCarloSearch::MonteCarloSearch(const Board& board, const Color color, SearchConfig config)
    : m_color{color}, m_config{config}, m_tree{board, opponent(color)}, m_rng{makeRng(config)} {
}

const SearchTree& MonteCarloSearch::tree() const {
	return m_tree;
}

Move MonteCarloSearch::run(const unsigned iterations) {
	auto logger = Logger();

	const auto& root = m_tree.node(m_tree.root());
	if (shouldResign(root.board, m_color, m_config)) {
		logger.Log(Logging::LogLevel::Info, std::format("[Search] {} resigns at move {} (score {}).", toString(m_color), root.board.moveNumber(),
		                                                root.board.estimateScore()));
		return Resign{};
	}

	logger.Log(Logging::LogLevel::Info, std::format("[Search] Searching {} iterations for {}.", iterations, toString(m_color)));

	for (unsigned i = 0; i != iterations; ++i) {
		const auto leaf            = m_tree.select(m_config.explorationConstant);
		const auto start           = expand(leaf).value_or(leaf);
		const auto [last, outcome] = simulate(start);
		m_tree.backpropagate(last, outcome);
	}

	const auto best = m_tree.bestMove();
	if (!best) {
		logger.Log(Logging::LogLevel::Info, "[Search] No legal candidate found. Passing.");
		return Pass{};
	}

	logger.Log(Logging::LogLevel::Info, std::format("[Search] Chose {} from {} nodes.", toString(*best), m_tree.size()));
	return *best;
}

bool MonteCarloSearch::isGameOver(const NodeId id) const {
	if (m_tree.isTerminal(id)) {
		return true;
	}

	const auto& node = m_tree.node(id);
	return shouldResign(node.board, opponent(node.playedLastMove), m_config);
}

std::optional<NodeId> MonteCarloSearch::expand(const NodeId id) {
	if (isGameOver(id)) {
		return {};
	}

	// Copy: adding children invalidates node references.
	const Board board  = m_tree.node(id).board;
	const Color player = opponent(m_tree.node(id).playedLastMove);

	std::optional<NodeId> first{};
	for (const auto point: candidateMoves(board, m_rng)) {
		Board next      = board;
		const Move move = Place{.intersection = point, .color = player};
		if (!next.play(move)) {
			continue;
		}

		const auto child = m_tree.addChild(id, std::move(next), player, move);
		if (!first) {
			first = child;
		}
	}
	return first;
}

std::pair<NodeId, double> MonteCarloSearch::simulate(const NodeId id) {
	NodeId current = id;

	for (unsigned ply = 0; ply != m_config.maxPlayoutPlies; ++ply) {
		if (isGameOver(current)) {
			break;
		}

		const auto& node   = m_tree.node(current);
		const Color player = opponent(node.playedLastMove);
		Board next         = node.board;
		const auto move    = playPlayoutMove(next, player, m_rng);
		current            = m_tree.addChild(current, std::move(next), player, move);
	}

	const auto outcome = m_tree.node(current).board.estimateScore();
	m_tree.setScore(current, outcome);
	return {current, outcome};
}

Move generateMove(const Board& board, const Color color, const unsigned iterations, const SearchConfig& config) {
	MonteCarloSearch search{board, color, config};
	return search.run(iterations);
}

} // namespace hoshi::engine
