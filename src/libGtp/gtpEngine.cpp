#include "gtp/gtpEngine.hpp"

#include "Logging.hpp"
#include "engine/engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <limits>
#include <sstream>

namespace hoshi::gtp {

static constexpr std::string_view PROTOCOL_VERSION = "2";
static constexpr std::string_view ENGINE_NAME      = "Hoshi";

//! Strip comments and control characters, then split at whitespace.
static std::vector<std::string> tokenize(const std::string& line) {
	std::string cleaned;
	for (const char c: line) {
		if (c == '#') {
			break;
		}
		if (c == '\t') {
			cleaned += ' ';
		} else if (!std::iscntrl(static_cast<unsigned char>(c))) {
			cleaned += c;
		}
	}

	std::vector<std::string> tokens;
	std::istringstream stream{cleaned};
	for (std::string token; stream >> token;) {
		tokens.push_back(token);
	}
	return tokens;
}

static bool isNumber(const std::string& text) {
	return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

GtpEngine::GtpEngine(GtpConfig config) : m_config{config}, m_board{config.boardSize} {
	m_board.setKomi(m_config.komi);
}

const std::vector<GtpEngine::Command>& GtpEngine::commands() {
	static const std::vector<Command> table{
	        {"protocol_version", &GtpEngine::protocolVersion},
	        {"name", &GtpEngine::name},
	        {"version", &GtpEngine::version},
	        {"known_command", &GtpEngine::knownCommand},
	        {"list_commands", &GtpEngine::listCommands},
	        {"quit", &GtpEngine::quit},
	        {"boardsize", &GtpEngine::boardSize},
	        {"clear_board", &GtpEngine::clearBoard},
	        {"komi", &GtpEngine::komi},
	        {"play", &GtpEngine::play},
	        {"genmove", &GtpEngine::genMove},
	        {"showboard", &GtpEngine::showBoard},
	        {"estimate_score", &GtpEngine::estimateScore},
	        {"final_score", &GtpEngine::finalScore},
	        {"hoshi-iterations", &GtpEngine::setIterations},
	};
	return table;
}

std::string GtpEngine::handle(const std::string& line) {
	auto tokens = tokenize(line);
	if (tokens.empty()) {
		return {};
	}

	std::string id;
	if (isNumber(tokens.front())) {
		id = tokens.front();
		tokens.erase(tokens.begin());
	}

	Response response{.success = false, .text = "unknown command"};
	if (!tokens.empty()) {
		const auto commandName = tokens.front();
		const Arguments args(tokens.begin() + 1, tokens.end());

		const auto& table = commands();
		const auto it     = std::find_if(table.begin(), table.end(), [&](const Command& c) { return c.name == commandName; });
		if (it != table.end()) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Gtp] Command '{}'.", line));
			response = (this->*(it->handler))(args);
		}

		if (!response.success) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Gtp] Command '{}' failed: {}", line, response.text));
		}
	}

	return std::format("{}{} {}\n\n", response.success ? '=' : '?', id, response.text);
}

bool GtpEngine::quitRequested() const {
	return m_quit;
}

const Board& GtpEngine::board() const {
	return m_board;
}

unsigned GtpEngine::iterations() const {
	return m_config.iterations;
}

GtpEngine::Response GtpEngine::protocolVersion(const Arguments&) {
	return {true, std::string{PROTOCOL_VERSION}};
}

GtpEngine::Response GtpEngine::name(const Arguments&) {
	return {true, std::string{ENGINE_NAME}};
}

GtpEngine::Response GtpEngine::version(const Arguments&) {
	return {true, HOSHI_VERSION};
}

GtpEngine::Response GtpEngine::knownCommand(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, "syntax error"};
	}

	const auto& table = commands();
	const bool known  = std::any_of(table.begin(), table.end(), [&](const Command& c) { return c.name == args.front(); });
	return {true, known ? "true" : "false"};
}

GtpEngine::Response GtpEngine::listCommands(const Arguments&) {
	std::string list;
	for (const auto& command: commands()) {
		if (!list.empty()) {
			list += '\n';
		}
		list += command.name;
	}
	return {true, list};
}

GtpEngine::Response GtpEngine::quit(const Arguments&) {
	m_quit = true;
	return {true, ""};
}

GtpEngine::Response GtpEngine::boardSize(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, "syntax error"};
	}

	const auto size = parseBoardSize(args.front());
	if (!size) {
		return {false, "unacceptable size"};
	}

	m_config.boardSize = *size;
	m_board            = Board{*size};
	m_board.setKomi(m_config.komi);
	Logger().Log(Logging::LogLevel::Info, std::format("[Gtp] New {}x{} board.", *size, *size));
	return {true, ""};
}

GtpEngine::Response GtpEngine::clearBoard(const Arguments&) {
	m_board = Board{m_board.size()};
	m_board.setKomi(m_config.komi);
	Logger().Log(Logging::LogLevel::Info, "[Gtp] Board cleared.");
	return {true, ""};
}

GtpEngine::Response GtpEngine::komi(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, "syntax error"};
	}

	try {
		std::size_t parsed = 0;
		const auto value   = std::stod(args.front(), &parsed);
		if (parsed == args.front().size() && std::isfinite(value)) {
			m_config.komi = value;
			m_board.setKomi(value);
			return {true, ""};
		}
	} catch (const std::exception&) {}

	return {false, "syntax error"};
}

GtpEngine::Response GtpEngine::play(const Arguments& args) {
	if (args.size() != 2u) {
		return {false, "syntax error"};
	}

	const auto color = parseColor(args[0]);
	if (!color) {
		return {false, "syntax error"};
	}

	const auto move = parseMove(*color, args[1]);
	if (!move) {
		return {false, "syntax error"};
	}

	if (std::holds_alternative<Resign>(*move)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Gtp] {} resigned.", toString(*color)));
		return {true, ""};
	}

	if (!m_board.play(*move)) {
		return {false, "illegal move"};
	}
	return {true, ""};
}

GtpEngine::Response GtpEngine::genMove(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, "syntax error"};
	}

	const auto color = parseColor(args.front());
	if (!color) {
		return {false, "syntax error"};
	}

	const auto move = engine::generateMove(m_board, *color, m_config.iterations, m_config.search);
	if (!std::holds_alternative<Resign>(move) && !m_board.play(move)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Gtp] Generated move {} is illegal.", toString(move)));
		return {false, "generated illegal move"};
	}
	return {true, toString(move)};
}

GtpEngine::Response GtpEngine::showBoard(const Arguments&) {
	auto diagram = m_board.render();
	if (!diagram.empty() && diagram.back() == '\n') {
		diagram.pop_back();
	}
	return {true, "\n" + diagram};
}

GtpEngine::Response GtpEngine::estimateScore(const Arguments&) {
	return {true, std::format("{}", m_board.estimateScore())};
}

GtpEngine::Response GtpEngine::finalScore(const Arguments&) {
	const auto score = m_board.estimateScore();
	if (score > 0.0) {
		return {true, std::format("B+{}", score)};
	}
	if (score < 0.0) {
		return {true, std::format("W+{}", -score)};
	}
	return {true, "0"};
}

GtpEngine::Response GtpEngine::setIterations(const Arguments& args) {
	if (args.size() != 1u || !isNumber(args.front())) {
		return {false, "syntax error"};
	}

	try {
		const auto value = std::stoul(args.front());
		if (value >= 1u && value <= std::numeric_limits<unsigned>::max()) {
			m_config.iterations = static_cast<unsigned>(value);
			return {true, ""};
		}
	} catch (const std::exception&) {}

	return {false, "invalid iteration count"};
}

} // namespace hoshi::gtp
