#pragma once

#include "core/board.hpp"
#include "engine/searchConfig.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hoshi::gtp {

//! Defaults of a protocol session.
struct GtpConfig {
	std::size_t boardSize{19u};          //!< Board size after startup.
	double komi{DEFAULT_KOMI};           //!< Komi after startup. Kept across board resets.
	unsigned iterations{100u};           //!< Search iterations per genmove.
	engine::SearchConfig search{};       //!< Search tunables.
};

//! Go Text Protocol front end for one board.
//! \note Not thread safe. The controller issues one command at a time.
class GtpEngine {
public:
	explicit GtpEngine(GtpConfig config = {});

	//! Process one command line.
	//! \returns Full response text ("=[id] result\n\n" or "?[id] message\n\n"), empty for blank and comment lines.
	std::string handle(const std::string& line);

	bool quitRequested() const; //!< Whether the quit command was received.
	const Board& board() const;
	unsigned iterations() const;

private:
	using Arguments = std::vector<std::string>;

	struct Response {
		bool success;
		std::string text;
	};

	using Handler = Response (GtpEngine::*)(const Arguments&);
	struct Command {
		std::string_view name;
		Handler handler;
	};

	static const std::vector<Command>& commands();

	Response protocolVersion(const Arguments& args);
	Response name(const Arguments& args);
	Response version(const Arguments& args);
	Response knownCommand(const Arguments& args);
	Response listCommands(const Arguments& args);
	Response quit(const Arguments& args);
	Response boardSize(const Arguments& args);
	Response clearBoard(const Arguments& args);
	Response komi(const Arguments& args);
	Response play(const Arguments& args);
	Response genMove(const Arguments& args);
	Response showBoard(const Arguments& args);
	Response estimateScore(const Arguments& args);
	Response finalScore(const Arguments& args);
	Response setIterations(const Arguments& args);

private:
	GtpConfig m_config;
	Board m_board;
	bool m_quit{false};
};

} // namespace hoshi::gtp
