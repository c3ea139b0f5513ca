#pragma once

#include "core/board.hpp"
#include "engine/IMoveGenerator.hpp"
#include "engine/engineConfig.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clockgo::engine {

//! Go Text Protocol (version 2) front end of a board.
//! Commands are executed one line at a time; the engine owns the board it plays on.
class GtpEngine {
public:
	GtpEngine(EngineConfig config, std::unique_ptr<IMoveGenerator> generator);

	//! Execute one input line. Returns the complete response or nothing for empty and comment lines.
	std::optional<std::string> execute(const std::string& line);

	//! Read commands until 'quit' or end of input. Responses are written and flushed one by one.
	void run(std::istream& input, std::ostream& output);

	bool isRunning() const; //!< False once 'quit' was executed.
	const Board& board() const;
	double komi() const;

private:
	using Arguments = std::vector<std::string>;

	struct Result {
		bool success;
		std::string text;
	};

	using Handler = Result (GtpEngine::*)(const Arguments&);

	struct Command {
		std::string_view name;
		Handler handler;
	};

	static const std::vector<Command>& commands(); //!< Supported commands in 'list_commands' order.

	Result protocolVersion(const Arguments& args);
	Result name(const Arguments& args);
	Result version(const Arguments& args);
	Result knownCommand(const Arguments& args);
	Result listCommands(const Arguments& args);
	Result quit(const Arguments& args);
	Result boardSize(const Arguments& args);
	Result clearBoard(const Arguments& args);
	Result setKomi(const Arguments& args);
	Result play(const Arguments& args);
	Result genMove(const Arguments& args);
	Result undo(const Arguments& args);
	Result showBoard(const Arguments& args);
	Result listGroups(const Arguments& args);

private:
	EngineConfig m_config;
	std::unique_ptr<IMoveGenerator> m_generator;

	Board m_board{};
	double m_komi;
	bool m_running{true};
};

} // namespace clockgo::engine
