#include "engine/gtpEngine.hpp"

#include "Logging.hpp"
#include "engine/vertex.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

namespace clockgo::engine {

static constexpr unsigned PROTOCOL_VERSION = 2u;

static constexpr char ERR_SYNTAX[]       = "syntax error";
static constexpr char ERR_UNKNOWN[]      = "unknown command";
static constexpr char ERR_ILLEGAL_MOVE[] = "illegal move";
static constexpr char ERR_BAD_SIZE[]     = "unacceptable size";
static constexpr char ERR_CANNOT_UNDO[]  = "cannot undo";

namespace {

//! Split a line into words. Drops control characters and comments, tabs separate words.
std::vector<std::string> tokenize(const std::string& line) {
	std::string cleaned;
	for (const char ch: line) {
		if (ch == '#') {
			break;
		}
		if (ch == '\t') {
			cleaned += ' ';
		} else if (std::iscntrl(static_cast<unsigned char>(ch)) == 0) {
			cleaned += ch;
		}
	}

	std::istringstream stream(cleaned);
	std::vector<std::string> tokens;
	for (std::string token; stream >> token;) {
		tokens.push_back(std::move(token));
	}
	return tokens;
}

bool isNumber(std::string_view text) {
	return !text.empty() && std::ranges::all_of(text, [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string toLower(std::string text) {
	std::ranges::transform(text, text.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	return text;
}

std::optional<Player> parsePlayer(const std::string& text) {
	const auto lower = toLower(text);
	if (lower == "b" || lower == "black") {
		return Player::Black;
	}
	if (lower == "w" || lower == "white") {
		return Player::White;
	}
	return {};
}

std::string formatResponse(const bool success, const std::optional<unsigned long> id, const std::string& text) {
	return std::format("{}{} {}\n\n", success ? '=' : '?', id ? std::to_string(*id) : std::string{}, text);
}

} // namespace

GtpEngine::GtpEngine(EngineConfig config, std::unique_ptr<IMoveGenerator> generator)
    : m_config{std::move(config)}, m_generator{std::move(generator)}, m_komi{m_config.komi} {
	if (!m_board.resize(m_config.boardSize)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Invalid board size {} configured. Using {}.", m_config.boardSize, m_board.size()));
	}
}

std::optional<std::string> GtpEngine::execute(const std::string& line) {
	auto tokens = tokenize(line);
	if (tokens.empty()) {
		return {};
	}

	std::optional<unsigned long> id;
	if (isNumber(tokens.front())) {
		try {
			id = std::stoul(tokens.front());
		} catch (const std::exception&) {
			return formatResponse(false, {}, ERR_SYNTAX);
		}
		tokens.erase(tokens.begin());
	}
	if (tokens.empty()) {
		return formatResponse(false, id, ERR_SYNTAX);
	}

	const std::string_view command = tokens.front();
	const Arguments args(tokens.begin() + 1, tokens.end());
	Logger().Log(Logging::LogLevel::Debug, std::format("[GtpEngine] Received '{}'.", line));

	const auto& table = commands();
	const auto it     = std::ranges::find(table, command, &Command::name);
	if (it == table.end()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Unknown command '{}'.", command));
		return formatResponse(false, id, ERR_UNKNOWN);
	}

	const auto result = (this->*(it->handler))(args);
	if (!result.success) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GtpEngine] Command '{}' failed: {}.", line, result.text));
	}
	return formatResponse(result.success, id, result.text);
}

void GtpEngine::run(std::istream& input, std::ostream& output) {
	Logger().Log(Logging::LogLevel::Info, "[GtpEngine] Command loop started.");

	std::string line;
	while (m_running && std::getline(input, line)) {
		if (const auto response = execute(line)) {
			output << *response << std::flush;
		}
	}

	Logger().Log(Logging::LogLevel::Info, "[GtpEngine] Command loop stopped.");
}

bool GtpEngine::isRunning() const {
	return m_running;
}

const Board& GtpEngine::board() const {
	return m_board;
}

double GtpEngine::komi() const {
	return m_komi;
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
	        {"komi", &GtpEngine::setKomi},
	        {"play", &GtpEngine::play},
	        {"genmove", &GtpEngine::genMove},
	        {"undo", &GtpEngine::undo},
	        {"showboard", &GtpEngine::showBoard},
	        {"cg_list_groups", &GtpEngine::listGroups},
	};
	return table;
}

GtpEngine::Result GtpEngine::protocolVersion(const Arguments&) {
	return {true, std::to_string(PROTOCOL_VERSION)};
}

GtpEngine::Result GtpEngine::name(const Arguments&) {
	return {true, m_config.name};
}

GtpEngine::Result GtpEngine::version(const Arguments&) {
	return {true, m_config.version};
}

GtpEngine::Result GtpEngine::knownCommand(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, ERR_SYNTAX};
	}

	const auto& table = commands();
	const bool known  = std::ranges::find(table, std::string_view{args.front()}, &Command::name) != table.end();
	return {true, known ? "true" : "false"};
}

GtpEngine::Result GtpEngine::listCommands(const Arguments&) {
	std::string text;
	for (const auto& command: commands()) {
		if (!text.empty()) {
			text += '\n';
		}
		text += command.name;
	}
	return {true, text};
}

GtpEngine::Result GtpEngine::quit(const Arguments&) {
	m_running = false;
	return {true, ""};
}

GtpEngine::Result GtpEngine::boardSize(const Arguments& args) {
	if (args.size() != 1u || !isNumber(args.front())) {
		return {false, ERR_SYNTAX};
	}

	std::size_t size = 0u;
	try {
		size = std::stoul(args.front());
	} catch (const std::exception&) {
		return {false, ERR_BAD_SIZE};
	}

	if (!m_board.resize(size)) {
		return {false, ERR_BAD_SIZE};
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GtpEngine] Board size set to {}.", size));
	return {true, ""};
}

GtpEngine::Result GtpEngine::clearBoard(const Arguments&) {
	m_board.clear();
	return {true, ""};
}

GtpEngine::Result GtpEngine::setKomi(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, ERR_SYNTAX};
	}

	try {
		std::size_t parsed = 0u;
		const auto komi    = std::stod(args.front(), &parsed);
		if (parsed != args.front().size()) {
			return {false, ERR_SYNTAX};
		}
		m_komi = komi;
	} catch (const std::exception&) {
		return {false, ERR_SYNTAX};
	}
	return {true, ""};
}

GtpEngine::Result GtpEngine::play(const Arguments& args) {
	if (args.size() != 2u) {
		return {false, ERR_SYNTAX};
	}

	const auto player = parsePlayer(args[0]);
	if (!player) {
		return {false, ERR_SYNTAX};
	}
	if (toLower(args[1]) == "resign") {
		return {true, ""};
	}

	// Well formed vertices outside the current board are illegal moves, not syntax errors.
	const auto action = parseVertex(args[1], MAX_BOARD_SIZE);
	if (!action) {
		return {false, ERR_SYNTAX};
	}

	if (std::holds_alternative<PassAction>(*action)) {
		m_board.pass(*player);
		return {true, ""};
	}

	if (!m_board.play(*player, std::get<PutAction>(*action).c)) {
		return {false, ERR_ILLEGAL_MOVE};
	}
	return {true, ""};
}

GtpEngine::Result GtpEngine::genMove(const Arguments& args) {
	if (args.size() != 1u) {
		return {false, ERR_SYNTAX};
	}

	const auto player = parsePlayer(args.front());
	if (!player) {
		return {false, ERR_SYNTAX};
	}

	const auto action = m_generator->generate(m_board, *player);
	return {true, toVertex(action)};
}

GtpEngine::Result GtpEngine::undo(const Arguments&) {
	if (!m_board.undo()) {
		return {false, ERR_CANNOT_UNDO};
	}
	return {true, ""};
}

GtpEngine::Result GtpEngine::showBoard(const Arguments&) {
	const auto size = static_cast<Id>(m_board.size());

	std::string columns = "  ";
	for (Id x = 1u; x <= size; ++x) {
		columns += std::format(" {}", columnLetter(x));
	}

	std::string text = "\n" + columns;
	for (Id y = size; y >= 1u; --y) {
		text += std::format("\n{:>2}", y);
		for (Id x = 1u; x <= size; ++x) {
			const auto stone = m_board.at({x, y});
			text += std::format(" {}", !stone ? '.' : stone->player == Player::Black ? 'X' : 'O');
		}
		text += std::format(" {}", y);
	}
	text += "\n" + columns;

	const auto dead = m_board.deadStones();
	const auto ko   = m_board.ko();
	text += std::format("\nBlack dead: {}\nWhite dead: {}\nKo: {}", dead.black, dead.white, ko ? toVertex(*ko) : "none");
	return {true, text};
}

GtpEngine::Result GtpEngine::listGroups(const Arguments&) {
	// Listed by their smallest stone. Group ids are internal and not printed.
	std::vector<const Group*> groups;
	for (const auto& entry: m_board.groups()) {
		groups.push_back(&entry.second);
	}
	std::ranges::sort(groups, {}, [](const Group* group) { return *group->stones().begin(); });

	std::string text;
	for (const auto* group: groups) {
		const auto stone = m_board.at(*group->stones().begin());
		text += std::format("\n{} stones:", stone && stone->player == Player::White ? "white" : "black");
		for (const auto s: group->stones()) {
			text += " " + toVertex(s);
		}
		text += " liberties:";
		for (const auto liberty: group->liberties()) {
			text += " " + toVertex(liberty);
		}
	}
	return {true, text};
}

} // namespace clockgo::engine
