#include "engine/vertex.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <format>
#include <string>

namespace clockgo::engine {

//! Column letters. 'I' is skipped to avoid confusion with 'J' and '1'.
static constexpr std::string_view COLUMNS = "ABCDEFGHJKLMNOPQRSTUVWXYZ";
static_assert(COLUMNS.size() == MAX_BOARD_SIZE);

static bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
	return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

std::optional<Action> parseVertex(const std::string_view text, const std::size_t boardSize) {
	if (equalsIgnoreCase(text, "pass")) {
		return PassAction{};
	}
	if (text.size() < 2u) {
		return {};
	}

	const auto column = COLUMNS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(text.front()))));
	if (column == std::string_view::npos) {
		return {};
	}

	const auto digits = text.substr(1);
	if (!std::ranges::all_of(digits, [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
		return {};
	}

	unsigned long row = 0;
	try {
		row = std::stoul(std::string{digits});
	} catch (const std::exception&) {
		return {};
	}

	const auto x = static_cast<std::size_t>(column) + 1u;
	if (x > boardSize || row < 1u || row > boardSize) {
		return {};
	}

	return PutAction{Coord{static_cast<Id>(x), static_cast<Id>(row)}};
}

char columnLetter(const Id x) {
	assert(x >= 1u && x <= COLUMNS.size());
	return COLUMNS[x - 1u];
}

std::string toVertex(const Coord c) {
	return std::format("{}{}", columnLetter(c.x), c.y);
}

std::string toVertex(const Action& action) {
	if (const auto* put = std::get_if<PutAction>(&action)) {
		return toVertex(put->c);
	}
	return "pass";
}

} // namespace clockgo::engine
