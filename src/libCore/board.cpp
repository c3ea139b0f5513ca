#include "core/board.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace clockgo {

static constexpr char LOG_REJECT_OFFBOARD[] = "[Board] Rejected play at ({}, {}): point is off the board.";
static constexpr char LOG_REJECT_OCCUPIED[] = "[Board] Rejected play at ({}, {}): point is occupied.";
static constexpr char LOG_REJECT_KO[]       = "[Board] Rejected play at ({}, {}): ko.";
static constexpr char LOG_REJECT_SUICIDE[]  = "[Board] Rejected play at ({}, {}): suicide.";

//! Log the broken invariant and stop. There is no way to repair the grid/group mapping.
[[noreturn]] static void corrupted(const std::string& message) {
	Logger().Log(Logging::LogLevel::Error, std::format("[Board] {}", message));
	throw std::runtime_error(std::format("Board state corrupted: {}", message));
}

Board::Board() = default;

bool Board::resize(const std::size_t size) {
	if (size < 1u || size > MAX_BOARD_SIZE) {
		return false;
	}

	clear();
	m_size = size;
	return true;
}

void Board::clear() {
	for (auto& column: m_grid) {
		column.fill(std::nullopt);
	}
	m_groups.clear();
	m_history.clear();
	m_dead = {};
	m_ko.reset();
}

bool Board::play(const Player player, const Coord c) {
	if (!isOnBoard(c)) {
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT_OFFBOARD, c.x, c.y));
		return false;
	}
	if (!isEmpty(c)) {
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT_OCCUPIED, c.x, c.y));
		return false;
	}
	if (m_ko == c) {
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT_KO, c.x, c.y));
		return false;
	}

	const auto enemy      = opponent(player);
	const auto neighbours = neighboursOf(c, m_size);

	// The new stone starts as its own group.
	const auto id = nextGroupId(m_groups);
	cell(c)       = Stone{player, id};
	m_groups.emplace(id, Group{c});

	std::vector<Group> captured;
	std::vector<GroupId> reduced; //!< Enemy groups which lost the liberty c and survived.
	for (const auto n: neighbours) {
		const auto stone = at(n);
		if (!stone || stone->player != enemy) {
			continue;
		}

		auto& group = groupRef(stone->group);
		if (!group.removeLiberty(c)) {
			continue; // Group already handled through another neighbour.
		}

		if (group.isDead()) {
			capture(stone->group, enemy, captured);
		} else {
			reduced.push_back(stone->group);
		}
	}

	if (captured.empty() && !keepsLiberty(player, c, neighbours)) {
		for (const auto reducedId: reduced) {
			groupRef(reducedId).addLiberty(c);
		}
		m_groups.erase(id);
		cell(c).reset();

		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT_SUICIDE, c.x, c.y));
		return false;
	}

	// Liberties of the stone itself. Points freed by captures were added while capturing.
	for (const auto n: neighbours) {
		if (isEmpty(n)) {
			groupRef(id).addLiberty(n);
		}
	}

	auto current = id;
	for (const auto n: neighbours) {
		const auto stone = at(n);
		if (stone && stone->player == player && stone->group != current) {
			current = merge(current, stone->group);
		}
	}

	m_history.push_back(Move{.player = player, .action = PutAction{c}, .captured = std::move(captured)});
	updateKo();
	return true;
}

void Board::pass(const Player player) {
	m_history.push_back(Move{.player = player, .action = PassAction{}, .captured = {}});
	m_ko.reset();
}

bool Board::undo() {
	if (m_history.empty()) {
		return false;
	}

	auto move = std::move(m_history.back());
	m_history.pop_back();

	if (const auto* put = std::get_if<PutAction>(&move.action)) {
		takeBack(move.player, put->c, move.captured);
		Logger().Log(Logging::LogLevel::Debug, std::format("[Board] Took back stone at ({}, {}).", put->c.x, put->c.y));
	}

	updateKo();
	return true;
}

std::size_t Board::size() const {
	return m_size;
}

bool Board::isOnBoard(const Coord c) const {
	return c.x >= 1u && c.y >= 1u && c.x <= m_size && c.y <= m_size;
}

bool Board::isEmpty(const Coord c) const {
	return !at(c).has_value();
}

Intersection Board::at(const Coord c) const {
	assert(isOnBoard(c));
	return m_grid[c.x - 1u][c.y - 1u];
}

const Grid& Board::grid() const {
	return m_grid;
}

const GroupTable& Board::groups() const {
	return m_groups;
}

const Group* Board::groupAt(const Coord c) const {
	if (!isOnBoard(c)) {
		return nullptr;
	}

	const auto stone = at(c);
	if (!stone) {
		return nullptr;
	}

	const auto it = m_groups.find(stone->group);
	return it == m_groups.end() ? nullptr : &it->second;
}

std::vector<Coord> Board::libertiesOf(const Coord c) const {
	const auto* group = groupAt(c);
	if (!group) {
		return {};
	}
	return {group->liberties().begin(), group->liberties().end()};
}

DeadStones Board::deadStones() const {
	return m_dead;
}

std::optional<Coord> Board::ko() const {
	return m_ko;
}

const std::vector<Move>& Board::history() const {
	return m_history;
}

Intersection& Board::cell(const Coord c) {
	assert(isOnBoard(c));
	return m_grid[c.x - 1u][c.y - 1u];
}

Group& Board::groupRef(const GroupId id) {
	const auto it = m_groups.find(id);
	if (it == m_groups.end()) {
		corrupted(std::format("Stone refers to unknown group {}.", id));
	}
	return it->second;
}

unsigned& Board::deadCount(const Player player) {
	return player == Player::Black ? m_dead.black : m_dead.white;
}

bool Board::keepsLiberty(const Player player, const Coord c, const Neighbours& neighbours) const {
	std::set<Coord> liberties;
	for (const auto n: neighbours) {
		const auto stone = at(n);
		if (!stone) {
			liberties.insert(n);
		} else if (stone->player == player) {
			const auto& friendly = m_groups.at(stone->group);
			liberties.insert(friendly.liberties().begin(), friendly.liberties().end());
		}
	}
	liberties.erase(c);

	return !liberties.empty();
}

void Board::capture(const GroupId id, const Player player, std::vector<Group>& captured) {
	auto node = m_groups.extract(id);
	assert(!node.empty());

	const auto& group = node.mapped();
	for (const auto s: group.stones()) {
		cell(s).reset();
	}

	// Every vacated point becomes a liberty of the groups touching it.
	for (const auto s: group.stones()) {
		for (const auto n: neighboursOf(s, m_size)) {
			if (const auto stone = at(n)) {
				groupRef(stone->group).addLiberty(s);
			}
		}
	}

	deadCount(player) += static_cast<unsigned>(group.stoneCount());
	captured.push_back(std::move(node.mapped()));
}

GroupId Board::merge(const GroupId first, const GroupId second) {
	// Larger group absorbs the smaller one. On a tie the second group is kept.
	const auto [keep, drop] = groupRef(first).stoneCount() > groupRef(second).stoneCount() ? std::pair{first, second} : std::pair{second, first};

	auto& target = groupRef(keep);
	auto node    = m_groups.extract(drop);
	for (const auto s: node.mapped().stones()) {
		cell(s)->group = keep;
	}
	target.absorb(std::move(node.mapped()));

	return keep;
}

void Board::takeBack(const Player player, const Coord c, std::vector<Group>& captured) {
	const auto stone = at(c);
	if (!stone || stone->player != player) {
		corrupted(std::format("Expected stone of the last move at ({}, {}).", c.x, c.y));
	}

	auto node = m_groups.extract(stone->group);
	if (node.empty()) {
		corrupted(std::format("Stone at ({}, {}) refers to unknown group {}.", c.x, c.y, stone->group));
	}
	cell(c).reset();

	// The removed stone may have been the only link between parts of its group.
	auto remaining = node.mapped().stones();
	remaining.erase(c);
	splitStones(std::move(remaining), player);

	for (auto& group: captured) {
		restoreGroup(std::move(group), opponent(player), c);
	}

	// Enemy groups which survived the move get their liberty back.
	for (const auto n: neighboursOf(c, m_size)) {
		if (const auto neighbour = at(n)) {
			groupRef(neighbour->group).addLiberty(c);
		}
	}
}

void Board::splitStones(std::set<Coord> stones, const Player player) {
	while (!stones.empty()) {
		const auto id    = nextGroupId(m_groups);
		const auto start = *stones.begin();
		stones.erase(stones.begin());

		Group group{start};
		std::vector<Coord> worklist{start};
		while (!worklist.empty()) {
			const auto s = worklist.back();
			worklist.pop_back();
			cell(s) = Stone{player, id};

			for (const auto n: neighboursOf(s, m_size)) {
				if (stones.erase(n) > 0u) {
					group.addStone(n);
					worklist.push_back(n);
				} else if (isEmpty(n)) {
					group.addLiberty(n);
				}
			}
		}

		m_groups.emplace(id, std::move(group));
	}
}

void Board::restoreGroup(Group group, const Player player, const Coord capturedBy) {
	const auto id = nextGroupId(m_groups);
	for (const auto s: group.stones()) {
		if (!isEmpty(s)) {
			corrupted(std::format("Cannot restore captured stone at ({}, {}): point is occupied.", s.x, s.y));
		}
		cell(s) = Stone{player, id};
	}

	// Undo the liberties handed out when the group was captured.
	for (const auto s: group.stones()) {
		for (const auto n: neighboursOf(s, m_size)) {
			const auto stone = at(n);
			if (stone && stone->player != player) {
				groupRef(stone->group).removeLiberty(s);
			}
		}
	}

	group.addLiberty(capturedBy);
	deadCount(player) -= static_cast<unsigned>(group.stoneCount());
	m_groups.emplace(id, std::move(group));
}

void Board::updateKo() {
	m_ko.reset();
	if (m_history.empty()) {
		return;
	}

	// Ko only follows a single stone capture by a single stone left in atari.
	const auto& last = m_history.back();
	const auto* put  = std::get_if<PutAction>(&last.action);
	if (!put || last.captured.size() != 1u || last.captured.front().stoneCount() != 1u) {
		return;
	}

	const auto* group = groupAt(put->c);
	if (group && group->stoneCount() == 1u && group->libertyCount() == 1u) {
		m_ko = *last.captured.front().stones().begin();
	}
}

} // namespace clockgo
