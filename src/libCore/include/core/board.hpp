#pragma once

#include "core/group.hpp"
#include "core/move.hpp"
#include "core/neighbours.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <set>
#include <vector>

namespace clockgo {

//! Content of an occupied intersection.
struct Stone {
	Player player;
	GroupId group;

	bool operator==(const Stone&) const = default;
};

using Intersection = std::optional<Stone>; //!< Empty or a stone.
using Grid         = std::array<std::array<Intersection, MAX_BOARD_SIZE>, MAX_BOARD_SIZE>;

//! Number of stones of each colour captured since the board was cleared.
struct DeadStones {
	unsigned black{0u};
	unsigned white{0u};

	bool operator==(const DeadStones&) const = default;
};

//! Go board applying the rules of capture, suicide and simple ko.
//! Keeps the stone grid, the groups, the history and the ko point consistent after every call.
//! Rejected calls leave the board unchanged.
class Board {
public:
	Board(); //!< Empty board of default size.

	bool resize(std::size_t size); //!< Clear and change size. False (unchanged board) if size is not in [1, MAX_BOARD_SIZE].
	void clear();                  //!< Remove stones, groups, history, captures and ko. Keeps the size.

	//! Put a stone of player at c. Returns false if the point is occupied, the ko point or the move is suicide.
	bool play(Player player, Coord c);
	void pass(Player player); //!< Player passes. Clears the ko point.
	bool undo();              //!< Take back the last move. False if history is empty.

public:
	std::size_t size() const;
	bool isOnBoard(Coord c) const;
	bool isEmpty(Coord c) const;
	Intersection at(Coord c) const; //!< Intersection at given coordinate (x,y) \in [1, size]

	const Grid& grid() const;
	const GroupTable& groups() const;
	const Group* groupAt(Coord c) const;            //!< Group occupying c. Null for an empty point.
	std::vector<Coord> libertiesOf(Coord c) const; //!< Liberties of the group at c. Empty for an empty point.

	DeadStones deadStones() const;
	std::optional<Coord> ko() const; //!< Point the next move may not occupy.
	const std::vector<Move>& history() const;

private:
	Intersection& cell(Coord c);
	Group& groupRef(GroupId id);
	unsigned& deadCount(Player player);

	bool keepsLiberty(Player player, Coord c, const Neighbours& neighbours) const; //!< Would a stone at c have any liberty.
	void capture(GroupId id, Player player, std::vector<Group>& captured);     //!< Remove a dead group from the board.
	GroupId merge(GroupId first, GroupId second);                              //!< Union by size. Returns the surviving id.

	void takeBack(Player player, Coord c, std::vector<Group>& captured);
	void splitStones(std::set<Coord> stones, Player player);            //!< Regroup stones into connected groups.
	void restoreGroup(Group group, Player player, Coord capturedBy);     //!< Put a captured group back on the board.
	void updateKo();                                                    //!< Derive the ko point from the last move.

private:
	std::size_t m_size{DEFAULT_BOARD_SIZE}; //!< Active board extent.
	Grid m_grid{};                          //!< Stone grid, indexed [x-1][y-1].
	GroupTable m_groups{};                  //!< Groups by id.
	std::vector<Move> m_history{};          //!< Played moves. Last entry is the latest move.
	DeadStones m_dead{};                    //!< Captured stones per colour.
	std::optional<Coord> m_ko{};            //!< Active ko point.
};

} // namespace clockgo
