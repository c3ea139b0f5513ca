#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <set>

namespace clockgo {

//! A chain of connected same coloured stones together with its liberties.
//! \note The group does not know its colour or id. Both are stored by the board owning it.
class Group {
public:
	Group() = default;
	explicit Group(Coord stone); //!< Single stone group without liberties.

	void addStone(Coord c);      //!< Add a stone. The point stops being a liberty.
	void addLiberty(Coord c);    //!< Add an empty adjacent point.
	bool removeLiberty(Coord c); //!< Remove a liberty. Returns false if c was no liberty.

	//! Destructive merge of other into this group.
	//! Liberties which are stones of the merged group afterwards are dropped.
	void absorb(Group&& other);

	std::size_t stoneCount() const;
	std::size_t libertyCount() const;
	bool isDead() const; //!< True if no liberty is left.

	bool hasStone(Coord c) const;
	bool hasLiberty(Coord c) const;

	const std::set<Coord>& stones() const;
	const std::set<Coord>& liberties() const;

	bool operator==(const Group&) const = default;

private:
	std::set<Coord> m_stones{};
	std::set<Coord> m_liberties{};
};

using GroupTable = std::map<GroupId, Group>;

//! Returns the smallest non-negative id which is not a key of the table.
GroupId nextGroupId(const GroupTable& groups);

} // namespace clockgo
