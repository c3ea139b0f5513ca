#include "core/group.hpp"

namespace clockgo {

Group::Group(const Coord stone) : m_stones{stone} {
}

void Group::addStone(const Coord c) {
	m_liberties.erase(c);
	m_stones.insert(c);
}

void Group::addLiberty(const Coord c) {
	m_liberties.insert(c);
}

bool Group::removeLiberty(const Coord c) {
	return m_liberties.erase(c) > 0u;
}

void Group::absorb(Group&& other) {
	m_stones.merge(other.m_stones);
	m_liberties.merge(other.m_liberties);

	std::erase_if(m_liberties, [&](const Coord c) { return m_stones.contains(c); });

	other.m_stones.clear();
	other.m_liberties.clear();
}

std::size_t Group::stoneCount() const {
	return m_stones.size();
}

std::size_t Group::libertyCount() const {
	return m_liberties.size();
}

bool Group::isDead() const {
	return m_liberties.empty();
}

bool Group::hasStone(const Coord c) const {
	return m_stones.contains(c);
}

bool Group::hasLiberty(const Coord c) const {
	return m_liberties.contains(c);
}

const std::set<Coord>& Group::stones() const {
	return m_stones;
}

const std::set<Coord>& Group::liberties() const {
	return m_liberties;
}

GroupId nextGroupId(const GroupTable& groups) {
	// Keys are sorted, the first gap in the sequence 0, 1, 2, ... is the free id.
	GroupId candidate = 0u;
	for (const auto& [id, group]: groups) {
		if (id != candidate)
			break;
		++candidate;
	}
	return candidate;
}

} // namespace clockgo
