#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>

namespace clockgo {

//! Fixed capacity buffer holding the (at most four) orthogonal neighbours of a point.
class Neighbours {
public:
	using const_iterator = std::array<Coord, 4>::const_iterator;

	void push(Coord c);

	const_iterator begin() const;
	const_iterator end() const;
	std::size_t size() const;

private:
	std::array<Coord, 4> m_coords{};
	std::size_t m_count{0u};
};

//! Orthogonal neighbours of c on a board of the given size. Diagonals are not adjacent.
//! \note The buffer is a copy, callers may modify the board while iterating over it.
Neighbours neighboursOf(Coord c, std::size_t boardSize);

} // namespace clockgo
