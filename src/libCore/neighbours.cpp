#include "core/neighbours.hpp"

#include <cassert>

namespace clockgo {

static constexpr std::array<int, 4> kDx{-1, 0, 1, 0};
static constexpr std::array<int, 4> kDy{0, -1, 0, 1};

void Neighbours::push(const Coord c) {
	assert(m_count < m_coords.size());
	m_coords[m_count++] = c;
}

Neighbours::const_iterator Neighbours::begin() const {
	return m_coords.begin();
}

Neighbours::const_iterator Neighbours::end() const {
	return m_coords.begin() + static_cast<std::ptrdiff_t>(m_count);
}

std::size_t Neighbours::size() const {
	return m_count;
}

Neighbours neighboursOf(const Coord c, const std::size_t boardSize) {
	assert(c.x >= 1u && c.y >= 1u && c.x <= boardSize && c.y <= boardSize);

	Neighbours result;
	for (std::size_t i = 0; i < kDx.size(); ++i) {
		const int nx = static_cast<int>(c.x) + kDx[i];
		const int ny = static_cast<int>(c.y) + kDy[i];
		if (nx < 1 || ny < 1 || nx > static_cast<int>(boardSize) || ny > static_cast<int>(boardSize))
			continue;

		result.push(Coord{static_cast<Id>(nx), static_cast<Id>(ny)});
	}
	return result;
}

} // namespace clockgo
