#pragma once

#include <compare>
#include <cstddef>

namespace clockgo {

using Id      = unsigned; //!< Coordinate component used by the core library.
using GroupId = unsigned; //!< Key of a group in the board's group table.

inline constexpr std::size_t MAX_BOARD_SIZE     = 25u; //!< Largest supported board extent.
inline constexpr std::size_t DEFAULT_BOARD_SIZE = 19u;

//! Coordinate pair for the board.
//! \note Coordinates are 1-indexed: (1,1) is the lower left corner, x is the column.
struct Coord {
	Id x, y;

	auto operator<=>(const Coord&) const = default;
};

enum class Player { Black = 1, White = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

} // namespace clockgo
