#pragma once

#include "core/move.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace clockgo::engine {

//! Parse a GTP vertex ("D4", "q16", "pass") for a board of the given size.
//! Returns empty for malformed text or a point outside the board.
std::optional<Action> parseVertex(std::string_view text, std::size_t boardSize);

char columnLetter(Id x);                   //!< Letter of column x \in [1, MAX_BOARD_SIZE]
std::string toVertex(Coord c);             //!< Upper case vertex of a board point.
std::string toVertex(const Action& action); //!< Vertex of a point or "pass".

} // namespace clockgo::engine
