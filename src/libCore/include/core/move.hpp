#pragma once

#include "core/group.hpp"
#include "core/types.hpp"

#include <variant>
#include <vector>

namespace clockgo {

struct PutAction {
	Coord c;

	bool operator==(const PutAction&) const = default;
};
struct PassAction {
	bool operator==(const PassAction&) const = default;
};

using Action = std::variant<PutAction, PassAction>;

//! Entry of the board history. Holds everything required to take the move back.
struct Move {
	Player player;               //!< Player who made the move.
	Action action;               //!< Stone placement or pass.
	std::vector<Group> captured; //!< Groups removed by the move in capture order.
};

} // namespace clockgo
