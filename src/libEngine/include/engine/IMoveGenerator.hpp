#pragma once

#include "core/board.hpp"
#include "core/move.hpp"

namespace clockgo::engine {

//! Chooses a move and plays it on the given board.
//! \note Implementations only use the public board operations.
class IMoveGenerator {
public:
	virtual ~IMoveGenerator()                                = default;
	virtual Action generate(Board& board, Player player) = 0; //!< Returns the move which was played.
};

} // namespace clockgo::engine
