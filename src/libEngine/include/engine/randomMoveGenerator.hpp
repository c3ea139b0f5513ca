#pragma once

#include "engine/IMoveGenerator.hpp"

#include <cstdint>
#include <random>

namespace clockgo::engine {

//! Plays a uniformly random legal point. Falls back to the first legal point, then to a pass.
class RandomMoveGenerator : public IMoveGenerator {
public:
	static constexpr unsigned DEFAULT_ATTEMPTS = 10u;

	RandomMoveGenerator(unsigned attempts, std::uint64_t seed);

	Action generate(Board& board, Player player) override;

private:
	unsigned m_attempts;  //!< Random tries before scanning the board.
	std::mt19937_64 m_rng;
};

} // namespace clockgo::engine
