#include "engine/randomMoveGenerator.hpp"

#include "Logging.hpp"

#include <format>

namespace clockgo::engine {

RandomMoveGenerator::RandomMoveGenerator(const unsigned attempts, const std::uint64_t seed) : m_attempts{attempts}, m_rng{seed} {
}

Action RandomMoveGenerator::generate(Board& board, const Player player) {
	const auto size = static_cast<Id>(board.size());
	std::uniform_int_distribution<Id> dist(1u, size);

	for (unsigned i = 0; i < m_attempts; ++i) {
		const Coord c{dist(m_rng), dist(m_rng)};
		if (board.play(player, c)) {
			return PutAction{c};
		}
	}

	// Random tries failed. Take the first legal point instead.
	for (Id x = 1u; x <= size; ++x) {
		for (Id y = 1u; y <= size; ++y) {
			if (board.play(player, {x, y})) {
				return PutAction{Coord{x, y}};
			}
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[RandomMoveGenerator] No legal point on a {}x{} board. Passing.", size, size));
	board.pass(player);
	return PassAction{};
}

} // namespace clockgo::engine
