#pragma once

#include "core/types.hpp"
#include "engine/randomMoveGenerator.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace clockgo::engine {

//! Settings of the GTP engine.
struct EngineConfig {
	std::string name{"ClockGo"};                                    //!< Reported by 'name'.
	std::string version{"0.1"};                                     //!< Reported by 'version'.
	std::size_t boardSize{DEFAULT_BOARD_SIZE};                      //!< Board size at startup.
	double komi{5.5};                                               //!< Komi at startup.
	unsigned genmoveAttempts{RandomMoveGenerator::DEFAULT_ATTEMPTS}; //!< Random tries of 'genmove'.
	std::optional<std::uint64_t> seed{};                            //!< Fixed seed of the move generator.
};

//! Parse a JSON configuration. Missing keys keep their default. Empty on invalid input.
std::optional<EngineConfig> parseConfig(const std::string& json);

//! Read and parse a JSON configuration file. Empty if the file cannot be read or is invalid.
std::optional<EngineConfig> loadConfig(const std::filesystem::path& path);

} // namespace clockgo::engine
