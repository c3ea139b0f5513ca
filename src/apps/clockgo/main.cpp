#include "engine/engineConfig.hpp"
#include "engine/gtpEngine.hpp"
#include "engine/randomMoveGenerator.hpp"

#include <format>
#include <iostream>
#include <memory>
#include <random>

int main(int argc, char* argv[]) {
	using namespace clockgo::engine;

	EngineConfig config{};
	if (argc > 1) {
		const auto loaded = loadConfig(argv[1]);
		if (!loaded) {
			std::cerr << std::format("[ClockGo] Invalid configuration file '{}'.\n", argv[1]);
			return 1;
		}
		config = *loaded;
	}

	const auto seed = config.seed ? *config.seed : std::random_device{}();
	GtpEngine engine(config, std::make_unique<RandomMoveGenerator>(config.genmoveAttempts, seed));
	engine.run(std::cin, std::cout);

	return 0;
}
