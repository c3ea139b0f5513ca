#include "engine/engineConfig.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace clockgo::engine {

using nlohmann::json;

namespace {

//! Read an optional key. False if present with a wrong type.
template <typename T>
bool readKey(const json& object, const char* key, T& value) {
	const auto it = object.find(key);
	if (it == object.end()) {
		return true;
	}

	if constexpr (std::is_same_v<T, std::string>) {
		if (!it->is_string())
			return false;
	} else if constexpr (std::is_floating_point_v<T>) {
		if (!it->is_number())
			return false;
	} else {
		if (!it->is_number_unsigned())
			return false;
	}

	value = it->template get<T>();
	return true;
}

} // namespace

std::optional<EngineConfig> parseConfig(const std::string& text) {
	const auto root = json::parse(text, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		Logger().Log(Logging::LogLevel::Warning, "[EngineConfig] Configuration is not a JSON object.");
		return {};
	}

	EngineConfig config{};
	std::uint64_t seed = 0u;
	if (!readKey(root, "name", config.name) || !readKey(root, "version", config.version) || !readKey(root, "boardSize", config.boardSize) ||
	    !readKey(root, "komi", config.komi) || !readKey(root, "genmoveAttempts", config.genmoveAttempts) || !readKey(root, "seed", seed)) {
		Logger().Log(Logging::LogLevel::Warning, "[EngineConfig] Configuration contains a key of the wrong type.");
		return {};
	}

	if (config.boardSize < 1u || config.boardSize > MAX_BOARD_SIZE) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[EngineConfig] Unsupported board size {}.", config.boardSize));
		return {};
	}
	if (root.contains("seed")) {
		config.seed = seed;
	}

	return config;
}

std::optional<EngineConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[EngineConfig] Cannot open '{}'.", path.string()));
		return {};
	}

	std::stringstream content;
	content << file.rdbuf();
	return parseConfig(content.str());
}

} // namespace clockgo::engine
