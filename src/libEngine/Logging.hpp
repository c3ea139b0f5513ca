#pragma once

#include "Logger/Logger.hpp"

namespace clockgo::engine {

//! Returns the logger instance of the GTP engine.
Logging::Logger Logger();

} // namespace clockgo::engine
