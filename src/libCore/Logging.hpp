#pragma once

#include "Logger/Logger.hpp"

namespace clockgo {

//! Returns the logger instance of the core library.
Logging::Logger Logger();

} // namespace clockgo
