#pragma once

#include "Logger/Logger.hpp"

namespace hoshi::engine {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hoshi::engine
