#pragma once

/// @file core.hpp
/// @brief Main include header for hookchain_core
///
/// - Error / Result: error values and the Exception used in hook callbacks
/// - Logging: spdlog named loggers
/// - EngineConfig: JSON configuration

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
