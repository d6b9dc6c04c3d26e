#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hookchain_core module

#include <cstdint>

namespace hookchain_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct EventError;
struct ConfigError;
class Error;
class Exception;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

enum class MergePolicy : std::uint8_t;
struct EngineConfig;

} // namespace hookchain_core
