/// @file error.cpp
/// @brief Error handling implementation for hookchain_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <hookchain/core/error.hpp>
#include <sstream>
#include <vector>

namespace hookchain_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format event error with full context
std::string format_event_error(const EventError& err) {
    std::ostringstream oss;
    oss << "[EventError] " << err.message;

    if (!err.event_name.empty()) {
        oss << " (event: " << err.event_name << ")";
    }
    if (!err.expected.empty() && !err.found.empty()) {
        oss << " (expected: " << err.expected << ", found: " << err.found << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, EventError>) {
            oss << detail::format_event_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace hookchain_core
