#pragma once

/// @file config.hpp
/// @brief Engine configuration for hookchain
///
/// Configuration is read from JSON:
/// ```json
/// {
///   "log": { "level": "debug", "console": true, "file": false, "directory": "logs" },
///   "registrar": { "validate_target_kinds": true },
///   "catalog": { "synthetic_policy": "reject" }
/// }
/// ```
/// Every key is optional; missing keys keep their defaults.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace hookchain_core {

/// How a catalog merge treats a name that is already present
enum class MergePolicy : std::uint8_t {
    Reject,    ///< Fail with EventError::duplicate_event
    Override,  ///< Replace the existing entry (last registered wins)
};

[[nodiscard]] const char* merge_policy_name(MergePolicy policy);

/// Top-level engine configuration
struct EngineConfig {
    LogConfig log;
    /// Check that a listen target's kind matches the hook's declared kind
    bool validate_target_kinds = true;
    /// Policy used when synthetic catalog entries are merged over primitives
    MergePolicy synthetic_policy = MergePolicy::Reject;
};

/// Parse configuration from JSON text
[[nodiscard]] Result<EngineConfig> parse_config(const std::string& json_text);

/// Load configuration from a JSON file
[[nodiscard]] Result<EngineConfig> load_config(const std::filesystem::path& path);

/// Apply the logging part of a configuration
void apply_config(const EngineConfig& config);

} // namespace hookchain_core
