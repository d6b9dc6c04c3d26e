#pragma once

/// @file types.hpp
/// @brief Value types shared by the hookchain event modules

#include "fwd.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hookchain_event {

// =============================================================================
// TargetKind
// =============================================================================

/// Kind of object a hook is registered against
enum class TargetKind : std::uint8_t {
    Unknown = 0,
    Pool,
    Engine,
    Dialect,
    SchemaItem,
    Session,
    Mapper,
    ClassManager,
    Attribute,
    Query,
    Instrumentation,
    Instance,  ///< Model object; appears in fired arguments only
};

[[nodiscard]] const char* target_kind_name(TargetKind kind);

// =============================================================================
// Target
// =============================================================================

/// Handle to an object owned by the external dispatch system.
/// Identity is (kind, id); the label is only used for logging.
struct Target {
    TargetKind kind = TargetKind::Unknown;
    std::uint64_t id = 0;
    std::string label;

    Target() = default;
    Target(TargetKind k, std::uint64_t i, std::string l = {})
        : kind(k), id(i), label(std::move(l)) {}

    [[nodiscard]] bool is_valid() const noexcept { return kind != TargetKind::Unknown; }

    bool operator==(const Target& other) const noexcept {
        return kind == other.kind && id == other.id;
    }
    bool operator!=(const Target& other) const noexcept { return !(*this == other); }
    bool operator<(const Target& other) const noexcept {
        if (kind != other.kind) {
            return kind < other.kind;
        }
        return id < other.id;
    }
};

[[nodiscard]] std::string to_string(const Target& target);

// =============================================================================
// Arguments
// =============================================================================

/// One argument supplied by the dispatcher when a hook fires
using Value = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    Target,
    std::vector<Target>
>;

/// Positional arguments, in the order the dispatcher supplies them
using Args = std::vector<Value>;

/// Arguments keyed by declared parameter name
using KwArgs = std::map<std::string, Value>;

/// Get the target held by a value, or nullptr
[[nodiscard]] inline const Target* as_target(const Value& value) {
    return std::get_if<Target>(&value);
}

[[nodiscard]] std::string to_string(const Value& value);
[[nodiscard]] std::string to_string(const Args& args);

/// Zip names against values, stopping at the shorter of the two.
/// A repeated name keeps the later value.
[[nodiscard]] KwArgs zip_kwargs(const std::vector<std::string>& names, const Args& args);

// =============================================================================
// HookDescriptor
// =============================================================================

/// Target kind and ordered parameter names of a hook
struct HookDescriptor {
    TargetKind target_kind = TargetKind::Unknown;
    std::vector<std::string> param_names;
    bool synthetic = false;

    [[nodiscard]] std::size_t arg_count() const noexcept { return param_names.size(); }

    [[nodiscard]] KwArgs kwargs(const Args& args) const {
        return zip_kwargs(param_names, args);
    }
};

// =============================================================================
// Listener identity
// =============================================================================

/// Identifier the dispatcher hands out for a registered callback
struct ListenerId {
    std::uint64_t id = 0;

    constexpr ListenerId() = default;
    constexpr explicit ListenerId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const ListenerId&) const noexcept = default;
    constexpr bool operator==(const ListenerId&) const noexcept = default;
};

/// Callback the dispatcher invokes with the fired arguments
using HookCallback = std::function<void(const Args&)>;

} // namespace hookchain_event
