#pragma once

/// @file catalog.hpp
/// @brief Registry of known hooks and their argument shapes
///
/// The catalog maps every hook name the dispatcher declares (plus the
/// synthetic composite names) to the kind of target it is registered on and
/// the ordered names of the arguments it fires with. It is built once from
/// static tables and is read-only afterwards.

#include "fwd.hpp"
#include "types.hpp"

#include <hookchain/core/config.hpp>
#include <hookchain/core/error.hpp>

#include <map>
#include <span>
#include <string>
#include <vector>

namespace hookchain_event {

using hookchain_core::MergePolicy;

// =============================================================================
// Hook tables
// =============================================================================

/// One hook of a hook class: its name and ordered parameter names
struct HookSignature {
    std::string name;
    std::vector<std::string> params;
};

/// A group of hooks the dispatcher declares for one kind of target
struct HookClass {
    std::string name;
    TargetKind target_kind = TargetKind::Unknown;
    std::vector<HookSignature> hooks;
};

/// A hand-declared composite descriptor
struct SyntheticEntry {
    std::string name;
    HookDescriptor descriptor;
};

/// Hook classes of the ORM dispatcher: pool, engine, dialect, DDL, session,
/// mapper, instance, attribute, query and instrumentation hooks.
[[nodiscard]] const std::vector<HookClass>& builtin_hook_classes();

/// Descriptors of the built-in composite events (before/after save/touch)
[[nodiscard]] const std::vector<SyntheticEntry>& builtin_synthetic_entries();

// =============================================================================
// EventCatalog
// =============================================================================

class EventCatalog {
public:
    EventCatalog() = default;

    /// Build the catalog from the built-in tables
    [[nodiscard]] static hookchain_core::Result<EventCatalog> builtin(
        MergePolicy synthetic_policy = MergePolicy::Reject);

    /// Add a single entry
    hookchain_core::Result<void> insert(const std::string& name, HookDescriptor descriptor,
                                        MergePolicy policy = MergePolicy::Reject);

    /// Add every hook of a hook class
    hookchain_core::Result<void> merge_hook_class(const HookClass& hook_class,
                                                  MergePolicy policy = MergePolicy::Reject);

    /// Add synthetic descriptors
    hookchain_core::Result<void> merge_synthetic(std::span<const SyntheticEntry> entries,
                                                 MergePolicy policy = MergePolicy::Reject);

    /// Look up a hook by name; fails with EventError::unknown_event
    [[nodiscard]] hookchain_core::Result<HookDescriptor> lookup(const std::string& name) const;

    /// Find a hook by name, or nullptr
    [[nodiscard]] const HookDescriptor* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return m_entries.find(name) != m_entries.end();
    }

    [[nodiscard]] bool is_synthetic(const std::string& name) const {
        const auto* descriptor = find(name);
        return descriptor != nullptr && descriptor->synthetic;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /// All hook names in lexical order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Names of the hooks registered on a given target kind
    [[nodiscard]] std::vector<std::string> names_for(TargetKind kind) const;

private:
    std::map<std::string, HookDescriptor> m_entries;
};

/// Process-wide catalog built from the built-in tables on first use.
/// Throws hookchain_core::Exception if the built-in tables collide.
[[nodiscard]] const EventCatalog& default_catalog();

} // namespace hookchain_event
