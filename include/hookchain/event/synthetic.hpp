#pragma once

/// @file synthetic.hpp
/// @brief Expansion of composite event names into primitive hooks
///
/// A composite event such as "after_save" stands for "any of" several
/// primitive hooks. Registering a composite installs one independent
/// subscription per primitive, each invoking the same callback.

#include "fwd.hpp"
#include "catalog.hpp"

#include <hookchain/core/error.hpp>

#include <map>
#include <string>
#include <vector>

namespace hookchain_event {

/// Composite name to ordered primitive hook names
using ExpansionTable = std::map<std::string, std::vector<std::string>>;

/// The before/after save and touch composites
[[nodiscard]] const ExpansionTable& builtin_expansions();

class SyntheticExpander {
public:
    /// The catalog must outlive the expander
    explicit SyntheticExpander(const EventCatalog& catalog,
                               ExpansionTable table = builtin_expansions());

    /// Primitive hooks an event stands for.
    /// A composite yields its expansion, a known primitive yields itself and
    /// anything else fails with EventError::unknown_event.
    [[nodiscard]] hookchain_core::Result<std::vector<std::string>> expand(const std::string& name) const;

    [[nodiscard]] bool is_composite(const std::string& name) const {
        return m_table.find(name) != m_table.end();
    }

    /// Define or replace a composite. The name needs a catalog descriptor and
    /// every member must be a known primitive.
    hookchain_core::Result<void> define(const std::string& name, std::vector<std::string> primitives);

    [[nodiscard]] const ExpansionTable& table() const noexcept { return m_table; }
    [[nodiscard]] const EventCatalog& catalog() const noexcept { return *m_catalog; }

private:
    const EventCatalog* m_catalog;
    ExpansionTable m_table;
};

} // namespace hookchain_event
