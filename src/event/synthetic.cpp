/// @file synthetic.cpp
/// @brief SyntheticExpander implementation

#include <hookchain/event/synthetic.hpp>
#include <hookchain/core/log.hpp>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

const ExpansionTable& builtin_expansions() {
    static const ExpansionTable table{
        {"before_save", {"before_insert", "before_update"}},
        {"after_save", {"after_insert", "after_update"}},
        {"before_touch", {"before_insert", "before_update", "before_delete"}},
        {"after_touch", {"after_insert", "after_update", "after_delete"}},
    };
    return table;
}

SyntheticExpander::SyntheticExpander(const EventCatalog& catalog, ExpansionTable table)
    : m_catalog(&catalog), m_table(std::move(table)) {}

Result<std::vector<std::string>> SyntheticExpander::expand(const std::string& name) const {
    auto it = m_table.find(name);
    if (it != m_table.end()) {
        return it->second;
    }
    if (m_catalog->contains(name)) {
        return std::vector<std::string>{name};
    }
    return Err<std::vector<std::string>>(EventError::unknown_event(name));
}

Result<void> SyntheticExpander::define(const std::string& name, std::vector<std::string> primitives) {
    if (!m_catalog->contains(name)) {
        return Err(EventError::unknown_event(name));
    }
    if (primitives.empty()) {
        return Err(EventError::invalid_state(name, "composite needs at least one primitive"));
    }

    for (const auto& primitive : primitives) {
        if (is_composite(primitive) || primitive == name) {
            return Err(EventError::invalid_state(name, "composite member '" + primitive + "' is not primitive"));
        }
        if (!m_catalog->contains(primitive)) {
            return Err(EventError::unknown_event(primitive));
        }
    }

    hookchain_core::event_logger()->debug("Defined composite event {} with {} members", name, primitives.size());
    m_table.insert_or_assign(name, std::move(primitives));
    return Ok();
}

} // namespace hookchain_event
