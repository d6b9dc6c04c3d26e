/// @file catalog.cpp
/// @brief EventCatalog construction and lookup

#include <hookchain/event/catalog.hpp>
#include <hookchain/core/log.hpp>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Error;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

Result<EventCatalog> EventCatalog::builtin(MergePolicy synthetic_policy) {
    EventCatalog catalog;

    for (const auto& hook_class : builtin_hook_classes()) {
        auto merged = catalog.merge_hook_class(hook_class, MergePolicy::Reject);
        if (!merged) {
            return Err<EventCatalog>(merged.error());
        }
    }

    auto merged = catalog.merge_synthetic(builtin_synthetic_entries(), synthetic_policy);
    if (!merged) {
        return Err<EventCatalog>(merged.error());
    }

    hookchain_core::event_logger()->debug("Built event catalog with {} hooks", catalog.size());
    return catalog;
}

Result<void> EventCatalog::insert(const std::string& name, HookDescriptor descriptor, MergePolicy policy) {
    auto it = m_entries.find(name);
    if (it != m_entries.end()) {
        if (policy == MergePolicy::Reject) {
            return Err(EventError::duplicate_event(name));
        }
        hookchain_core::event_logger()->warn("Catalog entry '{}' ({}) overridden by {} entry",
            name, target_kind_name(it->second.target_kind),
            descriptor.synthetic ? "synthetic" : "primitive");
        it->second = std::move(descriptor);
        return Ok();
    }

    m_entries.emplace(name, std::move(descriptor));
    return Ok();
}

Result<void> EventCatalog::merge_hook_class(const HookClass& hook_class, MergePolicy policy) {
    for (const auto& hook : hook_class.hooks) {
        auto inserted = insert(hook.name, HookDescriptor{hook_class.target_kind, hook.params, false}, policy);
        if (!inserted) {
            Error err = inserted.error();
            err.with_context("hook_class", hook_class.name);
            return Err(std::move(err));
        }
    }
    return Ok();
}

Result<void> EventCatalog::merge_synthetic(std::span<const SyntheticEntry> entries, MergePolicy policy) {
    for (const auto& entry : entries) {
        HookDescriptor descriptor = entry.descriptor;
        descriptor.synthetic = true;
        auto inserted = insert(entry.name, std::move(descriptor), policy);
        if (!inserted) {
            return inserted;
        }
    }
    return Ok();
}

Result<HookDescriptor> EventCatalog::lookup(const std::string& name) const {
    const auto* descriptor = find(name);
    if (descriptor == nullptr) {
        return Err<HookDescriptor>(EventError::unknown_event(name));
    }
    return *descriptor;
}

const HookDescriptor* EventCatalog::find(const std::string& name) const {
    auto it = m_entries.find(name);
    return it != m_entries.end() ? &it->second : nullptr;
}

std::vector<std::string> EventCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& [name, _] : m_entries) {
        result.push_back(name);
    }
    return result;
}

std::vector<std::string> EventCatalog::names_for(TargetKind kind) const {
    std::vector<std::string> result;
    for (const auto& [name, descriptor] : m_entries) {
        if (descriptor.target_kind == kind) {
            result.push_back(name);
        }
    }
    return result;
}

const EventCatalog& default_catalog() {
    static const EventCatalog catalog = EventCatalog::builtin().unwrap();
    return catalog;
}

} // namespace hookchain_event
