#pragma once

/// @file registrar.hpp
/// @brief Registration runtime over the external dispatcher
///
/// The Registrar is the only component that talks to the Dispatcher. It
/// routes composite names through the SyntheticExpander, optionally checks
/// target kinds against the catalog, and returns one Subscription per
/// primitive hook so callers can remove exactly what they installed.

#include "fwd.hpp"
#include "catalog.hpp"
#include "dispatcher.hpp"
#include "synthetic.hpp"

#include <hookchain/core/config.hpp>
#include <hookchain/core/error.hpp>

#include <functional>
#include <string>
#include <vector>

namespace hookchain_event {

/// One primitive registration installed on the dispatcher
struct Subscription {
    Target target;
    /// Event name as requested (possibly a composite)
    std::string event;
    /// Primitive hook actually registered
    std::string hook;
    ListenerId id;
    bool once = false;
};

using Subscriptions = std::vector<Subscription>;

/// Callback that is also told which primitive hook fired
using RoutedCallback = std::function<void(const std::string& hook, const Args& args)>;

struct RegistrarConfig {
    bool validate_target_kinds = true;

    [[nodiscard]] static RegistrarConfig from(const hookchain_core::EngineConfig& config) {
        return RegistrarConfig{config.validate_target_kinds};
    }
};

class Registrar {
public:
    /// Dispatcher and catalog must outlive the registrar and every chain
    /// registered through it.
    Registrar(Dispatcher& dispatcher, const EventCatalog& catalog, RegistrarConfig config = {});

    Registrar(const Registrar&) = delete;
    Registrar& operator=(const Registrar&) = delete;

    /// Register a callback for an event on a target. A composite event
    /// installs one independent subscription per member, all sharing the
    /// callback and once flag.
    [[nodiscard]] hookchain_core::Result<Subscriptions> listen(
        const Target& target, const std::string& event, HookCallback callback, bool once = false);

    /// Same as listen(), the callback also receives the primitive hook name
    [[nodiscard]] hookchain_core::Result<Subscriptions> listen_routed(
        const Target& target, const std::string& event, RoutedCallback callback, bool once = false);

    /// Remove one subscription
    hookchain_core::Result<void> unlisten(const Subscription& subscription);

    /// Remove several subscriptions; all are attempted, the first failure is returned
    hookchain_core::Result<void> unlisten(const Subscriptions& subscriptions);

    /// Expand an event name (see SyntheticExpander::expand)
    [[nodiscard]] hookchain_core::Result<std::vector<std::string>> expand(const std::string& event) const {
        return m_expander.expand(event);
    }

    [[nodiscard]] Dispatcher& dispatcher() noexcept { return *m_dispatcher; }
    [[nodiscard]] const EventCatalog& catalog() const noexcept { return *m_catalog; }
    [[nodiscard]] SyntheticExpander& expander() noexcept { return m_expander; }
    [[nodiscard]] const SyntheticExpander& expander() const noexcept { return m_expander; }
    [[nodiscard]] const RegistrarConfig& config() const noexcept { return m_config; }

private:
    hookchain_core::Result<void> check_target(const Target& target, const std::string& event) const;

    Dispatcher* m_dispatcher;
    const EventCatalog* m_catalog;
    SyntheticExpander m_expander;
    RegistrarConfig m_config;
};

} // namespace hookchain_event
