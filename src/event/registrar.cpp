/// @file registrar.cpp
/// @brief Registrar implementation

#include <hookchain/event/registrar.hpp>
#include <hookchain/core/log.hpp>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Error;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

namespace {

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += (i + 1 == names.size()) ? " and " : ", ";
        }
        out += names[i];
    }
    return out;
}

} // anonymous namespace

Registrar::Registrar(Dispatcher& dispatcher, const EventCatalog& catalog, RegistrarConfig config)
    : m_dispatcher(&dispatcher)
    , m_catalog(&catalog)
    , m_expander(catalog)
    , m_config(config) {}

Result<void> Registrar::check_target(const Target& target, const std::string& event) const {
    if (!m_config.validate_target_kinds) {
        return Ok();
    }

    const auto* descriptor = m_catalog->find(event);
    if (descriptor == nullptr || descriptor->target_kind == TargetKind::Unknown) {
        return Ok();
    }
    if (descriptor->target_kind != target.kind) {
        return Err(EventError::target_mismatch(event,
            target_kind_name(descriptor->target_kind), target_kind_name(target.kind)));
    }
    return Ok();
}

Result<Subscriptions> Registrar::listen(
    const Target& target, const std::string& event, HookCallback callback, bool once)
{
    return listen_routed(target, event,
        [cb = std::move(callback)](const std::string&, const Args& args) { cb(args); },
        once);
}

Result<Subscriptions> Registrar::listen_routed(
    const Target& target, const std::string& event, RoutedCallback callback, bool once)
{
    auto expanded = m_expander.expand(event);
    if (!expanded) {
        return Err<Subscriptions>(expanded.error());
    }

    auto checked = check_target(target, event);
    if (!checked) {
        return Err<Subscriptions>(checked.error());
    }

    const auto& hooks = expanded.value();
    for (const auto& hook : hooks) {
        auto hook_checked = check_target(target, hook);
        if (!hook_checked) {
            return Err<Subscriptions>(hook_checked.error());
        }
    }

    Subscriptions installed;
    installed.reserve(hooks.size());

    for (const auto& hook : hooks) {
        auto id = m_dispatcher->listen(target, hook,
            [callback, hook](const Args& args) { callback(hook, args); },
            once);
        if (!id) {
            // Leave nothing half-registered
            auto rolled_back = unlisten(installed);
            if (!rolled_back) {
                hookchain_core::event_logger()->warn("Rollback of '{}' on {} failed: {}",
                    event, to_string(target), rolled_back.error().message());
            }
            Error err = id.error();
            err.with_context("event", event).with_context("target", to_string(target));
            return Err<Subscriptions>(std::move(err));
        }

        installed.push_back(Subscription{target, event, hook, *id, once});
    }

    if (m_expander.is_composite(event)) {
        hookchain_core::event_logger()->debug("Registered {} for {} on {}: {} synthetic event",
            once ? "one time listener" : "listener", join(hooks), to_string(target), event);
    }

    return installed;
}

Result<void> Registrar::unlisten(const Subscription& subscription) {
    return m_dispatcher->unlisten(subscription.target, subscription.hook, subscription.id);
}

Result<void> Registrar::unlisten(const Subscriptions& subscriptions) {
    Result<void> first = Ok();
    for (const auto& subscription : subscriptions) {
        auto removed = unlisten(subscription);
        if (!removed && first.is_ok()) {
            first = std::move(removed);
        }
    }
    return first;
}

} // namespace hookchain_event
