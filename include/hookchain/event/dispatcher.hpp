#pragma once

/// @file dispatcher.hpp
/// @brief Interface of the external hook dispatch system
///
/// hookchain does not fire hooks itself. An adapter over the object store's
/// dispatcher implements this interface; the registration runtime only ever
/// calls listen() and unlisten() on it.

#include "fwd.hpp"
#include "types.hpp"

#include <hookchain/core/error.hpp>

#include <optional>
#include <string>

namespace hookchain_event {

class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    /// Register a callback for a primitive hook on a target.
    /// A once listener must be removed by the dispatcher before it is invoked.
    [[nodiscard]] virtual hookchain_core::Result<ListenerId> listen(
        const Target& target, const std::string& hook, HookCallback callback, bool once) = 0;

    /// Remove a callback previously returned by listen()
    virtual hookchain_core::Result<void> unlisten(
        const Target& target, const std::string& hook, ListenerId id) = 0;

    /// Unit of work (session) owning an object, if it has one
    [[nodiscard]] virtual std::optional<Target> owning_unit_of_work(const Target& object) const = 0;
};

} // namespace hookchain_event
