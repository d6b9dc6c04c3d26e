#pragma once

/// @file lifecycle.hpp
/// @brief Listeners for the insert/update/delete/save/touch phases of a model
///
/// The after_* helpers return a ChainBuilder that waits for the mapper hook
/// of the phase and then for the flush of the unit of work that owns the
/// flushed object, so the callback runs once the flush has completed:
///
/// ```cpp
/// auto audit = hookchain_event::after_insert(registrar, order_mapper)
///     .apply([](const hookchain_event::Args& args) { ... });
/// ```
///
/// The before_* helpers hook the session's before_flush and call the
/// callback for every pending object of the model, with the flush
/// arguments followed by the object.

#include "fwd.hpp"
#include "listener.hpp"
#include "registrar.hpp"

#include <hookchain/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace hookchain_event {

/// Persistence phase of a model object
enum class Phase : std::uint8_t {
    Insert,
    Update,
    Delete,
    Save,   ///< Insert or update
    Touch,  ///< Insert, update or delete
};

[[nodiscard]] const char* phase_name(Phase phase);

/// Mapper hook fired after the phase ("after_insert", "after_save", ...)
[[nodiscard]] std::string after_event(Phase phase);

/// Mapper hook fired before the phase ("before_insert", "before_save", ...)
[[nodiscard]] std::string before_event(Phase phase);

// =============================================================================
// UnitOfWorkInspector
// =============================================================================

/// Read access to the pending state of a unit of work, supplied by the
/// object store adapter.
class UnitOfWorkInspector {
public:
    virtual ~UnitOfWorkInspector() = default;

    [[nodiscard]] virtual std::vector<Target> pending_new(const Target& session) const = 0;
    [[nodiscard]] virtual std::vector<Target> pending_dirty(const Target& session) const = 0;
    [[nodiscard]] virtual std::vector<Target> pending_deleted(const Target& session) const = 0;

    /// Mapper of a model object
    [[nodiscard]] virtual std::optional<Target> mapper_of(const Target& instance) const = 0;
};

// =============================================================================
// After helpers
// =============================================================================

/// Resolver returning the unit of work that owns the object at
/// `instance_index` of the fired arguments. The dispatcher must outlive it.
[[nodiscard]] TargetResolver owning_session_resolver(Dispatcher& dispatcher, std::size_t instance_index = 2);

struct AfterOptions {
    /// Hook that ends the chain
    std::string execution_event = "after_flush_postexec";
    /// Target of the execution hook; defaults to the owning session of the
    /// flushed object
    std::optional<StageTarget> execution_target;
    ListenerOptions listener;
};

[[nodiscard]] ChainBuilder after(Registrar& registrar, Phase phase, const Target& mapper,
                                 AfterOptions options = {});

[[nodiscard]] ChainBuilder after_insert(Registrar& registrar, const Target& mapper, AfterOptions options = {});
[[nodiscard]] ChainBuilder after_update(Registrar& registrar, const Target& mapper, AfterOptions options = {});
[[nodiscard]] ChainBuilder after_delete(Registrar& registrar, const Target& mapper, AfterOptions options = {});
[[nodiscard]] ChainBuilder after_save(Registrar& registrar, const Target& mapper, AfterOptions options = {});
[[nodiscard]] ChainBuilder after_touch(Registrar& registrar, const Target& mapper, AfterOptions options = {});

// =============================================================================
// Before helpers
// =============================================================================

/// Call `callback` from the session's before_flush for every pending object
/// of `mapper` in the phase's set. The callback receives the before_flush
/// arguments followed by the object (keyword name "instance").
/// The inspector must outlive the returned chain.
[[nodiscard]] hookchain_core::Result<RegisteredChain> before(
    Registrar& registrar, const UnitOfWorkInspector& inspector, Phase phase,
    const Target& mapper, const Target& session, Callback callback, ListenerOptions options = {});

[[nodiscard]] hookchain_core::Result<RegisteredChain> before_insert(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options = {});
[[nodiscard]] hookchain_core::Result<RegisteredChain> before_update(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options = {});
[[nodiscard]] hookchain_core::Result<RegisteredChain> before_delete(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options = {});
[[nodiscard]] hookchain_core::Result<RegisteredChain> before_save(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options = {});
[[nodiscard]] hookchain_core::Result<RegisteredChain> before_touch(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options = {});

} // namespace hookchain_event
