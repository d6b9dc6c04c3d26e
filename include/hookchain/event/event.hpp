#pragma once

/// @file event.hpp
/// @brief Main include header for hookchain_event
///
/// hookchain_event composes listeners over an external hook dispatcher:
/// - EventCatalog: known hooks, their target kinds and argument names
/// - SyntheticExpander: composite events ("after_save" = insert or update)
/// - Registrar: routed listen/unlisten over the Dispatcher interface
/// - ChainBuilder: listeners that wait for a sequence of hooks
/// - lifecycle helpers and ModelValidators built on top of them
///
/// ## Quick Start
///
/// ```cpp
/// using namespace hookchain_event;
///
/// Registrar registrar(dispatcher, default_catalog());
///
/// // Any of insert/update on the mapper
/// auto subs = registrar.listen(mapper, "after_save", [](const Args& args) { ... });
///
/// // Insert, then the flush of the session owning the inserted object
/// auto chain = ChainBuilder(registrar, mapper, "after_insert")
///     .chain(owning_session_resolver(dispatcher), "after_flush_postexec")
///     .apply([](const Args& args) { ... });
///
/// chain->remove();
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "catalog.hpp"
#include "synthetic.hpp"
#include "dispatcher.hpp"
#include "registrar.hpp"
#include "listener.hpp"
#include "lifecycle.hpp"
#include "validation.hpp"

namespace hookchain_event {

/// Prelude - commonly used types
namespace prelude {
    using hookchain_event::Target;
    using hookchain_event::TargetKind;
    using hookchain_event::Args;
    using hookchain_event::KwArgs;
    using hookchain_event::EventCatalog;
    using hookchain_event::Registrar;
    using hookchain_event::ChainBuilder;
    using hookchain_event::RegisteredChain;
    using hookchain_event::DeferredTarget;
    using hookchain_event::ListenerOptions;
} // namespace prelude

} // namespace hookchain_event
