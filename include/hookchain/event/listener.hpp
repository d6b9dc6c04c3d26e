#pragma once

/// @file listener.hpp
/// @brief Chained hook listeners
///
/// A chain waits for a sequence of hooks, possibly on targets computed from
/// earlier arguments, before running its callback with every argument
/// accumulated along the way.
///
/// ```cpp
/// hookchain_event::Registrar registrar(dispatcher, hookchain_event::default_catalog());
///
/// auto chain = hookchain_event::ChainBuilder(registrar, order_mapper, "after_insert")
///     .chain(hookchain_event::DeferredTarget{resolve_session}, "after_flush_postexec")
///     .apply([](const hookchain_event::Args& args) {
///         // mapper, connection, target, session, flush_context
///     });
/// ```
///
/// Stage 0 stays registered and starts a new attempt on every firing unless
/// ListenerOptions::once is set. Every later stage is registered once per
/// attempt, against the target resolved from the previous firing, and
/// removes itself after it fires.

#include "fwd.hpp"
#include "registrar.hpp"
#include "types.hpp"

#include <hookchain/core/error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hookchain_event {

// =============================================================================
// Callbacks and conditions
// =============================================================================

using PositionalCallback = std::function<void(const Args&)>;
using KeywordCallback = std::function<void(const KwArgs&)>;

/// Final chain callback; the alternative must match ListenerOptions::use_kwargs
using Callback = std::variant<PositionalCallback, KeywordCallback>;

using PositionalCondition = std::function<bool(const Args&)>;
using KeywordCondition = std::function<bool(const KwArgs&)>;

/// Stage condition evaluated on the accumulated arguments
using Condition = std::variant<PositionalCondition, KeywordCondition>;

// =============================================================================
// Stage targets
// =============================================================================

/// Computes a stage's target from the arguments of the previous firing
using TargetResolver = std::function<hookchain_core::Result<Target>(const Args& fired)>;

struct DeferredTarget {
    TargetResolver resolve;
};

using StageTarget = std::variant<Target, DeferredTarget>;

/// One link of a chain
struct Stage {
    StageTarget target;
    std::string event;
    std::optional<Condition> condition;
};

struct ListenerOptions {
    /// Call the callback and conditions with keyword arguments
    bool use_kwargs = false;
    /// Retire stage 0 after its first firing
    bool once = false;
};

namespace detail {
struct ChainState;
} // namespace detail

// =============================================================================
// RegisteredChain
// =============================================================================

/// Handle to an applied chain. Copies share the same chain.
class RegisteredChain {
public:
    RegisteredChain() = default;

    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] std::size_t stage_count() const;

    /// Number of dispatcher subscriptions currently installed by this chain
    [[nodiscard]] std::size_t live_subscriptions() const;

    /// Number of stage-0 firings
    [[nodiscard]] std::uint64_t attempts() const;

    /// Number of callback invocations
    [[nodiscard]] std::uint64_t completions() const;

    /// Number of attempts stopped by a condition
    [[nodiscard]] std::uint64_t abandoned() const;

    /// True until remove() is called
    [[nodiscard]] bool is_active() const;

    /// Unregister every live subscription, including tails of attempts still
    /// in progress. Later firings of already dispatched callbacks are ignored.
    hookchain_core::Result<void> remove();

private:
    friend class ChainBuilder;
    explicit RegisteredChain(std::shared_ptr<detail::ChainState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::ChainState> m_state;
};

// =============================================================================
// ChainBuilder
// =============================================================================

class ChainBuilder {
public:
    ChainBuilder(Registrar& registrar, Target target, std::string event, ListenerOptions options = {});

    /// Append a stage. The condition is checked on the accumulated arguments
    /// before the stage is registered; false abandons the attempt.
    ChainBuilder& chain(StageTarget target, std::string event,
                        std::optional<Condition> condition = std::nullopt);

    /// Append a stage whose target is computed from the previous firing
    ChainBuilder& chain(TargetResolver resolver, std::string event,
                        std::optional<Condition> condition = std::nullopt);

    /// Name used in log messages
    ChainBuilder& named(std::string name);

    /// Attach the callback and register stage 0
    [[nodiscard]] hookchain_core::Result<RegisteredChain> apply(Callback callback);

    [[nodiscard]] const std::vector<Stage>& stages() const noexcept { return m_stages; }
    [[nodiscard]] const ListenerOptions& options() const noexcept { return m_options; }
    [[nodiscard]] bool is_applied() const noexcept { return m_applied; }

private:
    hookchain_core::Result<void> validate(const Callback& callback) const;

    Registrar* m_registrar;
    std::vector<Stage> m_stages;
    ListenerOptions m_options;
    std::string m_name;
    bool m_applied = false;
};

} // namespace hookchain_event
