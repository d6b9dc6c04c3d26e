/// @file listener.cpp
/// @brief Chain compilation and the per-firing registration runtime

#include <hookchain/event/listener.hpp>
#include <hookchain/core/log.hpp>

#include <map>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Error;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

// =============================================================================
// ChainState
// =============================================================================

namespace detail {

/// Shared state of an applied chain. Owned jointly by the RegisteredChain
/// handles and by every callback installed on the dispatcher.
struct ChainState : std::enable_shared_from_this<ChainState> {
    Registrar* registrar = nullptr;
    std::string name;
    std::vector<Stage> stages;
    /// Declared parameter names, per stage
    std::vector<std::vector<std::string>> param_names;
    ListenerOptions options;
    Callback callback;

    /// Live registrations keyed by registration group. A group holds the
    /// primitive subscriptions of one listen() call.
    std::map<std::uint64_t, Subscriptions> live;
    std::uint64_t next_group = 1;

    std::uint64_t attempts = 0;
    std::uint64_t completions = 0;
    std::uint64_t abandoned = 0;
    bool removed = false;

    [[nodiscard]] bool stage_once(std::size_t index) const {
        return index > 0 || options.once;
    }

    [[nodiscard]] KwArgs keyword_args(const Args& all) const {
        std::vector<std::string> names;
        for (const auto& stage_names : param_names) {
            names.insert(names.end(), stage_names.begin(), stage_names.end());
        }
        return zip_kwargs(names, all);
    }

    [[nodiscard]] bool condition_met(std::size_t index, const Args& all) const {
        const auto& condition = stages[index].condition;
        if (!condition) {
            return true;
        }
        if (const auto* keyword = std::get_if<KeywordCondition>(&*condition)) {
            return (*keyword)(keyword_args(all));
        }
        return std::get<PositionalCondition>(*condition)(all);
    }

    [[nodiscard]] Result<Target> resolve(std::size_t index, const Args& fired) const {
        const auto& target = stages[index].target;
        if (const auto* concrete = std::get_if<Target>(&target)) {
            return *concrete;
        }
        return std::get<DeferredTarget>(target).resolve(fired);
    }

    void invoke(const Args& all) {
        ++completions;
        if (auto* keyword = std::get_if<KeywordCallback>(&callback)) {
            (*keyword)(keyword_args(all));
        } else {
            std::get<PositionalCallback>(callback)(all);
        }
    }

    Result<void> register_stage(std::size_t index, const Target& target, Args accumulated) {
        const bool once = stage_once(index);
        const std::uint64_t group = next_group++;

        auto subscriptions = registrar->listen_routed(target, stages[index].event,
            [self = shared_from_this(), index, group, accumulated = std::move(accumulated)](
                const std::string& hook, const Args& fired) {
                self->on_fired(index, group, hook, accumulated, fired);
            },
            once);
        if (!subscriptions) {
            Error err = subscriptions.error();
            err.with_context("chain", name);
            return Err(std::move(err));
        }

        live.emplace(group, std::move(*subscriptions));
        hookchain_core::event_logger()->debug("Performed {}{}registration for {}: {} of {}",
            once ? "one time " : "",
            index > 0 ? "chain " : "",
            to_string(target), stages[index].event, name);
        return Ok();
    }

    /// Retire a fired once group, removing the members that did not fire.
    /// Returns false if the group was already retired.
    bool retire(std::uint64_t group, const std::string& fired_hook) {
        auto it = live.find(group);
        if (it == live.end()) {
            return false;
        }

        Subscriptions siblings;
        for (auto& subscription : it->second) {
            if (subscription.hook != fired_hook) {
                siblings.push_back(std::move(subscription));
            }
        }
        live.erase(it);

        if (!siblings.empty()) {
            auto removed_siblings = registrar->unlisten(siblings);
            if (!removed_siblings) {
                hookchain_core::event_logger()->warn("Chain {}: failed to retire sibling hooks: {}",
                    name, removed_siblings.error().message());
            }
        }
        return true;
    }

    void on_fired(std::size_t index, std::uint64_t group, const std::string& hook,
                  const Args& accumulated, const Args& fired) {
        if (removed) {
            return;
        }
        if (stage_once(index) && !retire(group, hook)) {
            return;
        }
        if (index == 0) {
            ++attempts;
        }

        // Each firing gets its own accumulator
        Args all = accumulated;
        all.insert(all.end(), fired.begin(), fired.end());

        const std::size_t next = index + 1;
        if (next == stages.size()) {
            hookchain_core::event_logger()->trace("Chain {} complete with {} args", name, all.size());
            invoke(all);
            return;
        }

        if (!condition_met(next, all)) {
            ++abandoned;
            hookchain_core::event_logger()->debug("Chain {}: condition for {} not met, attempt abandoned",
                name, stages[next].event);
            return;
        }
        if (removed) {
            return;
        }

        auto target = resolve(next, fired);
        if (!target) {
            Error err = target.error();
            err.with_context("chain", name).with_context("stage", stages[next].event);
            throw hookchain_core::Exception(std::move(err));
        }

        auto registered = register_stage(next, *target, std::move(all));
        if (!registered) {
            throw hookchain_core::Exception(registered.error());
        }
    }

    Result<void> remove() {
        if (removed) {
            return Ok();
        }
        removed = true;

        Subscriptions all;
        for (auto& [group, subscriptions] : live) {
            all.insert(all.end(), subscriptions.begin(), subscriptions.end());
        }
        live.clear();

        hookchain_core::event_logger()->debug("Removing chain {} ({} subscriptions)", name, all.size());
        return registrar->unlisten(all);
    }
};

} // namespace detail

// =============================================================================
// RegisteredChain
// =============================================================================

namespace {

const std::string k_empty_name;

} // anonymous namespace

const std::string& RegisteredChain::name() const {
    return m_state ? m_state->name : k_empty_name;
}

std::size_t RegisteredChain::stage_count() const {
    return m_state ? m_state->stages.size() : 0;
}

std::size_t RegisteredChain::live_subscriptions() const {
    if (!m_state) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& [group, subscriptions] : m_state->live) {
        count += subscriptions.size();
    }
    return count;
}

std::uint64_t RegisteredChain::attempts() const {
    return m_state ? m_state->attempts : 0;
}

std::uint64_t RegisteredChain::completions() const {
    return m_state ? m_state->completions : 0;
}

std::uint64_t RegisteredChain::abandoned() const {
    return m_state ? m_state->abandoned : 0;
}

bool RegisteredChain::is_active() const {
    return m_state && !m_state->removed;
}

Result<void> RegisteredChain::remove() {
    if (!m_state) {
        return Err(EventError::invalid_state("chain", "not applied"));
    }
    return m_state->remove();
}

// =============================================================================
// ChainBuilder
// =============================================================================

ChainBuilder::ChainBuilder(Registrar& registrar, Target target, std::string event, ListenerOptions options)
    : m_registrar(&registrar)
    , m_options(options) {
    m_stages.push_back(Stage{std::move(target), std::move(event), std::nullopt});
}

ChainBuilder& ChainBuilder::chain(StageTarget target, std::string event, std::optional<Condition> condition) {
    m_stages.push_back(Stage{std::move(target), std::move(event), std::move(condition)});
    return *this;
}

ChainBuilder& ChainBuilder::chain(TargetResolver resolver, std::string event, std::optional<Condition> condition) {
    return chain(StageTarget{DeferredTarget{std::move(resolver)}}, std::move(event), std::move(condition));
}

ChainBuilder& ChainBuilder::named(std::string name) {
    m_name = std::move(name);
    return *this;
}

Result<void> ChainBuilder::validate(const Callback& callback) const {
    const std::string& first_event = m_stages.front().event;

    const bool keyword_callback = std::holds_alternative<KeywordCallback>(callback);
    if (keyword_callback != m_options.use_kwargs) {
        return Err(EventError::invalid_callback(first_event,
            m_options.use_kwargs ? "keyword chain needs a keyword callback"
                                 : "positional chain needs a positional callback"));
    }
    const bool callable = std::visit([](const auto& fn) { return static_cast<bool>(fn); }, callback);
    if (!callable) {
        return Err(EventError::invalid_callback(first_event, "empty callback"));
    }

    for (const auto& stage : m_stages) {
        auto expanded = m_registrar->expand(stage.event);
        if (!expanded) {
            return Err(expanded.error());
        }

        if (const auto* deferred = std::get_if<DeferredTarget>(&stage.target)) {
            if (!deferred->resolve) {
                return Err(EventError::invalid_callback(stage.event, "empty target resolver"));
            }
        }

        if (stage.condition) {
            const bool keyword_condition = std::holds_alternative<KeywordCondition>(*stage.condition);
            if (keyword_condition != m_options.use_kwargs) {
                return Err(EventError::invalid_callback(stage.event, "condition does not match argument mode"));
            }
            const bool condition_callable =
                std::visit([](const auto& fn) { return static_cast<bool>(fn); }, *stage.condition);
            if (!condition_callable) {
                return Err(EventError::invalid_callback(stage.event, "empty condition"));
            }
        }
    }

    return Ok();
}

Result<RegisteredChain> ChainBuilder::apply(Callback callback) {
    if (m_applied) {
        return Err<RegisteredChain>(EventError::invalid_state(
            m_name.empty() ? m_stages.front().event : m_name, "chain already applied"));
    }

    auto valid = validate(callback);
    if (!valid) {
        return Err<RegisteredChain>(valid.error());
    }

    auto state = std::make_shared<detail::ChainState>();
    state->registrar = m_registrar;
    state->name = m_name.empty() ? "chain:" + m_stages.front().event : m_name;
    state->stages = m_stages;
    state->options = m_options;
    state->callback = std::move(callback);
    state->param_names.reserve(m_stages.size());
    for (const auto& stage : m_stages) {
        const auto* descriptor = m_registrar->catalog().find(stage.event);
        state->param_names.push_back(descriptor ? descriptor->param_names : std::vector<std::string>{});
    }

    const Target& first = std::get<Target>(m_stages.front().target);
    auto registered = state->register_stage(0, first, Args{});
    if (!registered) {
        return Err<RegisteredChain>(registered.error());
    }

    m_applied = true;
    return RegisteredChain(std::move(state));
}

} // namespace hookchain_event
