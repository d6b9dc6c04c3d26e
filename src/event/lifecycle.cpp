/// @file lifecycle.cpp
/// @brief Phase helpers built on ChainBuilder

#include <hookchain/event/lifecycle.hpp>
#include <hookchain/core/log.hpp>

#include <set>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Result;
using hookchain_core::EventError;

namespace {

constexpr const char* k_flush_event = "before_flush";

/// Pending objects of `session` that belong to the phase, in inspector order
std::vector<Target> pending_for(const UnitOfWorkInspector& inspector, Phase phase, const Target& session) {
    std::vector<std::vector<Target>> sets;
    switch (phase) {
        case Phase::Insert:
            sets.push_back(inspector.pending_new(session));
            break;
        case Phase::Update:
            sets.push_back(inspector.pending_dirty(session));
            break;
        case Phase::Delete:
            sets.push_back(inspector.pending_deleted(session));
            break;
        case Phase::Save:
            sets.push_back(inspector.pending_new(session));
            sets.push_back(inspector.pending_dirty(session));
            break;
        case Phase::Touch:
            sets.push_back(inspector.pending_new(session));
            sets.push_back(inspector.pending_dirty(session));
            sets.push_back(inspector.pending_deleted(session));
            break;
    }

    std::vector<Target> result;
    std::set<Target> seen;
    for (auto& objects : sets) {
        for (auto& object : objects) {
            if (seen.insert(object).second) {
                result.push_back(std::move(object));
            }
        }
    }
    return result;
}

} // anonymous namespace

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Insert: return "insert";
        case Phase::Update: return "update";
        case Phase::Delete: return "delete";
        case Phase::Save: return "save";
        case Phase::Touch: return "touch";
    }
    return "unknown";
}

std::string after_event(Phase phase) {
    return std::string("after_") + phase_name(phase);
}

std::string before_event(Phase phase) {
    return std::string("before_") + phase_name(phase);
}

TargetResolver owning_session_resolver(Dispatcher& dispatcher, std::size_t instance_index) {
    return [&dispatcher, instance_index](const Args& fired) -> Result<Target> {
        if (instance_index >= fired.size()) {
            return Err<Target>(EventError::invalid_state("owning_session_resolver",
                "fired with " + std::to_string(fired.size()) + " arguments, no object at index " +
                std::to_string(instance_index)));
        }
        const Target* instance = as_target(fired[instance_index]);
        if (instance == nullptr) {
            return Err<Target>(EventError::invalid_state("owning_session_resolver",
                "argument " + std::to_string(instance_index) + " is not an object: " +
                to_string(fired[instance_index])));
        }
        auto session = dispatcher.owning_unit_of_work(*instance);
        if (!session) {
            return Err<Target>(EventError::invalid_state(to_string(*instance),
                "object is not attached to a unit of work"));
        }
        return *session;
    };
}

// =============================================================================
// After helpers
// =============================================================================

ChainBuilder after(Registrar& registrar, Phase phase, const Target& mapper, AfterOptions options) {
    StageTarget execution_target = options.execution_target
        ? std::move(*options.execution_target)
        : StageTarget{DeferredTarget{owning_session_resolver(registrar.dispatcher())}};

    ChainBuilder builder(registrar, mapper, after_event(phase), options.listener);
    builder.chain(std::move(execution_target), std::move(options.execution_event));
    return builder;
}

ChainBuilder after_insert(Registrar& registrar, const Target& mapper, AfterOptions options) {
    return after(registrar, Phase::Insert, mapper, std::move(options));
}

ChainBuilder after_update(Registrar& registrar, const Target& mapper, AfterOptions options) {
    return after(registrar, Phase::Update, mapper, std::move(options));
}

ChainBuilder after_delete(Registrar& registrar, const Target& mapper, AfterOptions options) {
    return after(registrar, Phase::Delete, mapper, std::move(options));
}

ChainBuilder after_save(Registrar& registrar, const Target& mapper, AfterOptions options) {
    return after(registrar, Phase::Save, mapper, std::move(options));
}

ChainBuilder after_touch(Registrar& registrar, const Target& mapper, AfterOptions options) {
    return after(registrar, Phase::Touch, mapper, std::move(options));
}

// =============================================================================
// Before helpers
// =============================================================================

Result<RegisteredChain> before(
    Registrar& registrar, const UnitOfWorkInspector& inspector, Phase phase,
    const Target& mapper, const Target& session, Callback callback, ListenerOptions options)
{
    const bool keyword_callback = std::holds_alternative<KeywordCallback>(callback);
    if (keyword_callback != options.use_kwargs) {
        return Err<RegisteredChain>(EventError::invalid_callback(before_event(phase),
            "callback does not match argument mode"));
    }

    auto flush = registrar.catalog().lookup(k_flush_event);
    if (!flush) {
        return Err<RegisteredChain>(flush.error());
    }
    std::vector<std::string> names = flush->param_names;
    names.push_back("instance");

    auto per_object = [&inspector, phase, mapper, session, names, callback = std::move(callback)](
        const Args& flush_args) {
        for (const auto& object : pending_for(inspector, phase, session)) {
            auto object_mapper = inspector.mapper_of(object);
            if (!object_mapper || *object_mapper != mapper) {
                continue;
            }

            Args args = flush_args;
            args.emplace_back(object);
            if (const auto* keyword = std::get_if<KeywordCallback>(&callback)) {
                (*keyword)(zip_kwargs(names, args));
            } else {
                std::get<PositionalCallback>(callback)(args);
            }
        }
    };

    ListenerOptions flush_options;
    flush_options.once = options.once;

    return ChainBuilder(registrar, session, k_flush_event, flush_options)
        .named(before_event(phase) + ":" + (mapper.label.empty() ? to_string(mapper) : mapper.label))
        .apply(PositionalCallback(std::move(per_object)));
}

Result<RegisteredChain> before_insert(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options) {
    return before(registrar, inspector, Phase::Insert, mapper, session, std::move(callback), options);
}

Result<RegisteredChain> before_update(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options) {
    return before(registrar, inspector, Phase::Update, mapper, session, std::move(callback), options);
}

Result<RegisteredChain> before_delete(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options) {
    return before(registrar, inspector, Phase::Delete, mapper, session, std::move(callback), options);
}

Result<RegisteredChain> before_save(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options) {
    return before(registrar, inspector, Phase::Save, mapper, session, std::move(callback), options);
}

Result<RegisteredChain> before_touch(
    Registrar& registrar, const UnitOfWorkInspector& inspector, const Target& mapper,
    const Target& session, Callback callback, ListenerOptions options) {
    return before(registrar, inspector, Phase::Touch, mapper, session, std::move(callback), options);
}

} // namespace hookchain_event
