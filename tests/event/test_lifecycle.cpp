/// @file test_lifecycle.cpp
/// @brief Tests for the after_* and before_* phase helpers

#include <catch2/catch.hpp>
#include <hookchain/event/lifecycle.hpp>

#include "support/memory_dispatcher.hpp"

#include <string>
#include <vector>

using namespace hookchain_event;
using hookchain_core::ErrorCode;
using hookchain_test::MemoryDispatcher;

namespace {

/// Expected deliveries of a phase helper across insert, update and delete
struct PhaseCase {
    Phase phase;
    bool on_insert;
    bool on_update;
    bool on_delete;
};

const std::vector<PhaseCase> k_phase_cases{
    {Phase::Insert, true, false, false},
    {Phase::Update, false, true, false},
    {Phase::Delete, false, false, true},
    {Phase::Save, true, true, false},
    {Phase::Touch, true, true, true},
};

/// Insert, update and delete one object, flushing after each step.
/// Returns the call count observed after each flush.
template<typename Count>
std::vector<int> run_scenario(MemoryDispatcher& dispatcher, const Target& mapper,
                              const Target& session, Count&& count) {
    std::vector<int> counts;
    const Target order = dispatcher.make_object(mapper, "order");

    dispatcher.add(session, order);
    dispatcher.flush(session);
    counts.push_back(count());

    dispatcher.modify(order);
    dispatcher.flush(session);
    counts.push_back(count());

    dispatcher.remove(order);
    dispatcher.flush(session);
    counts.push_back(count());
    return counts;
}

std::vector<int> expected_counts(const PhaseCase& phase_case) {
    int total = 0;
    std::vector<int> counts;
    for (bool fires : {phase_case.on_insert, phase_case.on_update, phase_case.on_delete}) {
        total += fires ? 1 : 0;
        counts.push_back(total);
    }
    return counts;
}

} // anonymous namespace

TEST_CASE("Lifecycle: phase names", "[event][lifecycle]") {
    REQUIRE(after_event(Phase::Insert) == "after_insert");
    REQUIRE(after_event(Phase::Touch) == "after_touch");
    REQUIRE(before_event(Phase::Save) == "before_save");
    REQUIRE(std::string(phase_name(Phase::Delete)) == "delete");
}

TEST_CASE("Lifecycle: after helpers run once the flush completes", "[event][lifecycle]") {
    for (const auto& phase_case : k_phase_cases) {
        DYNAMIC_SECTION("after_" << phase_name(phase_case.phase)) {
            MemoryDispatcher dispatcher;
            Registrar registrar(dispatcher, default_catalog());
            const Target mapper = dispatcher.make_mapper("orders");
            const Target session = dispatcher.make_session();

            int calls = 0;
            auto chain = after(registrar, phase_case.phase, mapper)
                .apply(PositionalCallback([&](const Args& args) {
                    // mapper, connection, object, then the flushed session
                    REQUIRE(args.size() == 5);
                    REQUIRE(*as_target(args[3]) == session);
                    ++calls;
                }));
            REQUIRE(chain.is_ok());

            auto counts = run_scenario(dispatcher, mapper, session, [&] { return calls; });
            REQUIRE(counts == expected_counts(phase_case));
        }
    }
}

TEST_CASE("Lifecycle: before helpers run from before_flush", "[event][lifecycle]") {
    for (const auto& phase_case : k_phase_cases) {
        DYNAMIC_SECTION("before_" << phase_name(phase_case.phase)) {
            MemoryDispatcher dispatcher;
            Registrar registrar(dispatcher, default_catalog());
            const Target mapper = dispatcher.make_mapper("orders");
            const Target other_mapper = dispatcher.make_mapper("customers");
            const Target session = dispatcher.make_session();

            int calls = 0;
            auto chain = before(registrar, dispatcher, phase_case.phase, mapper, session,
                PositionalCallback([&](const Args& args) {
                    // session, flush_context, instances, then the object
                    REQUIRE(args.size() == 4);
                    REQUIRE(*dispatcher.mapper_of(*as_target(args[3])) == mapper);
                    ++calls;
                }));
            REQUIRE(chain.is_ok());
            REQUIRE(chain->name() == before_event(phase_case.phase) + ":orders");

            // Objects of another model never reach the callback
            dispatcher.add(session, dispatcher.make_object(other_mapper, "customer"));

            auto counts = run_scenario(dispatcher, mapper, session, [&] { return calls; });
            REQUIRE(counts == expected_counts(phase_case));
        }
    }
}

TEST_CASE("Lifecycle: shorthand helpers", "[event][lifecycle]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    int inserted = 0;
    int saved = 0;
    int deleting = 0;
    auto on_insert = after_insert(registrar, mapper).apply(PositionalCallback([&](const Args&) { ++inserted; }));
    auto on_save = after_save(registrar, mapper).apply(PositionalCallback([&](const Args&) { ++saved; }));
    auto on_delete = before_delete(registrar, dispatcher, mapper, session,
        PositionalCallback([&](const Args&) { ++deleting; }));
    REQUIRE(on_insert.is_ok());
    REQUIRE(on_save.is_ok());
    REQUIRE(on_delete.is_ok());

    const Target order = dispatcher.make_object(mapper, "order");
    dispatcher.add(session, order);
    dispatcher.flush(session);
    dispatcher.modify(order);
    dispatcher.flush(session);
    dispatcher.remove(order);
    dispatcher.flush(session);

    REQUIRE(inserted == 1);
    REQUIRE(saved == 2);
    REQUIRE(deleting == 1);
}

TEST_CASE("Lifecycle: after options", "[event][lifecycle]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    int calls = 0;

    SECTION("custom execution event") {
        AfterOptions options;
        options.execution_event = "after_commit";
        auto chain = after_insert(registrar, mapper, options)
            .apply(PositionalCallback([&](const Args& args) {
                REQUIRE(args.size() == 4);
                ++calls;
            }));
        REQUIRE(chain.is_ok());

        dispatcher.add(session, dispatcher.make_object(mapper, "order"));
        dispatcher.flush(session);
        REQUIRE(calls == 0);
        REQUIRE(dispatcher.fire(session, "after_commit", Args{session}) == 1);
        REQUIRE(calls == 1);
    }

    SECTION("fixed execution target") {
        const Target audit_session = dispatcher.make_session("audit");
        AfterOptions options;
        options.execution_event = "after_commit";
        options.execution_target = StageTarget{audit_session};
        auto chain = after_update(registrar, mapper, options)
            .apply(PositionalCallback([&](const Args&) { ++calls; }));
        REQUIRE(chain.is_ok());

        const Target order = dispatcher.make_object(mapper, "order");
        dispatcher.add(session, order);
        dispatcher.flush(session);
        dispatcher.modify(order);
        dispatcher.flush(session);
        REQUIRE(dispatcher.fire(session, "after_commit", Args{session}) == 0);
        REQUIRE(dispatcher.fire(audit_session, "after_commit", Args{audit_session}) == 1);
        REQUIRE(calls == 1);
    }

    SECTION("keyword callback") {
        AfterOptions options;
        options.listener.use_kwargs = true;
        KwArgs received;
        auto chain = after_insert(registrar, mapper, options)
            .apply(KeywordCallback([&](const KwArgs& kwargs) { received = kwargs; }));
        REQUIRE(chain.is_ok());

        const Target order = dispatcher.make_object(mapper, "order");
        dispatcher.add(session, order);
        dispatcher.flush(session);

        REQUIRE(*as_target(received.at("target")) == order);
        REQUIRE(*as_target(received.at("session")) == session);
        REQUIRE(received.count("flush_context") == 1);
    }
}

TEST_CASE("Lifecycle: before helper keyword arguments", "[event][lifecycle]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    ListenerOptions options;
    options.use_kwargs = true;

    SECTION("instance is named") {
        std::vector<Target> instances;
        auto chain = before_insert(registrar, dispatcher, mapper, session,
            KeywordCallback([&](const KwArgs& kwargs) {
                REQUIRE(*as_target(kwargs.at("session")) == session);
                instances.push_back(*as_target(kwargs.at("instance")));
            }),
            options);
        REQUIRE(chain.is_ok());

        const Target order = dispatcher.make_object(mapper, "order");
        dispatcher.add(session, order);
        dispatcher.flush(session);
        REQUIRE(instances == std::vector<Target>{order});
    }

    SECTION("callback must match the mode") {
        auto chain = before_insert(registrar, dispatcher, mapper, session,
            PositionalCallback([](const Args&) {}), options);
        REQUIRE(chain.is_err());
        REQUIRE(chain.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Lifecycle: owning session resolver", "[event][lifecycle]") {
    MemoryDispatcher dispatcher;
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();
    const Target order = dispatcher.make_object(mapper, "order");
    const Target connection(TargetKind::Engine, 99, "connection");

    auto resolve = owning_session_resolver(dispatcher);

    SECTION("attached object") {
        dispatcher.add(session, order);
        auto resolved = resolve(Args{mapper, connection, order});
        REQUIRE(resolved.is_ok());
        REQUIRE(*resolved == session);
    }

    SECTION("detached object") {
        auto resolved = resolve(Args{mapper, connection, order});
        REQUIRE(resolved.is_err());
        REQUIRE(resolved.error().code() == ErrorCode::InvalidState);
    }

    SECTION("too few arguments") {
        REQUIRE(resolve(Args{mapper}).is_err());
    }

    SECTION("argument is not an object") {
        REQUIRE(resolve(Args{mapper, connection, std::string{"order"}}).is_err());
    }
}
