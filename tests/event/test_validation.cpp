/// @file test_validation.cpp
/// @brief Tests for ModelValidators

#include <catch2/catch.hpp>
#include <hookchain/event/validation.hpp>

#include "support/memory_dispatcher.hpp"

#include <string>
#include <vector>

using namespace hookchain_event;
using hookchain_core::Err;
using hookchain_core::Error;
using hookchain_core::ErrorCode;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_test::MemoryDispatcher;

TEST_CASE("ModelValidators: run on save", "[event][validation]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    std::vector<Target> checked;
    ModelValidators validators(mapper);
    validators.add("has_target", [&](const KwArgs& kwargs) -> Result<void> {
        checked.push_back(*as_target(kwargs.at("target")));
        return Ok();
    });
    REQUIRE(ValidatorOptions{}.execution_event.empty());
    REQUIRE(validators.install(registrar).is_ok());
    REQUIRE(validators.is_installed());
    REQUIRE(validators.names() == std::vector<std::string>{"has_target"});

    const Target order = dispatcher.make_object(mapper, "order");
    dispatcher.add(session, order);
    dispatcher.flush(session);
    dispatcher.modify(order);
    dispatcher.flush(session);
    dispatcher.remove(order);
    dispatcher.flush(session);

    REQUIRE(checked == std::vector<Target>{order, order});
}

TEST_CASE("ModelValidators: failure stops the flush", "[event][validation]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    ModelValidators validators(mapper);
    validators.add("never", [](const KwArgs&) -> Result<void> {
        return Err(Error("order is frozen"));
    });
    REQUIRE(validators.install(registrar).is_ok());

    dispatcher.add(session, dispatcher.make_object(mapper, "order"));
    try {
        dispatcher.flush(session);
        FAIL("flush should throw");
    } catch (const hookchain_core::Exception& e) {
        REQUIRE(e.code() == ErrorCode::ValidationError);
        REQUIRE(std::string(e.what()).find("order is frozen") != std::string::npos);
        const auto* validator = e.error().get_context("validator");
        REQUIRE(validator != nullptr);
        REQUIRE(*validator == "orders.never");
    }
}

TEST_CASE("ModelValidators: deferred execution", "[event][validation]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");
    const Target session = dispatcher.make_session();

    std::vector<KwArgs> calls;
    ValidatorOptions options;
    options.trigger_event = "after_insert";
    options.execution_event = "after_flush";

    ModelValidators validators(mapper);
    validators.add("after_flush_check", [&](const KwArgs& kwargs) -> Result<void> {
        calls.push_back(kwargs);
        return Ok();
    }, options);
    REQUIRE(validators.install(registrar).is_ok());

    const Target order = dispatcher.make_object(mapper, "order");
    dispatcher.add(session, order);
    dispatcher.flush(session);

    REQUIRE(calls.size() == 1);
    REQUIRE(*as_target(calls[0].at("target")) == order);
    REQUIRE(*as_target(calls[0].at("session")) == session);
}

TEST_CASE("ModelValidators: install and uninstall", "[event][validation]") {
    MemoryDispatcher dispatcher;
    Registrar registrar(dispatcher, default_catalog());
    const Target mapper = dispatcher.make_mapper("orders");

    auto pass = [](const KwArgs&) -> Result<void> { return Ok(); };

    SECTION("uninstall removes every hook") {
        ModelValidators validators(mapper);
        validators.add("first", pass).add("second", pass);
        REQUIRE(validators.size() == 2);
        REQUIRE(validators.install(registrar).is_ok());
        REQUIRE(dispatcher.total_listeners() == 4);

        REQUIRE(validators.uninstall().is_ok());
        REQUIRE_FALSE(validators.is_installed());
        REQUIRE(dispatcher.total_listeners() == 0);
    }

    SECTION("destructor uninstalls") {
        {
            ModelValidators validators(mapper);
            validators.add("first", pass);
            REQUIRE(validators.install(registrar).is_ok());
            REQUIRE(dispatcher.total_listeners() == 2);
        }
        REQUIRE(dispatcher.total_listeners() == 0);
    }

    SECTION("install twice") {
        ModelValidators validators(mapper);
        validators.add("first", pass);
        REQUIRE(validators.install(registrar).is_ok());
        auto again = validators.install(registrar);
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::InvalidState);
    }

    SECTION("failed install rolls back") {
        ModelValidators validators(mapper);
        validators.add("first", pass).add("empty", Validator{});
        auto installed = validators.install(registrar);
        REQUIRE(installed.is_err());
        REQUIRE_FALSE(validators.is_installed());
        REQUIRE(dispatcher.total_listeners() == 0);
    }

    SECTION("trigger on the wrong target kind") {
        ModelValidators validators(dispatcher.make_session());
        validators.add("first", pass);
        auto installed = validators.install(registrar);
        REQUIRE(installed.is_err());
        REQUIRE(installed.error().code() == ErrorCode::InvalidArgument);
    }
}
