/// @file validation.cpp
/// @brief ModelValidators implementation

#include <hookchain/event/validation.hpp>
#include <hookchain/event/lifecycle.hpp>
#include <hookchain/core/log.hpp>

namespace hookchain_event {

using hookchain_core::Err;
using hookchain_core::Error;
using hookchain_core::ErrorCode;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

ModelValidators::~ModelValidators() {
    auto removed = uninstall();
    if (!removed) {
        hookchain_core::event_logger()->warn("Validators of {} not fully removed: {}",
            to_string(m_model), removed.error().message());
    }
}

ModelValidators& ModelValidators::add(std::string name, Validator validator, ValidatorOptions options) {
    m_entries.push_back(Entry{std::move(name), std::move(validator), std::move(options)});
    return *this;
}

Result<void> ModelValidators::install(Registrar& registrar) {
    if (is_installed()) {
        return Err(EventError::invalid_state(to_string(m_model), "validators already installed"));
    }

    const std::string model_name = m_model.label.empty() ? to_string(m_model) : m_model.label;

    for (const auto& entry : m_entries) {
        if (!entry.validator) {
            auto rolled_back = uninstall();
            if (!rolled_back) {
                hookchain_core::event_logger()->warn("Rollback of validators of {} failed: {}",
                    model_name, rolled_back.error().message());
            }
            return Err(EventError::invalid_callback(entry.options.trigger_event,
                "validator '" + entry.name + "' is empty"));
        }

        ChainBuilder builder(registrar, m_model, entry.options.trigger_event, ListenerOptions{true, false});
        builder.named(model_name + "." + entry.name);
        if (!entry.options.execution_event.empty()) {
            builder.chain(owning_session_resolver(registrar.dispatcher()), entry.options.execution_event);
        }

        auto chain = builder.apply(KeywordCallback(
            [validator = entry.validator, name = model_name + "." + entry.name](const KwArgs& kwargs) {
                auto result = validator(kwargs);
                if (!result) {
                    Error err(ErrorCode::ValidationError, name + ": " + result.error().message());
                    err.with_context("validator", name);
                    throw hookchain_core::Exception(std::move(err));
                }
            }));
        if (!chain) {
            auto rolled_back = uninstall();
            if (!rolled_back) {
                hookchain_core::event_logger()->warn("Rollback of validators of {} failed: {}",
                    model_name, rolled_back.error().message());
            }
            return Err(chain.error());
        }
        m_chains.push_back(std::move(*chain));
    }

    hookchain_core::event_logger()->debug("Installed {} validators for {}", m_chains.size(), model_name);
    return Ok();
}

Result<void> ModelValidators::uninstall() {
    Result<void> first = Ok();
    for (auto& chain : m_chains) {
        auto removed = chain.remove();
        if (!removed && first.is_ok()) {
            first = std::move(removed);
        }
    }
    m_chains.clear();
    return first;
}

std::vector<std::string> ModelValidators::names() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.name);
    }
    return result;
}

} // namespace hookchain_event
