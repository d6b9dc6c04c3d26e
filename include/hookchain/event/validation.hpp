#pragma once

/// @file validation.hpp
/// @brief Per-model validators bound to lifecycle hooks
///
/// Validators are collected explicitly for a model, usually by an
/// initialization function next to the model's definition, and installed
/// against a Registrar once the dispatcher is available:
///
/// ```cpp
/// void register_order_validators(hookchain_event::ModelValidators& validators) {
///     validators.add("positive_total", [](const hookchain_event::KwArgs& kw) { ... });
/// }
/// ```
///
/// A validator returning an error aborts the firing that triggered it by
/// throwing hookchain_core::Exception with ErrorCode::ValidationError.

#include "fwd.hpp"
#include "listener.hpp"
#include "registrar.hpp"

#include <hookchain/core/error.hpp>

#include <functional>
#include <string>
#include <vector>

namespace hookchain_event {

/// Validator called with the keyword arguments of its hook(s)
using Validator = std::function<hookchain_core::Result<void>(const KwArgs&)>;

struct ValidatorOptions {
    /// Mapper hook that triggers the validator
    std::string trigger_event = "before_save";
    /// Session hook the validator runs on after the trigger; empty runs it
    /// on the trigger itself. There is no before_flush default:
    /// before_flush fires ahead of the mapper hooks of the same flush, so a
    /// validator deferred to it would wait for the next flush.
    std::string execution_event;
};

class ModelValidators {
public:
    explicit ModelValidators(Target model) : m_model(std::move(model)) {}

    ModelValidators(const ModelValidators&) = delete;
    ModelValidators& operator=(const ModelValidators&) = delete;

    ~ModelValidators();

    /// Declare a validator. Takes effect on the next install().
    ModelValidators& add(std::string name, Validator validator, ValidatorOptions options = {});

    /// Register every declared validator. On failure nothing stays installed.
    hookchain_core::Result<void> install(Registrar& registrar);

    /// Remove every installed validator
    hookchain_core::Result<void> uninstall();

    [[nodiscard]] const Target& model() const noexcept { return m_model; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool is_installed() const noexcept { return !m_chains.empty(); }
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Entry {
        std::string name;
        Validator validator;
        ValidatorOptions options;
    };

    Target m_model;
    std::vector<Entry> m_entries;
    std::vector<RegisteredChain> m_chains;
};

} // namespace hookchain_event
