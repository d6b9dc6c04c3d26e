#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hookchain_event

#include <cstdint>

namespace hookchain_event {

// Core types
enum class TargetKind : std::uint8_t;
struct Target;
struct HookDescriptor;
struct ListenerId;

// Catalog
struct HookSignature;
struct HookClass;
class EventCatalog;
class SyntheticExpander;

// Dispatch
class Dispatcher;
struct Subscription;
struct RegistrarConfig;
class Registrar;

// Chains
struct ListenerOptions;
struct DeferredTarget;
class ChainBuilder;
class RegisteredChain;

// Lifecycle helpers
enum class Phase : std::uint8_t;
class UnitOfWorkInspector;
class ModelValidators;

} // namespace hookchain_event
