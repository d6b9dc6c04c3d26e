#pragma once

/// @file memory_dispatcher.hpp
/// @brief In-memory stand-in for the object store's hook dispatcher
///
/// Holds listeners per (target, hook), fires them synchronously and models a
/// minimal unit of work: objects attached to a session are pending new,
/// dirty or deleted until flush() fires the session and mapper hooks in
/// flush order.

#include <hookchain/event/dispatcher.hpp>
#include <hookchain/event/lifecycle.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hookchain_test {

using namespace hookchain_event;
using hookchain_core::Err;
using hookchain_core::Ok;
using hookchain_core::Result;
using hookchain_core::EventError;

class MemoryDispatcher : public Dispatcher, public UnitOfWorkInspector {
public:
    // =========================================================================
    // Dispatcher
    // =========================================================================

    Result<ListenerId> listen(const Target& target, const std::string& hook,
                              HookCallback callback, bool once) override {
        if (hook == m_refused_hook) {
            return Err<ListenerId>(EventError::dispatch_failed(hook, "refused by dispatcher"));
        }
        ListenerId id(m_next_id++);
        m_listeners[Key{target, hook}].push_back(Entry{id, std::move(callback), once});
        return id;
    }

    Result<void> unlisten(const Target& target, const std::string& hook, ListenerId id) override {
        auto it = m_listeners.find(Key{target, hook});
        if (it == m_listeners.end()) {
            return Err(EventError::dispatch_failed(hook, "no listeners on " + to_string(target)));
        }
        auto& entries = it->second;
        auto entry = std::find_if(entries.begin(), entries.end(),
            [id](const Entry& e) { return e.id == id; });
        if (entry == entries.end()) {
            return Err(EventError::dispatch_failed(hook, "unknown listener"));
        }
        entries.erase(entry);
        return Ok();
    }

    std::optional<Target> owning_unit_of_work(const Target& object) const override {
        auto it = m_owner.find(object);
        if (it == m_owner.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // =========================================================================
    // UnitOfWorkInspector
    // =========================================================================

    std::vector<Target> pending_new(const Target& session) const override {
        return pending(m_new, session);
    }

    std::vector<Target> pending_dirty(const Target& session) const override {
        return pending(m_dirty, session);
    }

    std::vector<Target> pending_deleted(const Target& session) const override {
        return pending(m_deleted, session);
    }

    std::optional<Target> mapper_of(const Target& instance) const override {
        auto it = m_mapper.find(instance);
        if (it == m_mapper.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // =========================================================================
    // Firing
    // =========================================================================

    /// Fire a hook; returns the number of callbacks invoked
    std::size_t fire(const Target& target, const std::string& hook, const Args& args) {
        auto it = m_listeners.find(Key{target, hook});
        if (it == m_listeners.end()) {
            return 0;
        }

        // Snapshot, dropping once listeners before they run
        std::vector<Entry> snapshot;
        auto& entries = it->second;
        for (auto entry = entries.begin(); entry != entries.end();) {
            snapshot.push_back(*entry);
            if (entry->once) {
                entry = entries.erase(entry);
            } else {
                ++entry;
            }
        }

        std::size_t invoked = 0;
        for (const auto& entry : snapshot) {
            if (!entry.once && !is_registered(target, hook, entry.id)) {
                continue;
            }
            entry.callback(args);
            ++invoked;
        }
        return invoked;
    }

    [[nodiscard]] std::size_t listener_count(const Target& target, const std::string& hook) const {
        auto it = m_listeners.find(Key{target, hook});
        return it == m_listeners.end() ? 0 : it->second.size();
    }

    [[nodiscard]] std::size_t total_listeners() const {
        std::size_t count = 0;
        for (const auto& [key, entries] : m_listeners) {
            count += entries.size();
        }
        return count;
    }

    /// Make listen() fail for a hook
    void refuse(std::string hook) { m_refused_hook = std::move(hook); }

    // =========================================================================
    // Objects and units of work
    // =========================================================================

    Target make_target(TargetKind kind, std::string label) {
        return Target(kind, m_next_object++, std::move(label));
    }

    Target make_session(std::string label = "session") {
        return make_target(TargetKind::Session, std::move(label));
    }

    Target make_mapper(std::string label) {
        return make_target(TargetKind::Mapper, std::move(label));
    }

    Target make_object(const Target& mapper, std::string label) {
        Target object = make_target(TargetKind::Instance, std::move(label));
        m_mapper[object] = mapper;
        return object;
    }

    /// session.add(object)
    void add(const Target& session, const Target& object) {
        m_owner[object] = session;
        m_new.emplace_back(object, session);
    }

    /// Modify a persistent object
    void modify(const Target& object) {
        auto owner = owning_unit_of_work(object);
        if (owner) {
            m_dirty.emplace_back(object, *owner);
        }
    }

    /// session.delete(object)
    void remove(const Target& object) {
        auto owner = owning_unit_of_work(object);
        if (owner) {
            m_deleted.emplace_back(object, *owner);
        }
    }

    /// Detach an object from its session without flushing
    void expunge(const Target& object) { m_owner.erase(object); }

    /// Flush a session: before_flush, mapper hooks per pending object,
    /// after_flush, after_flush_postexec
    void flush(const Target& session) {
        const Value context{static_cast<std::int64_t>(++m_flush_count)};
        const Target connection(TargetKind::Engine, 1, "connection");

        fire(session, "before_flush", Args{session, context, std::monostate{}});

        for (const auto& object : pending_new(session)) {
            fire_mapper(object, connection, "before_insert");
            fire_mapper(object, connection, "after_insert");
        }
        for (const auto& object : pending_dirty(session)) {
            fire_mapper(object, connection, "before_update");
            fire_mapper(object, connection, "after_update");
        }
        auto deleted = pending_deleted(session);
        for (const auto& object : deleted) {
            fire_mapper(object, connection, "before_delete");
            fire_mapper(object, connection, "after_delete");
        }

        fire(session, "after_flush", Args{session, context});
        fire(session, "after_flush_postexec", Args{session, context});

        clear_pending(session);
        for (const auto& object : deleted) {
            m_owner.erase(object);
        }
    }

private:
    struct Key {
        Target target;
        std::string hook;

        bool operator<(const Key& other) const {
            if (target != other.target) {
                return target < other.target;
            }
            return hook < other.hook;
        }
    };

    struct Entry {
        ListenerId id;
        HookCallback callback;
        bool once = false;
    };

    using PendingList = std::vector<std::pair<Target, Target>>;

    static std::vector<Target> pending(const PendingList& list, const Target& session) {
        std::vector<Target> result;
        for (const auto& [object, owner] : list) {
            if (owner == session) {
                result.push_back(object);
            }
        }
        return result;
    }

    bool is_registered(const Target& target, const std::string& hook, ListenerId id) const {
        auto it = m_listeners.find(Key{target, hook});
        if (it == m_listeners.end()) {
            return false;
        }
        return std::any_of(it->second.begin(), it->second.end(),
            [id](const Entry& e) { return e.id == id; });
    }

    void fire_mapper(const Target& object, const Target& connection, const std::string& hook) {
        auto mapper = mapper_of(object);
        if (mapper) {
            fire(*mapper, hook, Args{*mapper, connection, object});
        }
    }

    void clear_pending(const Target& session) {
        auto drop = [&session](PendingList& list) {
            list.erase(std::remove_if(list.begin(), list.end(),
                [&session](const auto& item) { return item.second == session; }), list.end());
        };
        drop(m_new);
        drop(m_dirty);
        drop(m_deleted);
    }

    std::map<Key, std::vector<Entry>> m_listeners;
    std::map<Target, Target> m_owner;
    std::map<Target, Target> m_mapper;
    PendingList m_new;
    PendingList m_dirty;
    PendingList m_deleted;
    std::string m_refused_hook;
    std::uint64_t m_next_id = 1;
    std::uint64_t m_next_object = 1;
    std::uint64_t m_flush_count = 0;
};

} // namespace hookchain_test
