#pragma once

/// @file event_bus.hpp
/// @brief Type-safe synchronous event bus shared by the simulation systems.
///
/// Each event is a plain struct; its C++ type selects the channel.  The
/// game's event catalog lives in pacsim/game/events.hpp.

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace pacsim::foundation {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Synchronous publish/subscribe channel.
///
/// Handlers for an event type run on the publishing thread, in
/// subscription order.  Publish() iterates a snapshot of the handler
/// list taken when it starts, so handlers added or removed during
/// delivery take effect from the next Publish().
///
/// @warning Re-entrant publishing is not guarded.  A handler that
///          publishes the event type it is currently handling recurses
///          without bound.  Publishing a different event type from a
///          handler is supported and delivered immediately.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe<PelletEaten>([](const PelletEaten& e) {
///       hud.addPoints(e.points);
///   });
///   bus.Publish(PelletEaten{entity, position, 10});
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a handler for events of type E.
    /// @return A unique subscription ID for later unsubscription.
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler) {
        std::lock_guard lock(mutex_);

        auto id = nextId_++;
        auto typeIdx = std::type_index(typeid(E));

        HandlerEntry entry;
        entry.id = id;
        entry.handler = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        handlers_[typeIdx].push_back(std::move(entry));
        subscriptionTypes_.insert_or_assign(id, typeIdx);

        return id;
    }

    /// Subscribe a handler that is removed before its first delivery runs.
    ///
    /// The handler fires at most once even if E is published again from
    /// inside it.
    template <typename E>
    SubscriptionId Once(std::function<void(const E&)> handler) {
        auto state = std::make_shared<OnceState>();
        auto id = Subscribe<E>(
            [this, state, fn = std::move(handler)](const E& event) {
                if (state->fired) {
                    return;
                }
                state->fired = true;
                Unsubscribe(state->id);
                fn(event);
            });
        state->id = id;
        return id;
    }

    // -- Unsubscribe ----------------------------------------------------------

    /// Remove a subscription by ID.  Unknown or stale IDs are a no-op.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);

        auto typeIt = subscriptionTypes_.find(id);
        if (typeIt == subscriptionTypes_.end()) {
            return;
        }

        auto handlersIt = handlers_.find(typeIt->second);
        if (handlersIt != handlers_.end()) {
            auto& vec = handlersIt->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
            if (vec.empty()) {
                handlers_.erase(handlersIt);
            }
        }

        subscriptionTypes_.erase(typeIt);
    }

    /// Drop every subscription.
    void Clear() {
        std::lock_guard lock(mutex_);
        handlers_.clear();
        subscriptionTypes_.clear();
    }

    // -- Publish --------------------------------------------------------------

    /// Deliver @p event to every current subscriber of E.
    /// Publishing with no subscribers is a silent no-op.
    template <typename E>
    void Publish(const E& event) {
        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(E)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }

        std::any wrapped = event;
        for (const auto& entry : snapshot) {
            entry.handler(wrapped);
        }
    }

    // -- Queries --------------------------------------------------------------

    /// Total number of active subscriptions across all event types.
    [[nodiscard]] std::size_t HandlerCount() const {
        std::lock_guard lock(mutex_);
        return subscriptionTypes_.size();
    }

    /// Number of active subscriptions for event type E.
    template <typename E>
    [[nodiscard]] std::size_t SubscriberCount() const {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        std::function<void(const std::any&)> handler;
    };

    struct OnceState {
        SubscriptionId id = 0;
        bool fired = false;
    };

    /// Handler table: type_index → handlers in subscription order.
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;

    /// Reverse lookup: subscription ID → type_index.
    std::unordered_map<SubscriptionId, std::type_index> subscriptionTypes_;

    SubscriptionId nextId_ = 1;

    mutable std::mutex mutex_;
};

} // namespace pacsim::foundation
