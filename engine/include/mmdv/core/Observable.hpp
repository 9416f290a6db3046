#pragma once

/**
 * @file Observable.hpp
 * @brief Single-threaded observer list with disposable subscriptions
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace mmdv::core {

    // RAII handle returned by Observable::add. Destroying or resetting it
    // removes the observer. Safe to outlive the observable.
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> remover) : m_remover(std::move(remover)) {}

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept : m_remover(std::move(other.m_remover)) {
            other.m_remover = nullptr;
        }

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                m_remover = std::move(other.m_remover);
                other.m_remover = nullptr;
            }
            return *this;
        }

        ~Subscription() { reset(); }

        void reset() {
            if (m_remover) {
                auto remover = std::move(m_remover);
                m_remover = nullptr;
                remover();
            }
        }

        [[nodiscard]] bool active() const { return static_cast<bool>(m_remover); }

    private:
        std::function<void()> m_remover;
    };

    // Owns a batch of subscriptions that are torn down together
    class SubscriptionSet {
    public:
        void add(Subscription sub) { m_subs.push_back(std::move(sub)); }
        void clear() { m_subs.clear(); }
        [[nodiscard]] size_t size() const { return m_subs.size(); }

    private:
        std::vector<Subscription> m_subs;
    };

    template <typename... Args>
    class Observable {
    public:
        using Callback = std::function<void(Args...)>;

        Observable() : m_state(std::make_shared<State>()) {}

        Observable(const Observable&) = delete;
        Observable& operator=(const Observable&) = delete;

        [[nodiscard]] Subscription add(Callback cb) {
            const uint64_t id = m_state->nextId++;
            m_state->observers.push_back({id, std::move(cb), false});
            std::weak_ptr<State> weak = m_state;
            return Subscription([weak, id] {
                if (auto state = weak.lock()) {
                    state->remove(id);
                }
            });
        }

        // Observer is removed after its first notification
        [[nodiscard]] Subscription addOnce(Callback cb) {
            const uint64_t id = m_state->nextId++;
            m_state->observers.push_back({id, std::move(cb), true});
            std::weak_ptr<State> weak = m_state;
            return Subscription([weak, id] {
                if (auto state = weak.lock()) {
                    state->remove(id);
                }
            });
        }

        void notify(Args... args) {
            // Observers may add or remove observers while being notified
            auto snapshot = m_state->observers;
            for (auto& entry : snapshot) {
                if (!m_state->contains(entry.id)) {
                    continue;
                }
                if (entry.once) {
                    m_state->remove(entry.id);
                }
                entry.callback(args...);
            }
        }

        [[nodiscard]] size_t observerCount() const { return m_state->observers.size(); }
        [[nodiscard]] bool hasObservers() const { return !m_state->observers.empty(); }

    private:
        struct Entry {
            uint64_t id;
            Callback callback;
            bool once;
        };

        struct State {
            std::vector<Entry> observers;
            uint64_t nextId = 0;

            void remove(uint64_t id) {
                std::erase_if(observers, [id](const Entry& e) { return e.id == id; });
            }

            bool contains(uint64_t id) const {
                return std::any_of(observers.begin(), observers.end(),
                                   [id](const Entry& e) { return e.id == id; });
            }
        };

        std::shared_ptr<State> m_state;
    };

}
