#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "mmdv/core/TaskSystem.hpp"
#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    namespace detail {

        template <typename F>
        using TaskResult = std::invoke_result_t<F&>;

        template <typename F>
        using TaskValue = typename TaskResult<F>::value_type;

        template <typename... Ts>
        struct JoinState {
            std::mutex mutex;
            std::condition_variable cv;
            std::tuple<std::optional<Ts>...> values;
            size_t remaining = sizeof...(Ts);
            std::optional<std::string> error;
        };

        template <typename F>
        TaskResult<F> runCatching(F& func) {
            try {
                return func();
            } catch (const std::exception& e) {
                return core::Unexpected(std::string(e.what()));
            }
        }

        template <size_t I, typename State, typename F>
        void launchJoined(const std::shared_ptr<State>& state, F func) {
            core::TaskSystem::launchIo([state, func = std::move(func)]() mutable {
                auto result = runCatching(func);
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (result) {
                        std::get<I>(state->values).emplace(std::move(*result));
                        --state->remaining;
                    } else if (!state->error) {
                        state->error = std::move(result.error());
                    }
                }
                state->cv.notify_all();
            });
        }

        template <typename State, typename... Fs, size_t... Is>
        void launchAll(const std::shared_ptr<State>& state, std::index_sequence<Is...>, Fs&&... funcs) {
            (launchJoined<Is>(state, std::forward<Fs>(funcs)), ...);
        }

        template <typename Tuple, size_t... Is>
        auto unwrap(Tuple& values, std::index_sequence<Is...>) {
            return std::make_tuple(std::move(*std::get<Is>(values))...);
        }
    }

    // Runs every callable on the I/O pool and blocks until all have
    // succeeded, or returns the first error as soon as it is observed.
    // Tasks still running after a failure finish in the background and
    // their results are dropped. Each callable returns core::Result<T>.
    template <typename... Fs>
    core::Result<std::tuple<detail::TaskValue<std::decay_t<Fs>>...>> whenAll(Fs&&... funcs) {
        using State = detail::JoinState<detail::TaskValue<std::decay_t<Fs>>...>;
        auto state = std::make_shared<State>();

        detail::launchAll(state, std::index_sequence_for<Fs...>{}, std::forward<Fs>(funcs)...);

        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&] { return state->error.has_value() || state->remaining == 0; });
        if (state->error) {
            return core::Unexpected(*state->error);
        }
        return detail::unwrap(state->values, std::index_sequence_for<Fs...>{});
    }

}
