#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "config.hpp"
#include "handle.hpp"
#include "result.hpp"

namespace curlhttp {

    /**
     * @brief Bounded, thread-safe store of configured handles.
     *
     * acquire() never waits: it pops an idle handle or builds a new one.
     * Releasing into a full idle set destroys the handle instead of
     * blocking, so more handles than max_idle may be checked out at once.
     */
    class HandlePool {
       public:
        using handle_ptr = std::unique_ptr<Handle>;

       private:
        // Shared with leases, which hold it weakly.
        struct State {
            HandleConfiguration config;
            std::size_t max_idle;
            HandleFactory factory;

            mutable std::mutex mutex;
            std::deque<handle_ptr> idle;
            bool shutting_down = false;

            std::size_t created = 0;
            std::size_t destroyed = 0;
            std::size_t in_use = 0;

            State(HandleConfiguration config_, std::size_t max_idle_,
                  HandleFactory factory_)
                : config(std::move(config_)),
                  max_idle(max_idle_),
                  factory(std::move(factory_)) {}
        };

       public:
        /**
         * @brief Exclusive ownership of one checked-out handle.
         *
         * Destroying (or reset()ting) the lease returns the handle to its
         * pool.
         */
        class Lease {
           public:
            Lease() = default;

            ~Lease() { reset(); }

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            Lease(Lease&& other) noexcept
                : m_state(std::exchange(other.m_state, {})),
                  m_handle(std::move(other.m_handle)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    m_state = std::exchange(other.m_state, {});
                    m_handle = std::move(other.m_handle);
                }
                return *this;
            }

            Handle* operator->() const noexcept { return m_handle.get(); }

            Handle& operator*() const noexcept { return *m_handle; }

            Handle* get() const noexcept { return m_handle.get(); }

            explicit operator bool() const noexcept {
                return static_cast<bool>(m_handle);
            }

            /// @brief Give the handle back now.
            void reset() noexcept;

           private:
            friend class HandlePool;

            Lease(std::weak_ptr<State> st, handle_ptr h) noexcept
                : m_state(std::move(st)), m_handle(std::move(h)) {}

            std::weak_ptr<State> m_state;
            handle_ptr m_handle;
        };

        struct Stats {
            std::size_t created = 0;
            std::size_t destroyed = 0;
            std::size_t idle = 0;
            std::size_t in_use = 0;
        };

        /// @param config Applied to every handle on creation and release.
        /// @param max_idle Capacity of the idle set (zero keeps nothing).
        /// @param factory Source of new handles.
        HandlePool(HandleConfiguration config, std::size_t max_idle,
                   HandleFactory factory);

        HandlePool(const HandlePool&) = delete;
        HandlePool& operator=(const HandlePool&) = delete;

        ~HandlePool();

        /// @brief Check out a handle, building one if none is idle.
        /// @return ResourceExhausted when the factory yields nothing, or the
        /// Configuration error of a freshly built handle.
        Result<Lease> acquire();

        /// @brief Destroy every idle handle.
        /// @return Number of handles destroyed.
        std::size_t close_idle();

        [[nodiscard]] Stats stats() const;

        [[nodiscard]] const HandleConfiguration& configuration() const noexcept {
            return m_state->config;
        }

        [[nodiscard]] std::size_t max_idle() const noexcept {
            return m_state->max_idle;
        }

       private:
        static void return_to_pool(const std::shared_ptr<State>& s,
                                   handle_ptr handle) noexcept;
        static void destroy_handle(State& s, handle_ptr handle) noexcept;

        std::shared_ptr<State> m_state;
    };

    inline void HandlePool::Lease::reset() noexcept {
        if (!m_handle) return;

        if (auto st = m_state.lock()) {
            HandlePool::return_to_pool(st, std::move(m_handle));
        } else {
            // Pool already gone; the handle dies with us.
            m_handle.reset();
        }
        m_state.reset();
    }

}  // namespace curlhttp
