#include "curlhttp/handle_pool.hpp"

#include <exception>

#include "curlhttp/handle_configuration.hpp"
#include "curlhttp/logger.hpp"

namespace curlhttp {

    HandlePool::HandlePool(HandleConfiguration config, std::size_t max_idle,
                           HandleFactory factory)
        : m_state(std::make_shared<State>(std::move(config), max_idle,
                                          std::move(factory))) {}

    HandlePool::~HandlePool() {
        auto s = std::move(m_state);
        if (!s) return;

        std::deque<handle_ptr> drained;
        {
            std::lock_guard<std::mutex> lock(s->mutex);
            s->shutting_down = true;
            drained.swap(s->idle);
        }
        for (auto& h : drained) destroy_handle(*s, std::move(h));

        // Outstanding leases see an expired weak_ptr and destroy their
        // handle on release.
    }

    Result<HandlePool::Lease> HandlePool::acquire() {
        auto s = m_state;

        {
            std::lock_guard<std::mutex> lock(s->mutex);
            if (!s->idle.empty()) {
                handle_ptr h = std::move(s->idle.front());
                s->idle.pop_front();
                ++s->in_use;
                return Result<Lease>::ok(
                    Lease{std::weak_ptr<State>(s), std::move(h)});
            }
        }

        // Miss: build outside the lock so other callers are not held up
        // by native allocation.
        handle_ptr h = s->factory ? s->factory() : nullptr;
        if (!h) {
            return Result<Lease>::err(Error{Error::Code::ResourceExhausted,
                                            "failed to get curl handle"});
        }

        auto configured = apply_configuration(*h, s->config);
        if (configured.has_error()) {
            h.reset();
            return Result<Lease>::err(std::move(configured).error());
        }

        {
            std::lock_guard<std::mutex> lock(s->mutex);
            ++s->created;
            ++s->in_use;
        }
        CURLHTTP_LOG_DEBUG("handle pool miss: created handle #{}",
                           stats().created);
        return Result<Lease>::ok(Lease{std::weak_ptr<State>(s), std::move(h)});
    }

    std::size_t HandlePool::close_idle() {
        auto s = m_state;
        std::deque<handle_ptr> drained;
        {
            std::lock_guard<std::mutex> lock(s->mutex);
            drained.swap(s->idle);
        }
        const std::size_t n = drained.size();
        for (auto& h : drained) destroy_handle(*s, std::move(h));
        return n;
    }

    HandlePool::Stats HandlePool::stats() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        Stats out;
        out.created = m_state->created;
        out.destroyed = m_state->destroyed;
        out.idle = m_state->idle.size();
        out.in_use = m_state->in_use;
        return out;
    }

    void HandlePool::return_to_pool(const std::shared_ptr<State>& s,
                                    handle_ptr handle) noexcept {
        if (!s || !handle) return;

        {
            std::lock_guard<std::mutex> lock(s->mutex);
            if (s->in_use) --s->in_use;
        }

        // Wipe per-request state and restore the persistent options.
        handle->reset();
        bool reusable = false;
        try {
            reusable = apply_configuration(*handle, s->config).has_value();
        } catch (const std::exception& e) {
            CURLHTTP_LOG_DEBUG("handle reconfiguration threw: {}", e.what());
        }

        if (reusable) {
            std::lock_guard<std::mutex> lock(s->mutex);
            if (!s->shutting_down && s->idle.size() < s->max_idle) {
                s->idle.push_back(std::move(handle));
                CURLHTTP_LOG_TRACE("handle returned to pool ({} idle)",
                                   s->idle.size());
                return;
            }
        }

        destroy_handle(*s, std::move(handle));
    }

    void HandlePool::destroy_handle(State& s, handle_ptr handle) noexcept {
        if (!handle) return;
        handle.reset();
        std::size_t destroyed = 0;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            destroyed = ++s.destroyed;
        }
        CURLHTTP_LOG_DEBUG("destroyed handle ({} so far)", destroyed);
    }

}  // namespace curlhttp
