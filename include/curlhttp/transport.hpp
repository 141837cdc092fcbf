#pragma once

#include <memory>

#include "config.hpp"
#include "handle.hpp"
#include "handle_pool.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"

namespace curlhttp {

    /**
     * @brief Executes requests over a pool of impersonating handles.
     *
     * Safe for concurrent use: every round trip checks out its own handle
     * and its own response sinks.
     */
    class Transport {
       public:
        /** @brief Content type reported when neither the response nor the
         * native layer names one. */
        static constexpr const char* kDefaultContentType =
            "application/octet-stream";

        /**
         * @brief Constructs a Transport backed by libcurl handles.
         * @param config Pool size, capture mode and handle options.
         */
        explicit Transport(TransportConfiguration config = {});

        /**
         * @brief Constructs a Transport drawing handles from @p factory.
         */
        Transport(TransportConfiguration config, HandleFactory factory);

        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;

        /**
         * @brief Executes one request.
         *
         * The handle goes back to the pool on every path, success or not.
         * Failures are never retried.
         *
         * @param request The request; must be non-null and carry a URL.
         * @return The buffered response (referencing @p request) or an Error.
         */
        [[nodiscard]] Result<Response> round_trip(
            std::shared_ptr<const Request> request);

        [[nodiscard]] const TransportConfiguration& configuration()
            const noexcept {
            return m_config;
        }

        [[nodiscard]] HandlePool::Stats pool_stats() const {
            return m_pool.stats();
        }

        /// @brief Destroy idle handles (and the connections they cache).
        std::size_t close_idle_handles() { return m_pool.close_idle(); }

       private:
        Result<void> prepare(Handle& handle, const Request& request,
                             const std::vector<std::string>& header_lines);

        TransportConfiguration m_config;
        HandlePool m_pool;
    };

}  // namespace curlhttp
