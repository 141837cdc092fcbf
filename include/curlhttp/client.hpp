#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "transport.hpp"
#include "url.hpp"

namespace curlhttp {

    /**
     * @brief A blocking HTTP client that impersonates a browser.
     *
     * Thin facade over a shared Transport. Unlike the transport it applies
     * a default overall timeout to requests that carry none. Safe for
     * concurrent use.
     */
    class Client {
       public:
        /**
         * @brief Zero-value client.
         *
         * Nothing is allocated until the first request; that request builds
         * a default Transport and a 30 second timeout exactly once.
         */
        Client() = default;

        /**
         * @brief Constructs a client and its own Transport from @p config.
         * @param config Zero fields fall back to their defaults.
         */
        explicit Client(ClientConfiguration config);

        /**
         * @brief Constructs a client over an existing Transport.
         * @param transport Shared with other clients; null means "build a
         * default one".
         * @param timeout Zero means the default timeout.
         */
        Client(std::shared_ptr<Transport> transport,
               std::chrono::milliseconds timeout);

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * @brief Sends a prepared request.
         *
         * A request without its own timeout is sent as a copy carrying the
         * client timeout; @p request itself is never modified and is what
         * the returned Response references.
         */
        [[nodiscard]] Result<Response> send(
            std::shared_ptr<const Request> request);

        /**
         * @name Convenience verbs
         * @{
         */
        [[nodiscard]] Result<Response> get(const std::string& url);

        [[nodiscard]] Result<Response> head(const std::string& url);

        /**
         * @brief Performs a POST request.
         * @param url Absolute target URL.
         * @param content_type Sent as the Content-Type header when not empty.
         * @param body The request body.
         */
        [[nodiscard]] Result<Response> post(const std::string& url,
                                            const std::string& content_type,
                                            std::string body);

        /**
         * @brief POSTs @p values as application/x-www-form-urlencoded.
         */
        [[nodiscard]] Result<Response> post_form(const std::string& url,
                                                 const FormValues& values);

        [[nodiscard]] Result<Response> put(const std::string& url,
                                           const std::string& content_type,
                                           std::string body);

        [[nodiscard]] Result<Response> del(const std::string& url);
        /** @} */

        /// @brief The transport requests go through (built on first use for
        /// a zero-value client).
        [[nodiscard]] const std::shared_ptr<Transport>& transport();

        /// @brief Timeout applied to requests that carry none.
        [[nodiscard]] std::chrono::milliseconds timeout();

       private:
        void ensure_initialized();

        std::once_flag m_init;
        std::shared_ptr<Transport> m_transport;
        std::chrono::milliseconds m_timeout{0};
    };

    /// @brief Process-wide client used by the free functions below.
    Client& default_client();

    /**
     * @name Free functions on the default client
     * @{
     */
    [[nodiscard]] Result<Response> get(const std::string& url);

    [[nodiscard]] Result<Response> head(const std::string& url);

    [[nodiscard]] Result<Response> post(const std::string& url,
                                        const std::string& content_type,
                                        std::string body);

    [[nodiscard]] Result<Response> post_form(const std::string& url,
                                             const FormValues& values);

    [[nodiscard]] Result<Response> send(std::shared_ptr<const Request> request);
    /** @} */

}  // namespace curlhttp
