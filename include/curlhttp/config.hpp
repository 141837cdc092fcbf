#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace curlhttp {

    namespace impersonate {
        inline constexpr std::string_view chrome136{"chrome136"};
        inline constexpr std::string_view firefox102{"firefox102"};
        inline constexpr std::string_view safari17_0{"safari17_0"};
        inline constexpr std::string_view edge122{"edge122"};

        /** @brief Browser identities known to be supported. */
        inline constexpr std::array<std::string_view, 4> targets{
            chrome136, firefox102, safari17_0, edge122};

        /** @brief Identity used when none is configured. */
        inline constexpr std::string_view default_target = chrome136;

        inline bool is_known_target(std::string_view target) noexcept {
            for (auto t : targets) {
                if (t == target) return true;
            }
            return false;
        }
    }  // namespace impersonate

    /** @brief HTTP protocol version a handle may be pinned to. */
    enum class HttpVersion {
        Http1_0,
        Http1_1,
        Http2,
        Http2PriorKnowledge,
        Http3,
    };

    /**
     * @brief Options applied to every pooled handle.
     *
     * Zero (or empty) fields mean "use the default"; with_defaults() is the
     * single place those defaults are filled in.
     */
    struct HandleConfiguration {
        /** @brief Browser identity to impersonate (e.g. "chrome136"). */
        std::string impersonate_target;

        /** @brief Suppress the identity's built-in request headers. */
        bool disable_default_headers{false};

        /**
         * @brief Send with libcurl's own TLS and header fingerprint.
         *
         * No target is applied. Required on a libcurl without
         * curl_easy_impersonate, where every target is rejected.
         */
        bool disable_impersonation{false};

        /** @brief Skip verification of the peer certificate. */
        bool skip_peer_verification{false};

        /** @brief Skip verification of the certificate host name. */
        bool skip_host_verification{false};

        /** @brief Timeout for establishing a connection. */
        std::chrono::milliseconds connect_timeout{0};

        /** @brief Timeout for the whole transfer. */
        std::chrono::milliseconds timeout{0};

        /** @brief Lifetime of cached DNS entries. */
        std::chrono::seconds dns_cache_timeout{0};

        /** @brief Receive buffer size in bytes. */
        std::size_t buffer_size{0};

        /** @brief Idle time before TCP keep-alive probes start. */
        std::chrono::seconds tcp_keepalive_idle{0};

        /** @brief Interval between TCP keep-alive probes. */
        std::chrono::seconds tcp_keepalive_interval{0};

        /** @brief Size of the handle's connection cache. */
        std::size_t max_connections{0};

        /** @brief Max idle age of a cached connection before it is dropped. */
        std::chrono::seconds max_connection_age{0};

        /** @brief Max total lifetime of a cached connection. */
        std::chrono::seconds max_connection_lifetime{0};

        /** @brief Redirects followed before the transfer fails. */
        std::size_t max_redirects{0};

        /** @brief Proxy URL, e.g. "http://127.0.0.1:3128". */
        std::optional<std::string> proxy;

        /** @brief Force a protocol version instead of negotiating. */
        std::optional<HttpVersion> http_version;

        /// @brief Copy of this configuration with every zero field replaced
        /// by its default.
        [[nodiscard]] HandleConfiguration with_defaults() const;
    };

    inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{5000};
    inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};
    inline constexpr std::chrono::seconds kDefaultDnsCacheTimeout{300};
    inline constexpr std::size_t kDefaultBufferSize{16 * 1024};
    inline constexpr std::chrono::seconds kDefaultKeepAliveIdle{60};
    inline constexpr std::chrono::seconds kDefaultKeepAliveInterval{60};
    inline constexpr std::size_t kDefaultMaxConnections{50};
    inline constexpr std::chrono::seconds kDefaultMaxConnectionAge{300};
    inline constexpr std::chrono::seconds kDefaultMaxConnectionLifetime{600};
    inline constexpr std::size_t kDefaultMaxRedirects{10};
    inline constexpr std::size_t kDefaultPoolSize{10};

    inline HandleConfiguration HandleConfiguration::with_defaults() const {
        HandleConfiguration out = *this;
        if (out.impersonate_target.empty())
            out.impersonate_target = std::string(impersonate::default_target);
        if (out.connect_timeout.count() <= 0)
            out.connect_timeout = kDefaultConnectTimeout;
        if (out.timeout.count() <= 0) out.timeout = kDefaultTimeout;
        if (out.dns_cache_timeout.count() <= 0)
            out.dns_cache_timeout = kDefaultDnsCacheTimeout;
        if (out.buffer_size == 0) out.buffer_size = kDefaultBufferSize;
        if (out.tcp_keepalive_idle.count() <= 0)
            out.tcp_keepalive_idle = kDefaultKeepAliveIdle;
        if (out.tcp_keepalive_interval.count() <= 0)
            out.tcp_keepalive_interval = kDefaultKeepAliveInterval;
        if (out.max_connections == 0)
            out.max_connections = kDefaultMaxConnections;
        if (out.max_connection_age.count() <= 0)
            out.max_connection_age = kDefaultMaxConnectionAge;
        if (out.max_connection_lifetime.count() <= 0)
            out.max_connection_lifetime = kDefaultMaxConnectionLifetime;
        if (out.max_redirects == 0) out.max_redirects = kDefaultMaxRedirects;
        return out;
    }

    /** @brief How response headers are captured from the native layer. */
    enum class CaptureMode {
        /** Header lines are streamed to a HeaderCollector as they arrive. */
        HeaderCallback,
        /** Headers arrive inline with the body and are split afterwards. */
        Combined,
    };

    /**
     * @brief Configuration for a Transport and its handle pool.
     */
    struct TransportConfiguration {
        /** @brief Options applied to every handle. */
        HandleConfiguration handle;

        /** @brief Max idle handles kept by the pool. */
        std::size_t max_pool_size{kDefaultPoolSize};

        /** @brief Response header capture strategy. */
        CaptureMode capture_mode{CaptureMode::HeaderCallback};
    };

    /**
     * @brief Configuration for a Client.
     */
    struct ClientConfiguration {
        /** @brief Overall timeout applied to requests that carry none. */
        std::chrono::milliseconds timeout{kDefaultTimeout};

        /** @brief Configuration of the transport the client creates. */
        TransportConfiguration transport;
    };

    /// @brief Client configuration impersonating @p target, with everything
    /// else at its defaults.
    inline ClientConfiguration with_target(std::string target) {
        ClientConfiguration cfg;
        cfg.transport.handle.impersonate_target = std::move(target);
        return cfg;
    }

}  // namespace curlhttp
