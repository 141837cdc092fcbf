#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"
#include "sinks.hpp"

namespace curlhttp {

    /** @brief Options a Handle understands, by name rather than native id. */
    enum class HandleOption {
        // Persistent, connection-level.
        NoProgress,
        NoSignal,
        FreshConnect,
        ForbidReuse,
        TcpKeepAlive,
        TcpKeepIdle,
        TcpKeepInterval,
        ConnectTimeoutMs,
        TimeoutMs,
        DnsCacheTimeout,
        BufferSize,
        MaxConnects,
        MaxAgeConn,
        MaxLifetimeConn,
        SslVerifyPeer,
        SslVerifyHost,
        Proxy,
        HttpVersion,
        FollowLocation,
        MaxRedirects,
        // Per-request.
        Url,
        HttpGet,
        NoBody,
        Post,
        CustomRequest,
        IncludeHeader,
    };

    /// @brief Name of @p option as it appears in configuration errors.
    const char* option_name(HandleOption option) noexcept;

    /**
     * @brief One reusable native transfer context.
     *
     * Performs one exchange at a time. Options set on a handle persist
     * across perform() calls until reset(), which drops all per-request
     * state while keeping live connections cached.
     */
    class Handle {
       public:
        virtual ~Handle() = default;

        virtual Result<void> set(HandleOption option, long value) = 0;
        virtual Result<void> set(HandleOption option,
                                 const std::string& value) = 0;

        /// @brief Select a browser identity preset.
        virtual Result<void> impersonate(const std::string& target,
                                         bool default_headers) = 0;

        /// @brief Replace the request header list ("Name: value" lines).
        virtual Result<void> set_headers(
            const std::vector<std::string>& lines) = 0;

        /// @brief Attach request body bytes with an explicit length.
        /// @note @p body must stay alive until perform() returns.
        virtual Result<void> set_body(std::string_view body) = 0;

        /// @brief Wire response sinks. A null @p headers leaves header
        /// lines inline with the body (IncludeHeader must be set for them to
        /// be delivered at all).
        virtual Result<void> set_sinks(BodySink& body,
                                       HeaderSink* headers) = 0;

        /// @brief Run the transfer. Blocks up to the configured timeout.
        virtual Result<void> perform() = 0;

        virtual Result<long> response_code() = 0;

        /// @brief Content type reported by the native layer, if any.
        virtual std::optional<std::string> content_type() = 0;

        /// @brief Drop per-request state and every option back to native
        /// defaults, keeping cached connections.
        virtual void reset() = 0;
    };

    /// @brief Produces a new, unconfigured handle; nullptr on allocation
    /// failure.
    using HandleFactory = std::function<std::unique_ptr<Handle>()>;

}  // namespace curlhttp
