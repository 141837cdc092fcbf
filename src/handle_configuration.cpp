#include "curlhttp/handle_configuration.hpp"

#include <initializer_list>
#include <utility>

namespace curlhttp {

    const char* option_name(HandleOption option) noexcept {
        switch (option) {
            case HandleOption::NoProgress:
                return "no_progress";
            case HandleOption::NoSignal:
                return "no_signal";
            case HandleOption::FreshConnect:
                return "fresh_connect";
            case HandleOption::ForbidReuse:
                return "forbid_reuse";
            case HandleOption::TcpKeepAlive:
                return "tcp_keepalive";
            case HandleOption::TcpKeepIdle:
                return "tcp_keepidle";
            case HandleOption::TcpKeepInterval:
                return "tcp_keepintvl";
            case HandleOption::ConnectTimeoutMs:
                return "connect_timeout_ms";
            case HandleOption::TimeoutMs:
                return "timeout_ms";
            case HandleOption::DnsCacheTimeout:
                return "dns_cache_timeout";
            case HandleOption::BufferSize:
                return "buffer_size";
            case HandleOption::MaxConnects:
                return "max_connects";
            case HandleOption::MaxAgeConn:
                return "max_age_conn";
            case HandleOption::MaxLifetimeConn:
                return "max_lifetime_conn";
            case HandleOption::SslVerifyPeer:
                return "ssl_verify_peer";
            case HandleOption::SslVerifyHost:
                return "ssl_verify_host";
            case HandleOption::Proxy:
                return "proxy";
            case HandleOption::HttpVersion:
                return "http_version";
            case HandleOption::FollowLocation:
                return "follow_location";
            case HandleOption::MaxRedirects:
                return "max_redirects";
            case HandleOption::Url:
                return "url";
            case HandleOption::HttpGet:
                return "http_get";
            case HandleOption::NoBody:
                return "no_body";
            case HandleOption::Post:
                return "post";
            case HandleOption::CustomRequest:
                return "custom_request";
            case HandleOption::IncludeHeader:
                return "include_header";
        }
        return "unknown";
    }

    Result<void> apply_configuration(Handle& handle,
                                     const HandleConfiguration& config) {
        const HandleConfiguration cfg = config.with_defaults();

        Result<void> r = Result<void>::ok();
        if (!cfg.disable_impersonation) {
            r = handle.impersonate(cfg.impersonate_target,
                                   !cfg.disable_default_headers);
            if (r.has_error()) return r;
        }

        const std::initializer_list<std::pair<HandleOption, long>> numeric = {
            {HandleOption::NoProgress, 1L},
            {HandleOption::NoSignal, 1L},
            {HandleOption::FreshConnect, 0L},
            {HandleOption::ForbidReuse, 0L},
            {HandleOption::TcpKeepAlive, 1L},
            {HandleOption::TcpKeepIdle,
             static_cast<long>(cfg.tcp_keepalive_idle.count())},
            {HandleOption::TcpKeepInterval,
             static_cast<long>(cfg.tcp_keepalive_interval.count())},
            {HandleOption::ConnectTimeoutMs,
             static_cast<long>(cfg.connect_timeout.count())},
            {HandleOption::TimeoutMs, static_cast<long>(cfg.timeout.count())},
            {HandleOption::DnsCacheTimeout,
             static_cast<long>(cfg.dns_cache_timeout.count())},
            {HandleOption::BufferSize, static_cast<long>(cfg.buffer_size)},
            {HandleOption::MaxConnects,
             static_cast<long>(cfg.max_connections)},
            {HandleOption::MaxAgeConn,
             static_cast<long>(cfg.max_connection_age.count())},
            {HandleOption::MaxLifetimeConn,
             static_cast<long>(cfg.max_connection_lifetime.count())},
            {HandleOption::SslVerifyPeer, cfg.skip_peer_verification ? 0L : 1L},
            {HandleOption::SslVerifyHost, cfg.skip_host_verification ? 0L : 2L},
            {HandleOption::FollowLocation, 1L},
            {HandleOption::MaxRedirects, static_cast<long>(cfg.max_redirects)},
        };
        for (const auto& [option, value] : numeric) {
            r = handle.set(option, value);
            if (r.has_error()) return r;
        }

        if (cfg.proxy) {
            r = handle.set(HandleOption::Proxy, *cfg.proxy);
            if (r.has_error()) return r;
        }

        if (cfg.http_version) {
            r = handle.set(HandleOption::HttpVersion,
                           static_cast<long>(*cfg.http_version));
            if (r.has_error()) return r;
        }
        return Result<void>::ok();
    }

}  // namespace curlhttp
