#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace curlhttp {
    namespace http = boost::beast::http;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
        Connect,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Trace:
                return http::verb::trace;
            case HttpMethod::Connect:
                return http::verb::connect;
            default:
                return http::verb::unknown;
        }
    }

    /// @brief Wire name of @p method ("GET", "DELETE", ...); empty for an
    /// out-of-range value.
    inline std::string_view method_string(HttpMethod method) {
        const http::verb v = to_boost_http_method(method);
        if (v == http::verb::unknown) return {};
        const auto s = http::to_string(v);
        return {s.data(), s.size()};
    }

}  // namespace curlhttp
