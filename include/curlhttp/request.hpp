#pragma once
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http_method.hpp"

namespace curlhttp {

    /**
     * @brief A request handed to Transport::round_trip.
     *
     * Lives only for the duration of one round trip; the transport never
     * mutates it.
     */
    struct Request {
        HttpMethod method{HttpMethod::Get};
        /** @brief Absolute target URL. Empty optional means "no URL". */
        std::optional<std::string> url;
        /** @brief Case-insensitive multi-valued request headers. */
        http::fields headers;
        std::optional<std::string> body;
        /** @brief Overall timeout for this request; zero keeps the handle's. */
        std::chrono::milliseconds timeout{0};
    };

    inline std::shared_ptr<Request> make_request(
        HttpMethod method, std::string url,
        std::optional<std::string> body = std::nullopt) {
        auto req = std::make_shared<Request>();
        req->method = method;
        req->url = std::move(url);
        req->body = std::move(body);
        return req;
    }

    /// @brief Flatten a multi-valued header set into "Name: value" lines.
    /// @note Takes the first value of each name; later values are dropped,
    /// never merged. Output is ordered by case-insensitive name.
    inline std::vector<std::string> flatten_request_headers(
        const http::fields& in) {
        std::map<std::string, std::string, boost::beast::iless> first;
        for (const auto& field : in) {
            first.emplace(std::string(field.name_string()),
                          std::string(field.value()));
        }
        std::vector<std::string> lines;
        lines.reserve(first.size());
        for (const auto& [name, value] : first) {
            lines.push_back(name + ": " + value);
        }
        return lines;
    }

}  // namespace curlhttp
