#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/status.hpp>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

#include "request.hpp"

namespace curlhttp {

    /**
     * @brief A fully buffered HTTP response.
     *
     * Immutable once handed to the caller; the body is owned here, never a
     * view into a transfer buffer.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief Status line without protocol, e.g. "200 OK". */
        std::string status;
        /** @brief Protocol tag; always "HTTP/1.1" for this transport. */
        std::string proto{"HTTP/1.1"};
        int proto_major{1};
        int proto_minor{1};
        /** @brief Response headers, canonicalized names, all values kept. */
        http::fields headers;
        /** @brief Response body bytes. */
        std::string body;
        std::int64_t content_length{0};
        /** @brief The request that produced this response. */
        std::shared_ptr<const Request> request;

        /// @brief A fresh reader positioned at the start of the body. Can be
        /// called any number of times.
        [[nodiscard]] std::istringstream open_body() const {
            return std::istringstream(body);
        }

        /// @brief First value of header @p name, or empty.
        [[nodiscard]] std::string header(const std::string& name) const {
            auto it = headers.find(name);
            return it == headers.end() ? std::string()
                                       : std::string(it->value());
        }
    };

    /// @brief Reason phrase for @p code ("OK", "Not Found"); empty when the
    /// code is not a registered status.
    inline std::string status_text(int code) {
        if (code < 0) return {};
        const auto st = http::int_to_status(static_cast<unsigned>(code));
        if (st == http::status::unknown) return {};
        const auto reason = http::obsolete_reason(st);
        return std::string(reason.data(), reason.size());
    }

    /// @brief "<code> <reason>", e.g. "404 Not Found".
    inline std::string status_line(int code) {
        return std::to_string(code) + " " + status_text(code);
    }

}  // namespace curlhttp
