#pragma once
#include <string>

namespace curlhttp {
    /**
     * @brief Represents an error occurred while executing a request.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidRequest,     /**< Null request, missing URL or bad verb. */
            InvalidUrl,         /**< The provided URL is malformed. */
            InitFailed,         /**< Process-wide native init failed. */
            ResourceExhausted,  /**< No usable handle could be produced. */
            Configuration,      /**< A handle rejected an option. */
            DnsFailed,          /**< Host name resolution failed. */
            ConnectionFailed,   /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            Timeout,            /**< The operation timed out. */
            SendFailed,         /**< Failed to send the request. */
            ReceiveFailed,      /**< Failed to receive the response. */
            NetworkError,       /**< General network error. */
            ParseFailed,        /**< Response framing could not be parsed. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Name of the rejected option, for Configuration errors. */
        std::string option{};
        /** @brief Native error code (CURLcode) when one is available. */
        int native_code{0};
    };

    /// @brief Short stable name for an error code, used in log lines.
    inline const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidRequest:
                return "invalid_request";
            case Error::Code::InvalidUrl:
                return "invalid_url";
            case Error::Code::InitFailed:
                return "init_failed";
            case Error::Code::ResourceExhausted:
                return "resource_exhausted";
            case Error::Code::Configuration:
                return "configuration";
            case Error::Code::DnsFailed:
                return "dns_failed";
            case Error::Code::ConnectionFailed:
                return "connection_failed";
            case Error::Code::TlsHandshakeFailed:
                return "tls_handshake_failed";
            case Error::Code::Timeout:
                return "timeout";
            case Error::Code::SendFailed:
                return "send_failed";
            case Error::Code::ReceiveFailed:
                return "receive_failed";
            case Error::Code::NetworkError:
                return "network_error";
            case Error::Code::ParseFailed:
                return "parse_failed";
            default:
                return "unknown";
        }
    }
}  // namespace curlhttp
