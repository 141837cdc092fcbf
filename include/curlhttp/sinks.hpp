#pragma once

#include <boost/beast/http/fields.hpp>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

#include "result.hpp"

namespace curlhttp {
    namespace http = boost::beast::http;

    /**
     * @brief Receives response body bytes from a handle during perform().
     *
     * Implementations must tolerate being fed from a thread other than the
     * one that created them.
     */
    class BodySink {
       public:
        virtual ~BodySink() = default;
        virtual void append(std::string_view bytes) = 0;
    };

    /**
     * @brief Receives raw response header lines, one per call.
     */
    class HeaderSink {
       public:
        virtual ~HeaderSink() = default;
        virtual void add_header_line(std::string_view line) = 0;
    };

    /**
     * @brief Per-request, lock-protected in-memory body buffer.
     */
    class ResponseBuffer final : public BodySink {
       public:
        static constexpr std::size_t kInitialCapacity = 4096;

        ResponseBuffer() { m_bytes.reserve(kInitialCapacity); }

        ResponseBuffer(const ResponseBuffer&) = delete;
        ResponseBuffer& operator=(const ResponseBuffer&) = delete;

        void append(std::string_view bytes) override;

        /// @brief Copy of everything appended so far.
        [[nodiscard]] std::string bytes() const;

        [[nodiscard]] std::size_t size() const;

        void clear();

       private:
        mutable std::mutex m_mutex;
        std::string m_bytes;
    };

    /**
     * @brief Per-request header sink building a canonicalized multi-map.
     *
     * Blank lines are ignored and repeated names accumulate values in
     * arrival order. A status line ("HTTP/...") discards what was collected,
     * so only the final response's headers remain.
     */
    class HeaderCollector final : public HeaderSink {
       public:
        HeaderCollector() = default;

        HeaderCollector(const HeaderCollector&) = delete;
        HeaderCollector& operator=(const HeaderCollector&) = delete;

        void add_header_line(std::string_view line) override;

        /// @brief Copy of the collected headers.
        [[nodiscard]] http::fields headers() const;

       private:
        mutable std::mutex m_mutex;
        http::fields m_headers;
    };

    /// @brief Canonical MIME header form: "content-type" -> "Content-Type".
    /// Keys holding characters outside the token set are returned as-is.
    std::string canonical_header_key(std::string_view key);

    /// @brief Apply one raw header line to @p out with HeaderCollector's
    /// rules. Returns true when a header was added.
    bool add_header_line(http::fields& out, std::string_view line);

    /// @brief Parse a block of header lines (CRLF or bare LF).
    http::fields parse_headers(std::string_view block);

    /** @brief Views into a combined header+body blob. */
    struct HeaderBlock {
        std::string_view head;
        std::string_view body;
    };

    /// @brief Split a combined response at the first blank line: "\r\n\r\n",
    /// falling back to "\n\n". When further status-line blocks follow
    /// (1xx, redirects), the last block is returned as the head.
    /// @return ParseFailed when neither separator is present.
    Result<HeaderBlock> split_header_block(std::string_view combined);

}  // namespace curlhttp
