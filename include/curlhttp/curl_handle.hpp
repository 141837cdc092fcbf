#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

#include "handle.hpp"

namespace curlhttp {

    /// @brief Run curl_global_init exactly once per process.
    /// @note Safe to call from many threads; the outcome of the first call
    /// is returned to every caller.
    Result<void> ensure_initialized();

    /// @brief Whether this build can impersonate browsers natively.
    bool impersonation_supported() noexcept;

    /**
     * @brief Handle backed by a libcurl easy handle.
     */
    class CurlHandle final : public Handle {
        struct Token {
            explicit Token() = default;
        };

       public:
        /// @brief Create a handle; nullptr when init or allocation fails.
        static std::unique_ptr<CurlHandle> create();

        /// @brief Adopt @p easy; only reachable through create().
        CurlHandle(Token, CURL* easy) noexcept : m_easy(easy) {}

        ~CurlHandle() override;

        CurlHandle(const CurlHandle&) = delete;
        CurlHandle& operator=(const CurlHandle&) = delete;

        Result<void> set(HandleOption option, long value) override;
        Result<void> set(HandleOption option,
                         const std::string& value) override;
        Result<void> impersonate(const std::string& target,
                                 bool default_headers) override;
        Result<void> set_headers(
            const std::vector<std::string>& lines) override;
        Result<void> set_body(std::string_view body) override;
        Result<void> set_sinks(BodySink& body, HeaderSink* headers) override;
        Result<void> perform() override;
        Result<long> response_code() override;
        std::optional<std::string> content_type() override;
        void reset() override;

        CURL* native_handle() const noexcept { return m_easy; }

        /// @brief Target passed to the last impersonate() call.
        const std::string& impersonate_target() const noexcept {
            return m_target;
        }

       private:
        static std::size_t write_callback(char* ptr, std::size_t size,
                                          std::size_t nmemb, void* userdata);
        static std::size_t header_callback(char* ptr, std::size_t size,
                                           std::size_t nitems,
                                           void* userdata);

        Result<void> check(HandleOption option, CURLcode rc) const;
        void free_header_list() noexcept;

        CURL* m_easy{nullptr};
        curl_slist* m_header_list{nullptr};
        std::string m_target;
        char m_error_buffer[CURL_ERROR_SIZE]{};
    };

    /// @brief Default HandleFactory: a fresh CurlHandle.
    std::unique_ptr<Handle> make_curl_handle();

}  // namespace curlhttp
