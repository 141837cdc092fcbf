#include "curlhttp/curl_handle.hpp"

#include <exception>
#include <mutex>

#include "curlhttp/config.hpp"
#include "curlhttp/logger.hpp"

namespace curlhttp {

    namespace {

        std::once_flag g_init_once;
        CURLcode g_init_rc = CURLE_OK;

        bool is_string_option(HandleOption option) noexcept {
            switch (option) {
                case HandleOption::Url:
                case HandleOption::CustomRequest:
                case HandleOption::Proxy:
                    return true;
                default:
                    return false;
            }
        }

        CURLoption to_curl_option(HandleOption option) noexcept {
            switch (option) {
                case HandleOption::NoProgress:
                    return CURLOPT_NOPROGRESS;
                case HandleOption::NoSignal:
                    return CURLOPT_NOSIGNAL;
                case HandleOption::FreshConnect:
                    return CURLOPT_FRESH_CONNECT;
                case HandleOption::ForbidReuse:
                    return CURLOPT_FORBID_REUSE;
                case HandleOption::TcpKeepAlive:
                    return CURLOPT_TCP_KEEPALIVE;
                case HandleOption::TcpKeepIdle:
                    return CURLOPT_TCP_KEEPIDLE;
                case HandleOption::TcpKeepInterval:
                    return CURLOPT_TCP_KEEPINTVL;
                case HandleOption::ConnectTimeoutMs:
                    return CURLOPT_CONNECTTIMEOUT_MS;
                case HandleOption::TimeoutMs:
                    return CURLOPT_TIMEOUT_MS;
                case HandleOption::DnsCacheTimeout:
                    return CURLOPT_DNS_CACHE_TIMEOUT;
                case HandleOption::BufferSize:
                    return CURLOPT_BUFFERSIZE;
                case HandleOption::MaxConnects:
                    return CURLOPT_MAXCONNECTS;
                case HandleOption::MaxAgeConn:
                    return CURLOPT_MAXAGE_CONN;
                case HandleOption::MaxLifetimeConn:
                    return CURLOPT_MAXLIFETIME_CONN;
                case HandleOption::SslVerifyPeer:
                    return CURLOPT_SSL_VERIFYPEER;
                case HandleOption::SslVerifyHost:
                    return CURLOPT_SSL_VERIFYHOST;
                case HandleOption::Proxy:
                    return CURLOPT_PROXY;
                case HandleOption::HttpVersion:
                    return CURLOPT_HTTP_VERSION;
                case HandleOption::FollowLocation:
                    return CURLOPT_FOLLOWLOCATION;
                case HandleOption::MaxRedirects:
                    return CURLOPT_MAXREDIRS;
                case HandleOption::Url:
                    return CURLOPT_URL;
                case HandleOption::HttpGet:
                    return CURLOPT_HTTPGET;
                case HandleOption::NoBody:
                    return CURLOPT_NOBODY;
                case HandleOption::Post:
                    return CURLOPT_POST;
                case HandleOption::CustomRequest:
                    return CURLOPT_CUSTOMREQUEST;
                case HandleOption::IncludeHeader:
                    return CURLOPT_HEADER;
            }
            return CURLOPT_LASTENTRY;
        }

        long to_curl_http_version(long value) noexcept {
            switch (static_cast<HttpVersion>(value)) {
                case HttpVersion::Http1_0:
                    return CURL_HTTP_VERSION_1_0;
                case HttpVersion::Http1_1:
                    return CURL_HTTP_VERSION_1_1;
                case HttpVersion::Http2:
                    return CURL_HTTP_VERSION_2_0;
                case HttpVersion::Http2PriorKnowledge:
                    return CURL_HTTP_VERSION_2_PRIOR_KNOWLEDGE;
                case HttpVersion::Http3:
                    return CURL_HTTP_VERSION_3;
            }
            return CURL_HTTP_VERSION_NONE;
        }

        Error::Code classify(CURLcode rc) noexcept {
            switch (rc) {
                case CURLE_OPERATION_TIMEDOUT:
                    return Error::Code::Timeout;
                case CURLE_COULDNT_RESOLVE_HOST:
                case CURLE_COULDNT_RESOLVE_PROXY:
                    return Error::Code::DnsFailed;
                case CURLE_COULDNT_CONNECT:
                    return Error::Code::ConnectionFailed;
                case CURLE_SSL_CONNECT_ERROR:
                case CURLE_PEER_FAILED_VERIFICATION:
                case CURLE_SSL_CERTPROBLEM:
                case CURLE_SSL_CIPHER:
                case CURLE_SSL_CACERT_BADFILE:
                case CURLE_SSL_ENGINE_NOTFOUND:
                case CURLE_SSL_ENGINE_SETFAILED:
                    return Error::Code::TlsHandshakeFailed;
                case CURLE_SEND_ERROR:
                    return Error::Code::SendFailed;
                case CURLE_RECV_ERROR:
                case CURLE_GOT_NOTHING:
                case CURLE_PARTIAL_FILE:
                case CURLE_WRITE_ERROR:
                    return Error::Code::ReceiveFailed;
                case CURLE_URL_MALFORMAT:
                case CURLE_UNSUPPORTED_PROTOCOL:
                    return Error::Code::InvalidUrl;
                case CURLE_OUT_OF_MEMORY:
                    return Error::Code::ResourceExhausted;
                default:
                    return Error::Code::NetworkError;
            }
        }

    }  // namespace

    Result<void> ensure_initialized() {
        std::call_once(g_init_once, [] {
            g_init_rc = curl_global_init(CURL_GLOBAL_ALL);
            if (g_init_rc == CURLE_OK) {
                CURLHTTP_LOG_DEBUG("libcurl initialized: {} (impersonation {})",
                                   curl_version(),
                                   impersonation_supported() ? "on" : "off");
            }
        });
        if (g_init_rc != CURLE_OK) {
            return Result<void>::err(
                Error{Error::Code::InitFailed,
                      std::string("curl_global_init failed: ") +
                          curl_easy_strerror(g_init_rc),
                      {},
                      static_cast<int>(g_init_rc)});
        }
        return Result<void>::ok();
    }

    bool impersonation_supported() noexcept {
#ifdef CURLHTTP_HAVE_IMPERSONATE
        return true;
#else
        return false;
#endif
    }

    std::unique_ptr<CurlHandle> CurlHandle::create() {
        if (ensure_initialized().has_error()) return nullptr;
        CURL* easy = curl_easy_init();
        if (easy == nullptr) return nullptr;
        auto handle = std::make_unique<CurlHandle>(Token{}, easy);
        curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, handle->m_error_buffer);
        return handle;
    }

    CurlHandle::~CurlHandle() {
        if (m_easy) curl_easy_cleanup(m_easy);
        free_header_list();
    }

    Result<void> CurlHandle::check(HandleOption option, CURLcode rc) const {
        if (rc == CURLE_OK) return Result<void>::ok();
        return Result<void>::err(Error{Error::Code::Configuration,
                                       std::string("failed to set ") +
                                           option_name(option) + ": " +
                                           curl_easy_strerror(rc),
                                       option_name(option),
                                       static_cast<int>(rc)});
    }

    Result<void> CurlHandle::set(HandleOption option, long value) {
        if (is_string_option(option)) {
            return check(option, CURLE_BAD_FUNCTION_ARGUMENT);
        }
        if (option == HandleOption::HttpVersion) {
            value = to_curl_http_version(value);
        }
        return check(option,
                     curl_easy_setopt(m_easy, to_curl_option(option), value));
    }

    Result<void> CurlHandle::set(HandleOption option,
                                 const std::string& value) {
        if (!is_string_option(option)) {
            return check(option, CURLE_BAD_FUNCTION_ARGUMENT);
        }
        // libcurl copies string options.
        return check(option, curl_easy_setopt(m_easy, to_curl_option(option),
                                              value.c_str()));
    }

    Result<void> CurlHandle::impersonate(const std::string& target,
                                         bool default_headers) {
        m_target = target;
#ifdef CURLHTTP_HAVE_IMPERSONATE
        const CURLcode rc =
            curl_easy_impersonate(m_easy, target.c_str(), default_headers);
        if (rc != CURLE_OK) {
            return Result<void>::err(
                Error{Error::Code::Configuration,
                      "failed to set impersonate target " + target + ": " +
                          curl_easy_strerror(rc),
                      "impersonate", static_cast<int>(rc)});
        }
        return Result<void>::ok();
#else
        (void)default_headers;
        CURLHTTP_LOG_WARN("libcurl {} cannot impersonate {}", curl_version(),
                          target);
        return Result<void>::err(
            Error{Error::Code::Configuration,
                  "failed to set impersonate target " + target +
                      ": libcurl built without curl_easy_impersonate",
                  "impersonate",
                  static_cast<int>(CURLE_NOT_BUILT_IN)});
#endif
    }

    Result<void> CurlHandle::set_headers(
        const std::vector<std::string>& lines) {
        curl_slist* list = nullptr;
        for (const auto& line : lines) {
            curl_slist* next = curl_slist_append(list, line.c_str());
            if (next == nullptr) {
                curl_slist_free_all(list);
                return Result<void>::err(
                    Error{Error::Code::ResourceExhausted,
                          "failed to build request header list", "headers"});
            }
            list = next;
        }
        const CURLcode rc = curl_easy_setopt(m_easy, CURLOPT_HTTPHEADER, list);
        if (rc != CURLE_OK) {
            curl_slist_free_all(list);
            return Result<void>::err(Error{
                Error::Code::Configuration,
                std::string("failed to set headers: ") + curl_easy_strerror(rc),
                "headers", static_cast<int>(rc)});
        }
        free_header_list();
        m_header_list = list;
        return Result<void>::ok();
    }

    Result<void> CurlHandle::set_body(std::string_view body) {
        CURLcode rc = curl_easy_setopt(m_easy, CURLOPT_POSTFIELDSIZE_LARGE,
                                       static_cast<curl_off_t>(body.size()));
        if (rc == CURLE_OK) {
            rc = curl_easy_setopt(m_easy, CURLOPT_POSTFIELDS, body.data());
        }
        if (rc != CURLE_OK) {
            return Result<void>::err(Error{Error::Code::Configuration,
                                           std::string("failed to set body: ") +
                                               curl_easy_strerror(rc),
                                           "body", static_cast<int>(rc)});
        }
        return Result<void>::ok();
    }

    Result<void> CurlHandle::set_sinks(BodySink& body, HeaderSink* headers) {
        auto fail = [](const char* what, CURLcode rc) {
            return Result<void>::err(
                Error{Error::Code::Configuration,
                      std::string("failed to set ") + what + ": " +
                          curl_easy_strerror(rc),
                      what, static_cast<int>(rc)});
        };

        CURLcode rc =
            curl_easy_setopt(m_easy, CURLOPT_WRITEFUNCTION, &write_callback);
        if (rc == CURLE_OK)
            rc = curl_easy_setopt(m_easy, CURLOPT_WRITEDATA,
                                  static_cast<BodySink*>(&body));
        if (rc != CURLE_OK) return fail("write function", rc);

        if (headers != nullptr) {
            rc = curl_easy_setopt(m_easy, CURLOPT_HEADERFUNCTION,
                                  &header_callback);
            if (rc == CURLE_OK)
                rc = curl_easy_setopt(m_easy, CURLOPT_HEADERDATA, headers);
            if (rc != CURLE_OK) return fail("header function", rc);
        }
        return Result<void>::ok();
    }

    Result<void> CurlHandle::perform() {
        m_error_buffer[0] = '\0';
        const CURLcode rc = curl_easy_perform(m_easy);
        if (rc == CURLE_OK) return Result<void>::ok();

        const std::string detail = m_error_buffer[0] != '\0'
                                       ? std::string(m_error_buffer)
                                       : std::string(curl_easy_strerror(rc));
        return Result<void>::err(Error{classify(rc),
                                       "request failed: " + detail,
                                       {},
                                       static_cast<int>(rc)});
    }

    Result<long> CurlHandle::response_code() {
        long code = 0;
        const CURLcode rc =
            curl_easy_getinfo(m_easy, CURLINFO_RESPONSE_CODE, &code);
        if (rc != CURLE_OK) {
            return Result<long>::err(
                Error{Error::Code::ReceiveFailed,
                      std::string("failed to get response code: ") +
                          curl_easy_strerror(rc),
                      {},
                      static_cast<int>(rc)});
        }
        return Result<long>::ok(code);
    }

    std::optional<std::string> CurlHandle::content_type() {
        char* ct = nullptr;
        if (curl_easy_getinfo(m_easy, CURLINFO_CONTENT_TYPE, &ct) !=
                CURLE_OK ||
            ct == nullptr) {
            return std::nullopt;
        }
        return std::string(ct);
    }

    void CurlHandle::reset() {
        curl_easy_reset(m_easy);
        free_header_list();
        m_error_buffer[0] = '\0';
        curl_easy_setopt(m_easy, CURLOPT_ERRORBUFFER, m_error_buffer);
    }

    void CurlHandle::free_header_list() noexcept {
        if (m_header_list) {
            curl_slist_free_all(m_header_list);
            m_header_list = nullptr;
        }
    }

    std::size_t CurlHandle::write_callback(char* ptr, std::size_t size,
                                           std::size_t nmemb,
                                           void* userdata) {
        const std::size_t n = size * nmemb;
        try {
            static_cast<BodySink*>(userdata)->append({ptr, n});
        } catch (const std::exception&) {
            // A short count makes libcurl fail the transfer with
            // CURLE_WRITE_ERROR.
            return 0;
        }
        return n;
    }

    std::size_t CurlHandle::header_callback(char* ptr, std::size_t size,
                                            std::size_t nitems,
                                            void* userdata) {
        const std::size_t n = size * nitems;
        try {
            static_cast<HeaderSink*>(userdata)->add_header_line({ptr, n});
        } catch (const std::exception&) {
            return 0;
        }
        return n;
    }

    std::unique_ptr<Handle> make_curl_handle() {
        auto handle = CurlHandle::create();
        if (handle) {
            CURLHTTP_LOG_DEBUG("created curl handle {}",
                               static_cast<void*>(handle->native_handle()));
        }
        return handle;
    }

}  // namespace curlhttp
