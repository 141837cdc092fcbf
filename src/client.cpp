#include "curlhttp/client.hpp"

#include <utility>

#include "curlhttp/logger.hpp"

namespace curlhttp {

    namespace {

        constexpr const char* kFormContentType =
            "application/x-www-form-urlencoded";

        std::shared_ptr<Request> body_request(HttpMethod method,
                                              const std::string& url,
                                              const std::string& content_type,
                                              std::string body) {
            auto req = make_request(method, url, std::move(body));
            if (!content_type.empty()) {
                req->headers.set(http::field::content_type, content_type);
            }
            return req;
        }

    }  // namespace

    Client::Client(ClientConfiguration config)
        : m_transport(std::make_shared<Transport>(std::move(config.transport))),
          m_timeout(config.timeout) {}

    Client::Client(std::shared_ptr<Transport> transport,
                   std::chrono::milliseconds timeout)
        : m_transport(std::move(transport)), m_timeout(timeout) {}

    void Client::ensure_initialized() {
        std::call_once(m_init, [this] {
            if (!m_transport) {
                m_transport = std::make_shared<Transport>();
                CURLHTTP_LOG_DEBUG("client initialized with default transport");
            }
            if (m_timeout.count() <= 0) m_timeout = kDefaultTimeout;
        });
    }

    const std::shared_ptr<Transport>& Client::transport() {
        ensure_initialized();
        return m_transport;
    }

    std::chrono::milliseconds Client::timeout() {
        ensure_initialized();
        return m_timeout;
    }

    Result<Response> Client::send(std::shared_ptr<const Request> request) {
        ensure_initialized();

        if (!request || request->timeout.count() > 0) {
            return m_transport->round_trip(std::move(request));
        }

        auto timed = std::make_shared<Request>(*request);
        timed->timeout = m_timeout;

        auto res = m_transport->round_trip(std::move(timed));
        if (res.has_value()) res.value().request = std::move(request);
        return res;
    }

    Result<Response> Client::get(const std::string& url) {
        return send(make_request(HttpMethod::Get, url));
    }

    Result<Response> Client::head(const std::string& url) {
        return send(make_request(HttpMethod::Head, url));
    }

    Result<Response> Client::post(const std::string& url,
                                  const std::string& content_type,
                                  std::string body) {
        return send(
            body_request(HttpMethod::Post, url, content_type, std::move(body)));
    }

    Result<Response> Client::post_form(const std::string& url,
                                       const FormValues& values) {
        return post(url, kFormContentType, url_utils::form_encode(values));
    }

    Result<Response> Client::put(const std::string& url,
                                 const std::string& content_type,
                                 std::string body) {
        return send(
            body_request(HttpMethod::Put, url, content_type, std::move(body)));
    }

    Result<Response> Client::del(const std::string& url) {
        return send(make_request(HttpMethod::Delete, url));
    }

    Client& default_client() {
        static Client client{ClientConfiguration{}};
        return client;
    }

    Result<Response> get(const std::string& url) {
        return default_client().get(url);
    }

    Result<Response> head(const std::string& url) {
        return default_client().head(url);
    }

    Result<Response> post(const std::string& url,
                          const std::string& content_type, std::string body) {
        return default_client().post(url, content_type, std::move(body));
    }

    Result<Response> post_form(const std::string& url,
                               const FormValues& values) {
        return default_client().post_form(url, values);
    }

    Result<Response> send(std::shared_ptr<const Request> request) {
        return default_client().send(std::move(request));
    }

}  // namespace curlhttp
