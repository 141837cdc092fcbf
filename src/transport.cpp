#include "curlhttp/transport.hpp"

#include <string_view>
#include <utility>

#include "curlhttp/curl_handle.hpp"
#include "curlhttp/logger.hpp"
#include "curlhttp/sinks.hpp"

namespace curlhttp {

    namespace {

        Result<Response> invalid(std::string message) {
            return Result<Response>::err(
                Error{Error::Code::InvalidRequest, std::move(message)});
        }

        // Non-null even when empty: a null POSTFIELDS makes libcurl fall
        // back to its read callback.
        std::string_view body_view(const std::optional<std::string>& body) {
            static constexpr std::string_view kEmpty{""};
            return body ? std::string_view(*body) : kEmpty;
        }

    }  // namespace

    Transport::Transport(TransportConfiguration config)
        : Transport(std::move(config), &make_curl_handle) {}

    Transport::Transport(TransportConfiguration config, HandleFactory factory)
        : m_config(std::move(config)),
          m_pool(m_config.handle, m_config.max_pool_size, std::move(factory)) {}

    Result<Response> Transport::round_trip(
        std::shared_ptr<const Request> request) {
        if (!request) return invalid("request cannot be nil");
        if (!request->url) return invalid("request URL cannot be nil");
        if (method_string(request->method).empty()) {
            return invalid("unsupported HTTP method");
        }

        // One value per name; the body is already fully in memory.
        const std::vector<std::string> header_lines =
            flatten_request_headers(request->headers);

        auto acquired = m_pool.acquire();
        if (acquired.has_error()) {
            return Result<Response>::err(std::move(acquired).error());
        }
        HandlePool::Lease lease = std::move(acquired).value();

        ResponseBuffer buffer;
        HeaderCollector collector;
        const bool combined = m_config.capture_mode == CaptureMode::Combined;

        auto r = prepare(*lease, *request, header_lines);
        if (r.has_error()) return Result<Response>::err(std::move(r).error());

        r = lease->set_sinks(buffer, combined ? nullptr : &collector);
        if (r.has_error()) return Result<Response>::err(std::move(r).error());

        r = lease->perform();
        if (r.has_error()) {
            CURLHTTP_LOG_DEBUG("{} {} failed: {}",
                               method_string(request->method), *request->url,
                               r.error().message);
            return Result<Response>::err(std::move(r).error());
        }

        auto code = lease->response_code();
        if (code.has_error()) {
            return Result<Response>::err(std::move(code).error());
        }

        Response out;
        if (combined) {
            const std::string blob = buffer.bytes();
            auto block = split_header_block(blob);
            if (block.has_error()) {
                return Result<Response>::err(std::move(block).error());
            }
            out.headers = parse_headers(block.value().head);
            out.body = std::string(block.value().body);
        } else {
            out.headers = collector.headers();
            out.body = buffer.bytes();
        }

        if (out.headers.find(http::field::content_type) == out.headers.end()) {
            const auto native = lease->content_type();
            out.headers.set(http::field::content_type,
                            native ? *native : std::string(kDefaultContentType));
        }

        // Done with the handle; give it back before assembling the rest.
        lease.reset();

        out.status_code = static_cast<int>(code.value());
        out.status = status_line(out.status_code);
        out.proto = "HTTP/1.1";
        out.proto_major = 1;
        out.proto_minor = 1;
        out.content_length = static_cast<std::int64_t>(out.body.size());
        out.request = std::move(request);
        return Result<Response>::ok(std::move(out));
    }

    Result<void> Transport::prepare(
        Handle& handle, const Request& request,
        const std::vector<std::string>& header_lines) {
        auto r = handle.set(HandleOption::Url, *request.url);
        if (r.has_error()) return r;

        bool attached_body = false;
        switch (request.method) {
            case HttpMethod::Get:
                r = handle.set(HandleOption::HttpGet, 1L);
                break;
            case HttpMethod::Head:
                r = handle.set(HandleOption::NoBody, 1L);
                break;
            case HttpMethod::Post:
                r = handle.set(HandleOption::Post, 1L);
                if (r.has_value()) r = handle.set_body(body_view(request.body));
                attached_body = true;
                break;
            case HttpMethod::Put:
                r = handle.set_body(body_view(request.body));
                if (r.has_value())
                    r = handle.set(HandleOption::CustomRequest,
                                   std::string("PUT"));
                attached_body = true;
                break;
            default:
                r = handle.set(HandleOption::CustomRequest,
                               std::string(method_string(request.method)));
                if (r.has_value() && request.body) {
                    r = handle.set_body(*request.body);
                    attached_body = true;
                }
                break;
        }
        if (r.has_error()) return r;

        if (request.timeout.count() > 0) {
            r = handle.set(HandleOption::TimeoutMs,
                           static_cast<long>(request.timeout.count()));
            if (r.has_error()) return r;
        }

        if (m_config.capture_mode == CaptureMode::Combined) {
            r = handle.set(HandleOption::IncludeHeader, 1L);
            if (r.has_error()) return r;
        }

        if (attached_body) {
            // Suppress "Expect: 100-continue" so the body goes out at once.
            std::vector<std::string> lines = header_lines;
            lines.emplace_back("Expect:");
            return handle.set_headers(lines);
        }
        if (!header_lines.empty()) return handle.set_headers(header_lines);
        return Result<void>::ok();
    }

}  // namespace curlhttp
