#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "curlhttp/transport.hpp"
#include "fake_handle.hpp"

using namespace curlhttp;
using curlhttp_test::fake_factory;
using curlhttp_test::FakeHandle;
using curlhttp_test::FakeScript;

namespace {

    // Captures the handle state right before it goes back to the pool.
    struct Recorder {
        std::map<HandleOption, long> longs;
        std::map<HandleOption, std::string> strings;
        std::vector<std::string> headers;
        std::string body;
    };

    HandleFactory recording_factory(std::shared_ptr<FakeScript> script,
                                     std::shared_ptr<Recorder> rec) {
        class RecordingHandle final : public Handle {
           public:
            RecordingHandle(std::shared_ptr<FakeScript> s,
                            std::shared_ptr<Recorder> r)
                : m_inner(std::move(s)), m_rec(std::move(r)) {}

            Result<void> set(HandleOption o, long v) override {
                return m_inner.set(o, v);
            }
            Result<void> set(HandleOption o, const std::string& v) override {
                return m_inner.set(o, v);
            }
            Result<void> impersonate(const std::string& t, bool d) override {
                return m_inner.impersonate(t, d);
            }
            Result<void> set_headers(
                const std::vector<std::string>& l) override {
                return m_inner.set_headers(l);
            }
            Result<void> set_body(std::string_view b) override {
                return m_inner.set_body(b);
            }
            Result<void> set_sinks(BodySink& b, HeaderSink* h) override {
                return m_inner.set_sinks(b, h);
            }
            Result<void> perform() override {
                m_rec->longs = m_inner.longs;
                m_rec->strings = m_inner.strings;
                m_rec->headers = m_inner.headers;
                m_rec->body = m_inner.body;
                return m_inner.perform();
            }
            Result<long> response_code() override {
                return m_inner.response_code();
            }
            std::optional<std::string> content_type() override {
                return m_inner.content_type();
            }
            void reset() override { m_inner.reset(); }

           private:
            FakeHandle m_inner;
            std::shared_ptr<Recorder> m_rec;
        };

        return [script, rec]() -> std::unique_ptr<Handle> {
            return std::make_unique<RecordingHandle>(script, rec);
        };
    }

    bool has_line(const std::vector<std::string>& lines,
                  const std::string& line) {
        return std::find(lines.begin(), lines.end(), line) != lines.end();
    }

}  // namespace

TEST(TransportTest, NullRequestIsRejected) {
    auto script = std::make_shared<FakeScript>();
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto r = t.round_trip(nullptr);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidRequest);
    EXPECT_EQ(r.error().message, "request cannot be nil");
    EXPECT_EQ(script->created.load(), 0);
}

TEST(TransportTest, MissingUrlIsRejected) {
    auto script = std::make_shared<FakeScript>();
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto req = std::make_shared<Request>();
    auto r = t.round_trip(req);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidRequest);
    EXPECT_EQ(r.error().message, "request URL cannot be nil");
    EXPECT_EQ(script->created.load(), 0);
    EXPECT_EQ(t.pool_stats().created, 0u);
}

TEST(TransportTest, UnknownMethodIsRejected) {
    auto script = std::make_shared<FakeScript>();
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto req = make_request(static_cast<HttpMethod>(0x7f), "http://h/");
    auto r = t.round_trip(req);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidRequest);
    EXPECT_EQ(r.error().message, "unsupported HTTP method");
    EXPECT_EQ(script->created.load(), 0);
}

TEST(TransportTest, UrlIsHandedToTheNativeLayerVerbatim) {
    auto script = std::make_shared<FakeScript>();
    auto rec = std::make_shared<Recorder>();
    Transport t(TransportConfiguration{}, recording_factory(script, rec));

    auto r = t.round_trip(
        make_request(HttpMethod::Get, "HTTP://Example.test:8080/a?b=1"));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(rec->strings[HandleOption::Url],
              "HTTP://Example.test:8080/a?b=1");
}

TEST(TransportTest, NativeUrlErrorIsReturnedAsIs) {
    auto script = std::make_shared<FakeScript>();
    Error e{Error::Code::InvalidUrl, "request failed: URL using bad/illegal "
                                     "format or missing URL"};
    e.native_code = 3;
    script->perform_error = e;
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto r = t.round_trip(make_request(HttpMethod::Get, "http://[::1"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidUrl);
    EXPECT_EQ(r.error().native_code, 3);
    EXPECT_EQ(t.pool_stats().in_use, 0u);
}

TEST(TransportTest, BuildsResponseFromSinks) {
    auto script = std::make_shared<FakeScript>();
    script->status = 201;
    script->header_lines = {"HTTP/1.1 201 Created\r\n",
                            "content-type: application/json\r\n",
                            "X-Multi: a\r\n", "x-multi: b\r\n", "\r\n"};
    script->body = "{\"id\":1}";
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto req = make_request(HttpMethod::Get, "http://example.test/items");
    auto r = t.round_trip(req);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    const Response& res = r.value();
    EXPECT_EQ(res.status_code, 201);
    EXPECT_EQ(res.status, "201 Created");
    EXPECT_EQ(res.proto, "HTTP/1.1");
    EXPECT_EQ(res.proto_major, 1);
    EXPECT_EQ(res.proto_minor, 1);
    EXPECT_EQ(res.body, "{\"id\":1}");
    EXPECT_EQ(res.content_length, 8);
    EXPECT_EQ(res.header("Content-Type"), "application/json");
    EXPECT_EQ(res.headers.count("X-Multi"), 2u);
    EXPECT_EQ(res.request, req);

    auto st = t.pool_stats();
    EXPECT_EQ(st.in_use, 0u);
    EXPECT_EQ(st.idle, 1u);
}

TEST(TransportTest, ContentTypeFallsBackToNativeThenDefault) {
    auto script = std::make_shared<FakeScript>();
    script->native_content_type = "text/plain; charset=utf-8";
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto r1 = t.round_trip(make_request(HttpMethod::Get, "http://h/"));
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1.value().header("Content-Type"), "text/plain; charset=utf-8");

    script->native_content_type.reset();
    auto r2 = t.round_trip(make_request(HttpMethod::Get, "http://h/"));
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2.value().header("Content-Type"), "application/octet-stream");
}

TEST(TransportTest, MethodMapping) {
    auto script = std::make_shared<FakeScript>();
    auto rec = std::make_shared<Recorder>();
    Transport t(TransportConfiguration{}, recording_factory(script, rec));

    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Get, "http://h/"))
                    .has_value());
    EXPECT_EQ(rec->longs[HandleOption::HttpGet], 1);
    EXPECT_EQ(rec->strings.count(HandleOption::CustomRequest), 0u);
    EXPECT_EQ(rec->strings[HandleOption::Url], "http://h/");

    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Head, "http://h/"))
                    .has_value());
    EXPECT_EQ(rec->longs[HandleOption::NoBody], 1);

    ASSERT_TRUE(
        t.round_trip(make_request(HttpMethod::Post, "http://h/", "abc"))
            .has_value());
    EXPECT_EQ(rec->longs[HandleOption::Post], 1);
    EXPECT_EQ(rec->body, "abc");
    EXPECT_TRUE(has_line(rec->headers, "Expect:"));

    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Put, "http://h/", "p"))
                    .has_value());
    EXPECT_EQ(rec->strings[HandleOption::CustomRequest], "PUT");
    EXPECT_EQ(rec->body, "p");

    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Delete, "http://h/"))
                    .has_value());
    EXPECT_EQ(rec->strings[HandleOption::CustomRequest], "DELETE");
    EXPECT_EQ(rec->body, "");
    EXPECT_FALSE(has_line(rec->headers, "Expect:"));

    ASSERT_TRUE(
        t.round_trip(make_request(HttpMethod::Patch, "http://h/", "{}"))
            .has_value());
    EXPECT_EQ(rec->strings[HandleOption::CustomRequest], "PATCH");
    EXPECT_EQ(rec->body, "{}");

    // One handle served everything.
    EXPECT_EQ(script->created.load(), 1);
}

TEST(TransportTest, HeadersAndTimeoutOverride) {
    auto script = std::make_shared<FakeScript>();
    auto rec = std::make_shared<Recorder>();
    Transport t(TransportConfiguration{}, recording_factory(script, rec));

    auto req = make_request(HttpMethod::Get, "http://h/");
    req->headers.insert("X-Token", "first");
    req->headers.insert("x-token", "second");
    req->headers.insert("Accept", "*/*");
    req->timeout = std::chrono::milliseconds(1500);

    ASSERT_TRUE(t.round_trip(req).has_value());
    EXPECT_EQ(rec->headers,
              (std::vector<std::string>{"Accept: */*", "X-Token: first"}));
    EXPECT_EQ(rec->longs[HandleOption::TimeoutMs], 1500);

    // The next request without a timeout sees the configured one again.
    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Get, "http://h/"))
                    .has_value());
    EXPECT_EQ(rec->longs[HandleOption::TimeoutMs], 30000);
}

TEST(TransportTest, ExecutionErrorReleasesHandle) {
    auto script = std::make_shared<FakeScript>();
    Error e{Error::Code::Timeout, "request failed: Timeout was reached"};
    e.native_code = 28;
    script->perform_error = e;
    Transport t(TransportConfiguration{}, fake_factory(script));

    for (int i = 0; i < 3; ++i) {
        auto r = t.round_trip(make_request(HttpMethod::Get, "http://h/"));
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Timeout);
        EXPECT_EQ(r.error().native_code, 28);
    }
    EXPECT_EQ(script->created.load(), 1);
    EXPECT_EQ(script->performed.load(), 3);
    EXPECT_EQ(t.pool_stats().in_use, 0u);
}

TEST(TransportTest, PerRequestOptionFailureIsConfigurationError) {
    auto script = std::make_shared<FakeScript>();
    script->reject_option = HandleOption::CustomRequest;
    Transport t(TransportConfiguration{}, fake_factory(script));

    auto r = t.round_trip(make_request(HttpMethod::Delete, "http://h/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Configuration);
    EXPECT_EQ(r.error().option, "custom_request");
    EXPECT_EQ(script->performed.load(), 0);
    EXPECT_EQ(t.pool_stats().in_use, 0u);
}

TEST(TransportTest, CombinedCaptureSplitsHeadersFromBody) {
    auto script = std::make_shared<FakeScript>();
    script->header_lines = {"HTTP/1.1 200 OK\r\n", "Server: fake\r\n",
                            "Content-Type: text/plain\r\n", "\r\n"};
    script->body = "line1\r\n\r\nline2";
    TransportConfiguration cfg;
    cfg.capture_mode = CaptureMode::Combined;
    Transport t(cfg, fake_factory(script));

    auto r = t.round_trip(make_request(HttpMethod::Get, "http://h/"));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value().header("Server"), "fake");
    EXPECT_EQ(r.value().header("Content-Type"), "text/plain");
    EXPECT_EQ(r.value().body, "line1\r\n\r\nline2");
}

TEST(TransportTest, OnlyTheFinalResponseHeadersAreKept) {
    auto script = std::make_shared<FakeScript>();
    script->header_lines = {"HTTP/1.1 302 Found\r\n", "Location: /new\r\n",
                            "Set-Cookie: a=1\r\n", "\r\n",
                            "HTTP/1.1 200 OK\r\n",
                            "Content-Type: text/plain\r\n", "\r\n"};
    script->body = "new";

    for (auto mode : {CaptureMode::HeaderCallback, CaptureMode::Combined}) {
        TransportConfiguration cfg;
        cfg.capture_mode = mode;
        Transport t(cfg, fake_factory(script));

        auto r = t.round_trip(make_request(HttpMethod::Get, "http://h/old"));
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().body, "new");
        EXPECT_EQ(r.value().header("Content-Type"), "text/plain");
        EXPECT_EQ(r.value().headers.count("Location"), 0u);
        EXPECT_EQ(r.value().headers.count("Set-Cookie"), 0u);
    }
}

TEST(TransportTest, CombinedCaptureWithoutSeparatorIsParseError) {
    auto script = std::make_shared<FakeScript>();
    script->header_lines = {"HTTP/1.1 200 OK\r\n", "Server: fake\r\n"};
    TransportConfiguration cfg;
    cfg.capture_mode = CaptureMode::Combined;
    Transport t(cfg, fake_factory(script));

    auto r = t.round_trip(make_request(HttpMethod::Get, "http://h/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ParseFailed);
    EXPECT_EQ(t.pool_stats().in_use, 0u);
}

TEST(TransportTest, CloseIdleHandles) {
    auto script = std::make_shared<FakeScript>();
    Transport t(TransportConfiguration{}, fake_factory(script));
    ASSERT_TRUE(t.round_trip(make_request(HttpMethod::Get, "http://h/"))
                    .has_value());
    EXPECT_EQ(t.close_idle_handles(), 1u);
    EXPECT_EQ(script->destroyed.load(), 1);
    EXPECT_EQ(t.configuration().max_pool_size, 10u);
}
