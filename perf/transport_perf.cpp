#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "curlhttp/client.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp = net::ip::tcp;
using clock_type = std::chrono::steady_clock;

static void print_latency(const char* label, int iters,
                          std::chrono::nanoseconds total,
                          std::chrono::nanoseconds min,
                          std::chrono::nanoseconds max) {
    auto ms = [](std::chrono::nanoseconds d) {
        return std::chrono::duration<double, std::milli>(d).count();
    };
    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << std::fixed
              << std::setprecision(2) << " total_ms=" << ms(total)
              << " avg_ms=" << ms(total) / iters << " min_ms=" << ms(min)
              << " max_ms=" << ms(max) << "\n";
}

static void print_throughput(const char* label, std::uint64_t ok,
                             std::uint64_t failed,
                             std::chrono::nanoseconds elapsed,
                             const curlhttp::HandlePool::Stats& st) {
    const double secs = std::chrono::duration<double>(elapsed).count();
    std::cout << "\n[ PERF ] " << label << "\n"
              << "        ok=" << ok << " failed=" << failed << std::fixed
              << std::setprecision(2) << " elapsed_s=" << secs
              << " rps=" << (secs > 0 ? ok / secs : 0.0)
              << " handles_created=" << st.created
              << " handles_destroyed=" << st.destroyed
              << " handles_idle=" << st.idle << "\n";
}

// Plain-HTTP local server; no browser identity involved.
static curlhttp::ClientConfiguration local_configuration() {
    curlhttp::ClientConfiguration cfg;
    cfg.transport.handle.disable_impersonation = true;
    return cfg;
}

// In-process keep-alive server; one thread per connection.
class LocalHttpServer {
   public:
    LocalHttpServer() : ioc_(1), acceptor_(ioc_) {}

    void start() {
        boost::system::error_code ec;
        tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};

        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("acceptor.open: " + ec.message());
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("acceptor.set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());

        port_ = acceptor_.local_endpoint().port();
        do_accept();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    void stop() {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true)) return;

        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    ~LocalHttpServer() { stop(); }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::atomic<int> connections{0};

   private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [this](boost::system::error_code ec, tcp::socket sock) {
                if (!ec) {
                    connections.fetch_add(1, std::memory_order_relaxed);
                    std::thread(&LocalHttpServer::handle_connection, this,
                                std::move(sock))
                        .detach();
                }
                if (!stopped_.load(std::memory_order_relaxed)) do_accept();
            });
    }

    void handle_connection(tcp::socket sock) {
        beast::tcp_stream stream(std::move(sock));
        beast::flat_buffer buffer;

        for (;;) {
            boost::system::error_code ec;
            bhttp::request<bhttp::string_body> req;
            bhttp::read(stream, buffer, req, ec);
            if (ec) break;

            bhttp::response<bhttp::string_body> res;
            res.version(req.version());
            res.set(bhttp::field::server, "curlhttp-perf-local");
            res.set(bhttp::field::content_type, "text/plain");
            res.keep_alive(req.keep_alive());

            if (req.target() == "/health") {
                res.result(bhttp::status::ok);
                res.body() = "OK";
            } else if (req.target() == "/echo") {
                res.result(bhttp::status::ok);
                res.body() = req.body();
            } else {
                res.result(bhttp::status::not_found);
                res.body() = "not found";
            }
            res.prepare_payload();

            bhttp::write(stream, res, ec);
            if (ec || !res.keep_alive()) break;
        }

        boost::system::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};
    std::uint16_t port_{0};
};

class TransportPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { server_.start(); }

    static void TearDownTestSuite() { server_.stop(); }

    static inline LocalHttpServer server_{};
};

TEST_F(TransportPerf, SerialSameClient) {
    constexpr int iters = 200;
    curlhttp::Client client(local_configuration());

    {
        auto r = client.get(server_.url("/health"));
        ASSERT_TRUE(r.has_value()) << r.error().message;
    }

    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock_type::now();
        auto r = client.get(server_.url("/health"));
        const auto t1 = clock_type::now();

        ASSERT_TRUE(r.has_value()) << r.error().message;
        ASSERT_EQ(r.value().status_code, 200);

        const auto dt = t1 - t0;
        total += dt;
        min = std::min<std::chrono::nanoseconds>(min, dt);
        max = std::max<std::chrono::nanoseconds>(max, dt);
    }

    print_latency("Serial (same client -> local server)", iters, total, min,
                  max);
    std::cout << "        server_connections=" << server_.connections.load()
              << "\n";
    EXPECT_EQ(client.transport()->pool_stats().created, 1u);
}

TEST_F(TransportPerf, HighConcurrencyBurst) {
    constexpr int threads = 64;
    constexpr int per_thread = 25;
    curlhttp::Client client(local_configuration());

    std::atomic<std::uint64_t> ok{0};
    std::atomic<std::uint64_t> failed{0};
    const auto t0 = clock_type::now();
    {
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&] {
                for (int i = 0; i < per_thread; ++i) {
                    auto r = client.get(server_.url("/health"));
                    if (r.has_value() && r.value().status_code == 200)
                        ++ok;
                    else
                        ++failed;
                }
            });
        }
        for (auto& w : workers) w.join();
    }
    const auto elapsed = clock_type::now() - t0;

    const auto st = client.transport()->pool_stats();
    print_throughput("Burst (64 threads, pool of 10)", ok, failed, elapsed,
                     st);
    EXPECT_EQ(failed.load(), 0u);
    EXPECT_EQ(st.in_use, 0u);
    EXPECT_LE(st.idle, 10u);
}

TEST_F(TransportPerf, MixedScaleWithBoundedConcurrency) {
    constexpr int workers_n = 10;
    constexpr int gets = 2000;
    constexpr int posts = 1000;
    curlhttp::Client client(local_configuration());

    std::atomic<int> next{0};
    std::atomic<std::uint64_t> ok{0};
    std::atomic<std::uint64_t> failed{0};
    const auto t0 = clock_type::now();
    {
        std::vector<std::thread> workers;
        for (int w = 0; w < workers_n; ++w) {
            workers.emplace_back([&] {
                for (int i = next++; i < gets + posts; i = next++) {
                    curlhttp::Result<curlhttp::Response> r =
                        i < gets ? client.get(server_.url("/health"))
                                 : client.post(server_.url("/echo"),
                                               "application/json",
                                               "{\"n\":" + std::to_string(i) +
                                                   "}");
                    if (r.has_value() && r.value().status_code == 200)
                        ++ok;
                    else
                        ++failed;
                }
            });
        }
        for (auto& w : workers) w.join();
    }
    const auto elapsed = clock_type::now() - t0;

    print_throughput("Scale (GET+POST, 10 workers)", ok, failed, elapsed,
                     client.transport()->pool_stats());
    EXPECT_EQ(ok.load(), static_cast<std::uint64_t>(gets + posts));
}
