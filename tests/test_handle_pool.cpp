#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "curlhttp/handle_pool.hpp"
#include "fake_handle.hpp"

using namespace curlhttp;
using curlhttp_test::fake_factory;
using curlhttp_test::FakeHandle;
using curlhttp_test::FakeScript;

namespace {

    TEST(HandlePoolTest, SequentialUseReusesOneHandle) {
        auto script = std::make_shared<FakeScript>();
        HandlePool pool(HandleConfiguration{}, 4, fake_factory(script));

        Handle* first = nullptr;
        for (int i = 0; i < 10; ++i) {
            auto lease = pool.acquire();
            ASSERT_TRUE(lease.has_value()) << lease.error().message;
            if (!first) first = lease.value().get();
            EXPECT_EQ(lease.value().get(), first);
        }

        EXPECT_EQ(script->created.load(), 1);
        auto st = pool.stats();
        EXPECT_EQ(st.created, 1u);
        EXPECT_EQ(st.idle, 1u);
        EXPECT_EQ(st.in_use, 0u);
    }

    TEST(HandlePoolTest, ReleaseResetsAndReconfigures) {
        auto script = std::make_shared<FakeScript>();
        HandlePool pool(HandleConfiguration{}, 1, fake_factory(script));
        {
            auto lease = pool.acquire();
            ASSERT_TRUE(lease.has_value());
            auto* fake = static_cast<FakeHandle*>(lease.value().get());
            fake->longs[HandleOption::TimeoutMs] = 5;
            fake->strings[HandleOption::Url] = "http://x/";
        }
        EXPECT_EQ(script->resets.load(), 1);

        auto lease = pool.acquire();
        ASSERT_TRUE(lease.has_value());
        auto* fake = static_cast<FakeHandle*>(lease.value().get());
        EXPECT_EQ(fake->longs[HandleOption::TimeoutMs], 30000);
        EXPECT_EQ(fake->strings.count(HandleOption::Url), 0u);
        EXPECT_EQ(fake->impersonated, "chrome136");
    }

    TEST(HandlePoolTest, FullIdleSetDestroysExtraHandles) {
        auto script = std::make_shared<FakeScript>();
        HandlePool pool(HandleConfiguration{}, 2, fake_factory(script));
        {
            std::vector<HandlePool::Lease> leases;
            for (int i = 0; i < 5; ++i) {
                auto r = pool.acquire();
                ASSERT_TRUE(r.has_value());
                leases.push_back(std::move(r).value());
            }
            EXPECT_EQ(pool.stats().in_use, 5u);
        }
        auto st = pool.stats();
        EXPECT_EQ(st.created, 5u);
        EXPECT_EQ(st.idle, 2u);
        EXPECT_EQ(st.destroyed, 3u);
        EXPECT_EQ(script->destroyed.load(), 3);
    }

    TEST(HandlePoolTest, ZeroCapacityKeepsNothing) {
        auto script = std::make_shared<FakeScript>();
        HandlePool pool(HandleConfiguration{}, 0, fake_factory(script));
        for (int i = 0; i < 3; ++i) {
            auto lease = pool.acquire();
            ASSERT_TRUE(lease.has_value());
        }
        EXPECT_EQ(script->created.load(), 3);
        EXPECT_EQ(pool.stats().idle, 0u);
    }

    TEST(HandlePoolTest, BurstAboveCapacityCompletes) {
        auto script = std::make_shared<FakeScript>();
        constexpr int kThreads = 32;
        constexpr int kPerThread = 50;
        HandlePool pool(HandleConfiguration{}, 4, fake_factory(script));

        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < kPerThread; ++i) {
                    auto lease = pool.acquire();
                    if (lease.has_value() && lease.value()) ++ok;
                }
            });
        }
        for (auto& t : threads) t.join();

        EXPECT_EQ(ok.load(), kThreads * kPerThread);
        auto st = pool.stats();
        EXPECT_EQ(st.in_use, 0u);
        EXPECT_LE(st.idle, 4u);
        // Never more handles than concurrent callers plus what sat idle.
        EXPECT_LE(st.created - st.destroyed, 4u);
        EXPECT_LE(static_cast<int>(st.created), kThreads * kPerThread);
    }

    TEST(HandlePoolTest, NullFactoryIsResourceExhausted) {
        HandlePool pool(HandleConfiguration{}, 2,
                        [] { return std::unique_ptr<Handle>(); });
        auto r = pool.acquire();
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::ResourceExhausted);
        EXPECT_EQ(r.error().message, "failed to get curl handle");
        EXPECT_EQ(pool.stats().created, 0u);
    }

    TEST(HandlePoolTest, ConfigurationFailureDiscardsNewHandle) {
        auto script = std::make_shared<FakeScript>();
        script->reject_option = HandleOption::NoSignal;
        HandlePool pool(HandleConfiguration{}, 2, fake_factory(script));

        auto r = pool.acquire();
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::Configuration);
        EXPECT_EQ(r.error().option, "no_signal");
        EXPECT_EQ(script->created.load(), 1);
        EXPECT_EQ(script->destroyed.load(), 1);
        EXPECT_EQ(pool.stats().in_use, 0u);
    }

    TEST(HandlePoolTest, LeaseOutlivesPool) {
        auto script = std::make_shared<FakeScript>();
        HandlePool::Lease survivor;
        {
            HandlePool pool(HandleConfiguration{}, 2, fake_factory(script));
            auto r = pool.acquire();
            ASSERT_TRUE(r.has_value());
            survivor = std::move(r).value();
        }
        EXPECT_EQ(script->destroyed.load(), 0);
        survivor.reset();
        EXPECT_FALSE(survivor);
        EXPECT_EQ(script->destroyed.load(), 1);
    }

    TEST(HandlePoolTest, CloseIdleDrainsIdleHandles) {
        auto script = std::make_shared<FakeScript>();
        HandlePool pool(HandleConfiguration{}, 4, fake_factory(script));
        {
            auto a = pool.acquire();
            auto b = pool.acquire();
            ASSERT_TRUE(a.has_value() && b.has_value());
        }
        EXPECT_EQ(pool.stats().idle, 2u);
        EXPECT_EQ(pool.close_idle(), 2u);
        EXPECT_EQ(pool.stats().idle, 0u);
        EXPECT_EQ(script->destroyed.load(), 2);
    }

    TEST(HandlePoolTest, PoolDestructionDestroysIdleHandles) {
        auto script = std::make_shared<FakeScript>();
        {
            HandlePool pool(HandleConfiguration{}, 4, fake_factory(script));
            auto a = pool.acquire();
            ASSERT_TRUE(a.has_value());
        }
        EXPECT_EQ(script->created.load(), 1);
        EXPECT_EQ(script->destroyed.load(), 1);
    }

}  // namespace
