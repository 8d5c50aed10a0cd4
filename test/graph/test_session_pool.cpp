#include <catch2/catch_test_macros.hpp>

#include <cinegraph/graph/session_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace cinegraph;
using namespace std::chrono_literals;

namespace {

struct FakeSession {
    int id = 0;
};

SessionPool<FakeSession>::Factory CountingFactory(std::atomic<int>& created) {
    return [&created]() {
        auto session = std::make_unique<FakeSession>();
        session->id = ++created;
        return Result<std::unique_ptr<FakeSession>, Error>::Ok(std::move(session));
    };
}

} // namespace

TEST_CASE("SessionPool: sessions are created lazily", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(3, CountingFactory(created));

    CHECK(created == 0);
    CHECK(pool.Capacity() == 3);
    CHECK(pool.Available() == 3);

    auto lease = pool.Acquire(100ms);
    REQUIRE(lease.IsOk());
    CHECK(lease.Value().IsValid());
    CHECK(created == 1);
    CHECK(pool.InUse() == 1);
    CHECK(pool.Available() == 2);
}

TEST_CASE("SessionPool: released sessions are reused", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(2, CountingFactory(created));

    int first_id = 0;
    {
        auto lease = pool.Acquire(100ms);
        REQUIRE(lease.IsOk());
        first_id = lease.Value()->id;
    }
    CHECK(pool.InUse() == 0);

    auto again = pool.Acquire(100ms);
    REQUIRE(again.IsOk());
    CHECK(again.Value()->id == first_id);
    CHECK(created == 1);
}

TEST_CASE("SessionPool: exhausted pool times out", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(1, CountingFactory(created));

    auto held = pool.Acquire(100ms);
    REQUIRE(held.IsOk());

    auto waited = pool.Acquire(20ms);
    REQUIRE(waited.IsErr());
    CHECK(waited.Error().category == ErrorCategory::Timeout);
    CHECK(waited.Error().operation == "AcquireSession");
    CHECK(waited.Error().message.find("pool size 1") != std::string::npos);
}

TEST_CASE("SessionPool: a waiter wakes when a lease is released", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(1, CountingFactory(created));

    auto held = pool.Acquire(100ms);
    REQUIRE(held.IsOk());

    std::thread releaser([lease = std::move(held).Value()]() mutable {
        std::this_thread::sleep_for(20ms);
        lease.Release();
    });

    auto waited = pool.Acquire(2000ms);
    releaser.join();
    REQUIRE(waited.IsOk());
    CHECK(created == 1);
}

TEST_CASE("SessionPool: factory failure frees the slot", "[graph][pool]") {
    int attempts = 0;
    SessionPool<FakeSession> pool(1, [&attempts]() {
        ++attempts;
        if (attempts == 1) {
            return Result<std::unique_ptr<FakeSession>, Error>::Err(Error{
                "OpenSession", "http://localhost:7474", std::nullopt,
                "Connection refused", std::nullopt, ErrorCategory::StoreUnavailable});
        }
        return Result<std::unique_ptr<FakeSession>, Error>::Ok(
            std::make_unique<FakeSession>());
    });

    auto failed = pool.Acquire(50ms);
    REQUIRE(failed.IsErr());
    CHECK(failed.Error().category == ErrorCategory::StoreUnavailable);
    CHECK(pool.Available() == 1);

    auto retried = pool.Acquire(50ms);
    CHECK(retried.IsOk());
}

TEST_CASE("SessionPool: zero capacity is treated as one", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(0, CountingFactory(created));
    CHECK(pool.Capacity() == 1);
}

TEST_CASE("SessionPool: never more than capacity in use", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(2, CountingFactory(created));
    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};
    std::atomic<int> acquired{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&] {
            auto lease = pool.Acquire(5000ms);
            if (lease.IsErr()) return;
            ++acquired;
            int now = ++concurrent;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(5ms);
            --concurrent;
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    CHECK(acquired == 6);
    CHECK(peak <= 2);
    CHECK(created <= 2);
    CHECK(pool.InUse() == 0);
}

TEST_CASE("SessionPool: moved lease returns once", "[graph][pool]") {
    std::atomic<int> created{0};
    SessionPool<FakeSession> pool(1, CountingFactory(created));

    auto lease = std::move(pool.Acquire(100ms)).Value();
    SessionPool<FakeSession>::Lease moved = std::move(lease);
    CHECK_FALSE(lease.IsValid());
    CHECK(moved.IsValid());
    moved.Release();
    CHECK(pool.InUse() == 0);
    CHECK(pool.Available() == 1);
}
