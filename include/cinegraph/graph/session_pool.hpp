#pragma once

#include <cinegraph/core/log.hpp>
#include <cinegraph/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// SessionPool<Session> - bounded pool of reusable store sessions.
//
// Sessions are created lazily by the factory, up to Capacity(). Acquire()
// blocks until a session is idle or the timeout elapses; waiting past the
// deadline is a Timeout error. A Lease hands the session back on
// destruction, so a session is returned on every path, error paths included.
//
// Thread-safe. The pool must outlive every Lease it hands out.
// ---------------------------------------------------------------------------
template <typename Session>
class SessionPool {
public:
    using Factory = std::function<Result<std::unique_ptr<Session>, Error>()>;

    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept
            : pool_(other.pool_), session_(std::move(other.session_)) {
            other.pool_ = nullptr;
        }
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                Release();
                pool_ = other.pool_;
                session_ = std::move(other.session_);
                other.pool_ = nullptr;
            }
            return *this;
        }
        ~Lease() { Release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] bool IsValid() const noexcept { return session_ != nullptr; }
        Session& operator*() const { return *session_; }
        Session* operator->() const { return session_.get(); }

        /// Return the session to the pool early.
        void Release() {
            if (pool_ != nullptr && session_ != nullptr) {
                pool_->Return(std::move(session_));
            }
            pool_ = nullptr;
            session_.reset();
        }

    private:
        friend class SessionPool;
        Lease(SessionPool* pool, std::unique_ptr<Session> session)
            : pool_(pool), session_(std::move(session)) {}

        SessionPool* pool_ = nullptr;
        std::unique_ptr<Session> session_;
    };

    SessionPool(size_t capacity, Factory factory)
        : capacity_(capacity == 0 ? 1 : capacity), factory_(std::move(factory)) {}

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    [[nodiscard]] Result<Lease, Error> Acquire(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (idle_.empty() && created_ >= capacity_) {
            if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                idle_.empty() && created_ >= capacity_) {
                LogWarn("pool", "no idle session within " +
                                std::to_string(timeout.count()) + "ms");
                return Result<Lease, Error>::Err(Error{
                    "AcquireSession", "", std::nullopt,
                    "No store session became available within " +
                        std::to_string(timeout.count()) + "ms (pool size " +
                        std::to_string(capacity_) + ")",
                    std::nullopt, ErrorCategory::Timeout});
            }
        }

        if (!idle_.empty()) {
            auto session = std::move(idle_.back());
            idle_.pop_back();
            ++in_use_;
            return Result<Lease, Error>::Ok(Lease(this, std::move(session)));
        }

        // Reserve the slot before creating outside the lock.
        ++created_;
        lock.unlock();
        auto created = factory_();
        lock.lock();
        if (created.IsErr()) {
            --created_;
            cv_.notify_one();
            return Result<Lease, Error>::Err(std::move(created).Error());
        }
        ++in_use_;
        LogDebug("pool", "created session " + std::to_string(created_) + "/" +
                         std::to_string(capacity_));
        return Result<Lease, Error>::Ok(Lease(this, std::move(created).Value()));
    }

    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t Available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size() + (capacity_ - created_);
    }

    [[nodiscard]] size_t InUse() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

private:
    void Return(std::unique_ptr<Session> session) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back(std::move(session));
            --in_use_;
        }
        cv_.notify_one();
    }

    const size_t capacity_;
    Factory factory_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Session>> idle_;
    size_t created_ = 0;
    size_t in_use_ = 0;
};

} // namespace cinegraph
