#pragma once

#include <utility>  // needed before boost/asio/awaitable.hpp (Boost 1.74 omits it)

#include <algorithm>
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "toolbridge/error.hpp"
#include "toolbridge/logging.hpp"
#include "toolbridge/pool/server_pool_types.hpp"
#include "toolbridge/result.hpp"
#include "toolbridge/server.hpp"

namespace toolbridge {

    /**
     * Fixed-capacity pool of stateful servers shared by concurrent requests.
     *
     * Servers are created only by initialize() and are never replenished:
     * an unhealthy release shrinks the pool for the rest of its life.
     *
     * SAFETY:
     * - Accounting is protected by a mutex that is never held across a
     *   suspension point
     * - Every coroutine touching the pool must run on its executor (a
     *   single-threaded io_context or a strand); waiter timers are not
     *   thread-safe
     *
     * INVARIANTS:
     * 1. available_.size() <= tracked_.size() <= capacity_
     * 2. Every entry of available_ is tracked and not lent
     * 3. A server is handed to at most one caller between acquire and
     *    release
     * 4. Every server that was ever tracked is disposed exactly once
     *
     * ERRORS:
     * - ConfigurationError: bad constructor arguments
     * - PoolInitializationError: a factory call failed, pool is Shutdown
     * - PoolStateError: initialize() outside Uninitialized
     * - Result errors from acquire(): InvalidState, Shutdown, Timeout,
     *   Cancelled
     * - release() and shutdown() never throw; disposal failures are logged
     *
     * LIFECYCLE:
     * Uninitialized -> initialize() -> Ready (or Shutdown on failure)
     * Ready -> shutdown() -> Shutdown
     */
    template <typename ServerT>
    class BasicServerPool {
        static_assert(std::is_base_of_v<Server, ServerT>,
                      "ServerT must derive from toolbridge::Server");

       public:
        using server_type = ServerT;
        using server_ptr = std::shared_ptr<ServerT>;
        using factory_type = ServerFactory<ServerT>;
        using clock_type = std::chrono::steady_clock;

       private:
        /// @brief Shared with leases and parked coroutines so they can tell
        /// whether the pool still exists.
        struct Lifetime {
            std::atomic<bool> alive{true};
        };

       public:
        /**
         * @brief RAII borrow of one server.
         *
         * Destroying a lease that still holds its server posts the release
         * to the pool's executor. A lease that outlives its pool is inert.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            ServerT* operator->() const noexcept { return get(); }

            ServerT& operator*() const { return *get(); }

            /// @brief The borrowed server, or nullptr once released or when
            /// the pool is gone
            ServerT* get() const noexcept {
                auto st = life_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return server_.get();
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            /// @brief Have the server disposed instead of recycled.
            void mark_unhealthy() noexcept { healthy_ = false; }

            bool healthy() const noexcept { return healthy_; }

            /// @brief Return the server now, with the recorded verdict.
            boost::asio::awaitable<void> release() {
                auto st = life_.lock();
                auto pool = std::exchange(pool_, nullptr);
                auto s = std::move(server_);
                server_.reset();
                if (!s || !pool || !st ||
                    !st->alive.load(std::memory_order_acquire))
                    co_return;
                co_await pool->release(std::move(s), healthy_);
            }

           private:
            friend class BasicServerPool;

            Lease(BasicServerPool* pool, std::weak_ptr<Lifetime> life,
                  server_ptr s)
                : pool_(pool), life_(std::move(life)), server_(std::move(s)) {}

            void reset() noexcept {
                if (!server_) return;
                auto st = life_.lock();
                auto pool = std::exchange(pool_, nullptr);
                auto s = std::move(server_);
                server_.reset();

                // If pool is already dead, do not call back into it.
                if (!st || !st->alive.load(std::memory_order_acquire) ||
                    !pool)
                    return;
                pool->post_release_(std::move(s), healthy_);
            }

            void move_from(Lease&& other) noexcept {
                pool_ = std::exchange(other.pool_, nullptr);
                life_ = std::move(other.life_);
                server_ = std::move(other.server_);
                other.server_.reset();
                healthy_ = std::exchange(other.healthy_, true);
            }

            BasicServerPool* pool_{nullptr};
            std::weak_ptr<Lifetime> life_;
            server_ptr server_;
            bool healthy_{true};
        };

        /**
         * @brief Constructs an empty pool; no server is created until
         * initialize().
         * @param ex Executor that runs waiter timers and deferred releases.
         * @param name Diagnostic name, also the registry key.
         * @param capacity Number of servers initialize() creates.
         * @param factory Asynchronous constructor of one server.
         * @throws ConfigurationError if name is empty, capacity is 0 or
         * factory is empty.
         */
        BasicServerPool(boost::asio::any_io_executor ex, std::string name,
                        std::size_t capacity, factory_type factory)
            : ex_(std::move(ex)),
              name_(std::move(name)),
              capacity_(capacity),
              factory_(std::move(factory)),
              lifetime_(std::make_shared<Lifetime>()) {
            if (name_.empty()) {
                throw ConfigurationError("Pool name must not be empty");
            }
            if (capacity_ == 0) {
                throw ConfigurationError("Pool '" + name_ +
                                         "': capacity must be positive");
            }
            if (!factory_) {
                throw ConfigurationError("Pool '" + name_ +
                                         "': server factory is not callable");
            }
            logger()->info("Pool '{}': created with capacity {}", name_,
                           capacity_);
        }

        BasicServerPool(BasicServerPool const&) = delete;
        BasicServerPool& operator=(BasicServerPool const&) = delete;

        ~BasicServerPool() {
            lifetime_->alive.store(false, std::memory_order_release);

            std::list<std::shared_ptr<Waiter>> to_wake;
            std::vector<server_ptr> leftover;
            {
                std::lock_guard<std::mutex> lk(mu_);
                to_wake.swap(waiters_);
                for (auto& w : to_wake) w->closed = true;
                for (auto& t : tracked_) leftover.push_back(std::move(t.server));
                tracked_.clear();
                available_.clear();
            }

            for (auto& w : to_wake) wake_(*w);

            if (leftover.empty()) return;

            try {
                logger()->error(
                    "Pool '{}': destroyed without shutdown(), disposing {} "
                    "servers in the background",
                    name_, leftover.size());
                boost::asio::co_spawn(
                    ex_, dispose_all_detached_(name_, std::move(leftover)),
                    boost::asio::detached);
            } catch (const std::exception& e) {
                logger()->error("Pool '{}': could not schedule disposal: {}",
                                name_, e.what());
            }
        }

        /**
         * @brief Create all `capacity` servers, sequentially.
         *
         * All-or-nothing: if any factory call fails, the servers created so
         * far are disposed, the pool becomes Shutdown and
         * PoolInitializationError is thrown.
         * @throws PoolStateError if the pool is not Uninitialized.
         */
        boost::asio::awaitable<void> initialize() {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (state_ != PoolState::Uninitialized) {
                    throw PoolStateError("Pool '" + name_ +
                                         "': initialize() called in state " +
                                         to_string(state_));
                }
                state_ = PoolState::Initializing;
            }

            logger()->info("Pool '{}': initializing {} servers", name_,
                           capacity_);

            std::vector<server_ptr> created;
            created.reserve(capacity_);
            std::exception_ptr failure;
            std::string reason;
            std::size_t attempt = 0;

            while (created.size() < capacity_) {
                attempt = created.size() + 1;
                logger()->debug("Pool '{}': creating server {}/{}", name_,
                                attempt, capacity_);
                try {
                    server_ptr s = co_await factory_();
                    if (!s) {
                        throw std::runtime_error("factory returned no server");
                    }
                    if (std::find(created.begin(), created.end(), s) !=
                        created.end()) {
                        throw std::runtime_error(
                            "factory returned the same server twice");
                    }
                    metrics_.servers_created.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->debug("Pool '{}': created server '{}' ({}/{})",
                                    name_, s->name(), attempt, capacity_);
                    created.push_back(std::move(s));
                } catch (const std::exception& e) {
                    failure = std::current_exception();
                    reason = e.what();
                } catch (...) {
                    failure = std::current_exception();
                    reason = "unknown exception from server factory";
                }
                if (failure) break;

                if (state() == PoolState::Shutdown) {
                    reason = "shutdown requested during initialization";
                    failure = std::make_exception_ptr(PoolStateError(reason));
                    break;
                }
            }

            if (!failure) {
                std::lock_guard<std::mutex> lk(mu_);
                if (state_ == PoolState::Initializing) {
                    for (auto& s : created) {
                        tracked_.push_back(Tracked{s, false});
                        available_.push_back(s);
                    }
                    state_ = PoolState::Ready;
                    update_gauges_locked_();
                    check_invariants_locked_();
                } else {
                    reason = "shutdown requested during initialization";
                    failure = std::make_exception_ptr(PoolStateError(reason));
                }
            }

            if (!failure) {
                logger()->info("Pool '{}': initialization complete, {} servers "
                               "ready",
                               name_, capacity_);
                co_return;
            }

            logger()->error("Pool '{}': initialization failed at server {}/{}: "
                            "{}",
                            name_, attempt, capacity_, reason);
            logger()->warn("Pool '{}': cleaning up {} servers created before "
                           "the failure",
                           name_, created.size());

            for (auto& s : created) {
                co_await dispose_(std::move(s), "initialization rollback");
            }

            {
                std::lock_guard<std::mutex> lk(mu_);
                available_.clear();
                tracked_.clear();
                state_ = PoolState::Shutdown;
                update_gauges_locked_();
            }

            throw PoolInitializationError(name_, attempt, reason, failure);
        }

        /// @brief Take an idle server without waiting.
        /// @return nullopt when none is idle or the pool is not Ready.
        std::optional<server_ptr> try_acquire() {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ != PoolState::Ready) {
                metrics_.acquire_rejected.fetch_add(1,
                                                    std::memory_order_relaxed);
                return std::nullopt;
            }
            auto s = take_available_locked_();
            if (!s) return std::nullopt;
            metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
            return s;
        }

        /**
         * @brief Borrow a server, suspending until one is released if none
         * is idle.
         *
         * Waiters are served in the order they started waiting.
         * @param timeout Maximum time to wait; infinite by default.
         * @return The server, or InvalidState / Shutdown (pool not Ready),
         * Timeout, Cancelled.
         * @note The caller must release() the server exactly once.
         */
        boost::asio::awaitable<Result<server_ptr>> acquire(
            clock_type::duration timeout = clock_type::duration::max()) {
            auto life = lifetime_;
            std::shared_ptr<Waiter> w;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (state_ != PoolState::Ready) {
                    metrics_.acquire_rejected.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<server_ptr>::err(not_ready_error_locked_());
                }

                if (auto s = take_available_locked_()) {
                    metrics_.acquire_success.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->debug(
                        "Pool '{}': server '{}' acquired, {} available", name_,
                        s->name(), available_.size());
                    co_return Result<server_ptr>::ok(std::move(s));
                }

                w = std::make_shared<Waiter>(ex_);
                if (timeout == clock_type::duration::max()) {
                    w->timer.expires_at(clock_type::time_point::max());
                } else {
                    w->timer.expires_after(timeout);
                }
                waiters_.push_back(w);
                update_gauges_locked_();
            }

            logger()->debug("Pool '{}': no server available, waiting", name_);

            WaiterGuard guard(this, life, w);
            boost::system::error_code ec;
            co_await w->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            guard.dismiss();

            if (!life->alive.load(std::memory_order_acquire)) {
                co_return Result<server_ptr>::err(
                    Error::Code::Shutdown, "Pool destroyed while waiting");
            }

            std::lock_guard<std::mutex> lk(mu_);
            erase_waiter_locked_(w);

            // A server handed over just before shutdown was disposed by it.
            if (w->closed || state_ != PoolState::Ready) {
                co_return Result<server_ptr>::err(
                    Error::Code::Shutdown,
                    "Pool '" + name_ + "' shut down while waiting");
            }

            // cancel_waiters() already took back any server handed over.
            if (w->cancelled) {
                co_return Result<server_ptr>::err(
                    Error::Code::Cancelled,
                    "Pool '" + name_ + "': acquire cancelled");
            }

            if (w->server) {
                metrics_.acquire_success.fetch_add(1,
                                                   std::memory_order_relaxed);
                logger()->debug("Pool '{}': server '{}' handed to waiter",
                                name_, w->server->name());
                co_return Result<server_ptr>::ok(std::move(w->server));
            }

            if (ec == boost::asio::error::operation_aborted) {
                metrics_.acquire_cancelled.fetch_add(
                    1, std::memory_order_relaxed);
                co_return Result<server_ptr>::err(
                    Error::Code::Cancelled,
                    "Pool '" + name_ + "': acquire cancelled");
            }

            metrics_.acquire_timeout.fetch_add(1, std::memory_order_relaxed);
            logger()->warn("Pool '{}': acquire timed out, all {} servers busy",
                           name_, tracked_.size());
            co_return Result<server_ptr>::err(
                Error::Code::Timeout,
                "Pool '" + name_ +
                    "': no server became available within the timeout");
        }

        /// @brief acquire() wrapped in a Lease that releases on destruction.
        boost::asio::awaitable<Result<Lease>> lease(
            clock_type::duration timeout = clock_type::duration::max()) {
            auto r = co_await acquire(timeout);
            if (r.has_error()) {
                co_return Result<Lease>::err(std::move(r).error());
            }
            co_return Result<Lease>::ok(
                Lease(this, lifetime_, std::move(r).value()));
        }

        /**
         * @brief Return a borrowed server.
         *
         * healthy: back to the oldest waiter, or to the idle queue.
         * unhealthy: disposed and forgotten; no replacement is created.
         * Double release, release of a foreign server and release into a
         * full queue dispose the server and log a warning. Never throws.
         */
        boost::asio::awaitable<void> release(server_ptr server,
                                             bool healthy = true) {
            if (!server) {
                logger()->warn("Pool '{}': release() without a server, ignored",
                               name_);
                co_return;
            }

            server_ptr doomed;
            std::shared_ptr<Waiter> next;
            const char* why = nullptr;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (state_ != PoolState::Ready) {
                    logger()->warn(
                        "Pool '{}': release of server '{}' in state {}, "
                        "ignored",
                        name_, server->name(), to_string(state_));
                    co_return;
                }

                auto it = find_tracked_locked_(server.get());
                if (it == tracked_.end()) {
                    if (std::find(retired_.begin(), retired_.end(), server) !=
                        retired_.end()) {
                        logger()->warn(
                            "Pool '{}': server '{}' was already disposed, "
                            "release ignored",
                            name_, server->name());
                        co_return;
                    }
                    metrics_.release_anomaly.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->warn(
                        "Pool '{}': server '{}' does not belong to this pool, "
                        "disposing it",
                        name_, server->name());
                    doomed = std::move(server);
                    why = "foreign release";
                } else if (!it->lent) {
                    metrics_.release_anomaly.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->warn(
                        "Pool '{}': server '{}' released twice, disposing it",
                        name_, server->name());
                    available_.erase(std::remove(available_.begin(),
                                                 available_.end(), server),
                                     available_.end());
                    retire_locked_(it);
                    doomed = std::move(server);
                    why = "double release";
                } else if (!healthy) {
                    metrics_.release_unhealthy.fetch_add(
                        1, std::memory_order_relaxed);
                    retire_locked_(it);
                    logger()->warn(
                        "Pool '{}': server '{}' released unhealthy, disposing "
                        "it; capacity now {}/{}",
                        name_, server->name(), tracked_.size(), capacity_);
                    doomed = std::move(server);
                    why = "unhealthy release";
                } else if (available_.size() >= capacity_) {
                    metrics_.release_anomaly.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->error(
                        "Pool '{}': queue already full on release of '{}', "
                        "disposing it",
                        name_, server->name());
                    retire_locked_(it);
                    doomed = std::move(server);
                    why = "queue overflow";
                } else {
                    metrics_.release_healthy.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->debug("Pool '{}': server '{}' released", name_,
                                    server->name());
                    next = hand_over_locked_(std::move(server), false);
                }

                update_gauges_locked_();
                check_invariants_locked_();
            }

            if (next) wake_(*next);
            if (doomed) co_await dispose_(std::move(doomed), why);
        }

        /**
         * @brief End every parked acquire() with Cancelled; the pool stays
         * Ready.
         *
         * A server already handed to a waiter that has not resumed yet goes
         * back to the front of the idle queue.
         * @return Number of waiters cancelled.
         */
        std::size_t cancel_waiters() {
            std::list<std::shared_ptr<Waiter>> to_wake;
            {
                std::lock_guard<std::mutex> lk(mu_);
                to_wake.swap(waiters_);
                std::size_t reclaimed = 0;
                for (auto& w : to_wake) {
                    if (w->closed || w->cancelled) continue;
                    w->cancelled = true;
                    metrics_.acquire_cancelled.fetch_add(
                        1, std::memory_order_relaxed);
                    if (!w->server) continue;
                    hand_over_locked_(std::exchange(w->server, nullptr), true);
                    ++reclaimed;
                }
                update_gauges_locked_();
                check_invariants_locked_();
                if (!to_wake.empty()) {
                    logger()->info(
                        "Pool '{}': cancelled {} waiters, {} handed servers "
                        "reclaimed",
                        name_, to_wake.size(), reclaimed);
                }
            }

            for (auto& w : to_wake) wake_(*w);
            return to_wake.size();
        }

        /**
         * @brief Dispose every tracked server, lent or idle, and close the
         * pool for good.
         *
         * Does not wait for lent servers to come back. Pending waiters fail
         * with Shutdown. Each disposal failure is logged and the rest still
         * run. A second call is a no-op. Never throws.
         */
        boost::asio::awaitable<void> shutdown() {
            std::vector<server_ptr> doomed;
            std::list<std::shared_ptr<Waiter>> to_wake;
            {
                std::lock_guard<std::mutex> lk(mu_);
                switch (state_) {
                    case PoolState::Shutdown:
                        logger()->debug("Pool '{}': already shut down", name_);
                        co_return;
                    case PoolState::Uninitialized:
                    case PoolState::Initializing:
                        // initialize() notices and rolls back its own work
                        logger()->info("Pool '{}': shut down in state {}",
                                       name_, to_string(state_));
                        state_ = PoolState::Shutdown;
                        co_return;
                    case PoolState::Ready:
                        break;
                }

                state_ = PoolState::Shutdown;
                doomed.reserve(tracked_.size());
                for (auto& t : tracked_) doomed.push_back(std::move(t.server));
                tracked_.clear();
                available_.clear();
                to_wake.swap(waiters_);
                for (auto& w : to_wake) w->closed = true;
                update_gauges_locked_();
            }

            for (auto& w : to_wake) wake_(*w);

            logger()->info("Pool '{}': shutting down, disposing {} servers",
                           name_, doomed.size());
            for (auto& s : doomed) {
                co_await dispose_(std::move(s), "shutdown");
            }
            logger()->info("Pool '{}': shutdown complete", name_);
        }

        const std::string& name() const noexcept { return name_; }

        std::size_t capacity() const noexcept { return capacity_; }

        PoolState state() const {
            std::lock_guard<std::mutex> lk(mu_);
            return state_;
        }

        std::size_t available_count() const {
            std::lock_guard<std::mutex> lk(mu_);
            return available_.size();
        }

        std::size_t tracked_count() const {
            std::lock_guard<std::mutex> lk(mu_);
            return tracked_.size();
        }

        std::size_t waiting_count() const {
            std::lock_guard<std::mutex> lk(mu_);
            return waiters_.size();
        }

        const ServerPoolMetrics& metrics() const noexcept { return metrics_; }

        boost::asio::any_io_executor get_executor() const noexcept {
            return ex_;
        }

       private:
        struct Tracked {
            server_ptr server;
            bool lent{false};
        };

        /// @brief A coroutine parked in acquire()
        struct Waiter {
            explicit Waiter(boost::asio::any_io_executor ex) : timer(ex) {}

            boost::asio::steady_timer timer;
            server_ptr server;    ///< Set when a release hands one over
            bool closed{false};  ///< Pool shut down while waiting
            bool cancelled{false};
        };

        /// @brief Unregisters a waiter whose coroutine frame is destroyed
        /// while parked, passing on any server already handed to it.
        class WaiterGuard {
           public:
            WaiterGuard(BasicServerPool* pool, std::shared_ptr<Lifetime> life,
                        std::shared_ptr<Waiter> w)
                : pool_(pool), life_(std::move(life)), waiter_(std::move(w)) {}

            WaiterGuard(WaiterGuard const&) = delete;
            WaiterGuard& operator=(WaiterGuard const&) = delete;

            ~WaiterGuard() {
                if (pool_ && life_->alive.load(std::memory_order_acquire))
                    pool_->abandon_waiter_(waiter_);
            }

            void dismiss() noexcept { pool_ = nullptr; }

           private:
            BasicServerPool* pool_;
            std::shared_ptr<Lifetime> life_;
            std::shared_ptr<Waiter> waiter_;
        };

        using tracked_iterator = typename std::vector<Tracked>::iterator;

        /// @brief Linear scan; one entry per live server, capacity is small.
        tracked_iterator find_tracked_locked_(ServerT const* s) {
            return std::find_if(
                tracked_.begin(), tracked_.end(),
                [s](Tracked const& t) { return t.server.get() == s; });
        }

        /// @brief Forget a tracked server. Disposed servers are remembered
        /// so a late release is recognised; bounded by capacity.
        void retire_locked_(tracked_iterator it) {
            retired_.push_back(std::move(it->server));
            tracked_.erase(it);
        }

        server_ptr take_available_locked_() {
            if (available_.empty()) return nullptr;
            auto s = std::move(available_.front());
            available_.pop_front();
            auto it = find_tracked_locked_(s.get());
            assert(it != tracked_.end() && "available server is not tracked");
            if (it != tracked_.end()) it->lent = true;
            update_gauges_locked_();
            return s;
        }

        /// @brief Give a server to the oldest waiter, or park it in the
        /// idle queue. The waiter stays listed until it resumes.
        /// @return The waiter to wake, if any.
        std::shared_ptr<Waiter> hand_over_locked_(server_ptr s, bool front) {
            for (auto& w : waiters_) {
                if (w->server || w->closed || w->cancelled) continue;
                w->server = std::move(s);
                return w;
            }

            auto it = find_tracked_locked_(s.get());
            if (it != tracked_.end()) it->lent = false;
            if (front)
                available_.push_front(std::move(s));
            else
                available_.push_back(std::move(s));
            return nullptr;
        }

        void erase_waiter_locked_(std::shared_ptr<Waiter> const& w) {
            waiters_.remove(w);
            update_gauges_locked_();
        }

        void abandon_waiter_(std::shared_ptr<Waiter> const& w) noexcept {
            std::shared_ptr<Waiter> next;
            {
                std::lock_guard<std::mutex> lk(mu_);
                erase_waiter_locked_(w);
                if (!w->server) return;
                auto s = std::move(w->server);
                w->server.reset();
                if (state_ != PoolState::Ready) return;
                next = hand_over_locked_(std::move(s), true);
                update_gauges_locked_();
            }
            if (next) wake_(*next);
        }

        /// @brief Resume a parked waiter. Also effective if its wait has
        /// not been started yet: an expired timer completes immediately.
        static void wake_(Waiter& w) {
            w.timer.expires_at(clock_type::time_point::min());
        }

        void post_release_(server_ptr s, bool healthy) noexcept {
            try {
                boost::asio::co_spawn(
                    ex_,
                    release_if_alive_(this, lifetime_, std::move(s), healthy),
                    boost::asio::detached);
            } catch (const std::exception& e) {
                logger()->error("Pool '{}': could not schedule release: {}",
                                name_, e.what());
            }
        }

        static boost::asio::awaitable<void> release_if_alive_(
            BasicServerPool* pool, std::weak_ptr<Lifetime> life, server_ptr s,
            bool healthy) {
            auto st = life.lock();
            if (!st || !st->alive.load(std::memory_order_acquire)) co_return;
            co_await pool->release(std::move(s), healthy);
        }

        boost::asio::awaitable<void> dispose_(server_ptr s, const char* why) {
            const auto server_name = s->name();
            try {
                co_await s->dispose();
                metrics_.servers_disposed.fetch_add(1,
                                                    std::memory_order_relaxed);
                logger()->debug("Pool '{}': disposed server '{}' ({})", name_,
                                server_name, why);
            } catch (const std::exception& e) {
                metrics_.dispose_failures.fetch_add(1,
                                                    std::memory_order_relaxed);
                logger()->error("Pool '{}': error disposing server '{}' ({}): "
                                "{}",
                                name_, server_name, why, e.what());
            }
        }

        static boost::asio::awaitable<void> dispose_all_detached_(
            std::string pool_name, std::vector<server_ptr> servers) {
            for (auto& s : servers) {
                try {
                    co_await s->dispose();
                } catch (const std::exception& e) {
                    logger()->error("Pool '{}': error disposing server '{}': {}",
                                    pool_name, s->name(), e.what());
                }
            }
        }

        Error not_ready_error_locked_() const {
            if (state_ == PoolState::Shutdown) {
                return Error{Error::Code::Shutdown,
                             "Pool '" + name_ + "' is shut down"};
            }
            return Error{Error::Code::InvalidState,
                         "Pool '" + name_ + "' is not ready (state " +
                             to_string(state_) + ")"};
        }

        void update_gauges_locked_() {
            metrics_.available.store(available_.size(),
                                     std::memory_order_relaxed);
            metrics_.tracked.store(tracked_.size(), std::memory_order_relaxed);
            metrics_.waiters.store(waiters_.size(), std::memory_order_relaxed);
        }

        /// @brief Check internal invariants, only in debug builds
        void check_invariants_locked_() const {
#ifndef NDEBUG
            assert(available_.size() <= tracked_.size() &&
                   "more available than tracked");
            assert(tracked_.size() <= capacity_ && "tracked above capacity");
            for (auto const& s : available_) {
                auto it = std::find_if(
                    tracked_.begin(), tracked_.end(),
                    [&](Tracked const& t) { return t.server == s; });
                assert(it != tracked_.end() && "available server not tracked");
                assert(!it->lent && "available server marked lent");
                (void)it;
            }
#endif
        }

        boost::asio::any_io_executor ex_;  ///< Runs timers and deferred work
        std::string name_;
        std::size_t capacity_;
        factory_type factory_;

        mutable std::mutex mu_;  ///< Protects everything below
        PoolState state_{PoolState::Uninitialized};
        std::deque<server_ptr> available_;  ///< FIFO of idle servers
        std::vector<Tracked> tracked_;      ///< Idle and lent servers
        std::vector<server_ptr> retired_;   ///< Disposed by release()
        std::list<std::shared_ptr<Waiter>> waiters_;  ///< Oldest first

        std::shared_ptr<Lifetime> lifetime_;
        ServerPoolMetrics metrics_;
    };

}  // namespace toolbridge
