//
// Reconciler.hpp
//

#ifndef CARDROLL_RECONCILER_HPP
#define CARDROLL_RECONCILER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

#include "PityTracker.hpp"
#include "Types.hpp"

namespace cardroll::core
{
    struct ReconcilerSettings
    {
        std::uint32_t max_attempts{5};
        std::chrono::milliseconds backoff{200};      // multiplied by the attempt number
        std::chrono::milliseconds save_timeout{500};
    };

    // Retries pity saves that failed after a roll was already handed out.
    // Registers itself as the tracker's dirty listener; one worker thread.
    class Reconciler
    {
    public:
        Reconciler(std::shared_ptr<PityTracker> tracker, ReconcilerSettings settings);
        ~Reconciler();

        Reconciler(Reconciler const&) = delete;
        auto operator=(Reconciler const&) -> Reconciler& = delete;

        // Queues the player unless already queued. A player whose save is in
        // flight is queued again once that save returns.
        auto Schedule(PlayerId const& player) -> void;

        [[nodiscard]]
        auto Pending() const -> std::size_t;

        // Players whose retries ran out; operators reconcile these by hand.
        [[nodiscard]]
        auto Exhausted() const noexcept -> std::uint64_t { return exhausted_.load(); }

        [[nodiscard]]
        auto Recovered() const noexcept -> std::uint64_t { return recovered_.load(); }

        // Waits until nothing is queued or the timeout passes; true when idle.
        auto WaitIdle(std::chrono::milliseconds timeout) -> bool;

    private:
        struct Job
        {
            PlayerId player;
            std::uint32_t attempts{};
            Clock::time_point not_before{};
        };

        auto Run() -> void;

        std::shared_ptr<PityTracker> tracker_;
        ReconcilerSettings settings_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::deque<Job> jobs_;
        std::unordered_set<PlayerId> queued_;
        std::optional<PlayerId> in_flight_;
        bool rescheduled_{false}; // Schedule() hit the in-flight player
        std::uint64_t generation_{0}; // bumped per new job, wakes a backoff wait
        bool stop_{false};

        std::atomic<std::uint64_t> exhausted_{0};
        std::atomic<std::uint64_t> recovered_{0};

        std::thread worker_;
    };
}

#endif //CARDROLL_RECONCILER_HPP
