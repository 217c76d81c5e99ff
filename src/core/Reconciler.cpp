//
// Reconciler.cpp
//
#include "Reconciler.hpp"

#include <algorithm>
#include <print>
#include <utility>

#include "Exception.hpp"

namespace cardroll::core
{
    Reconciler::Reconciler(std::shared_ptr<PityTracker> tracker, ReconcilerSettings const settings) :
        tracker_(std::move(tracker)),
        settings_(settings)
    {
        CRL_ASSERT(tracker_ != nullptr, "Reconciler requires a tracker");
        CRL_ASSERT(settings_.max_attempts > 0, "Reconciler needs at least one attempt");

        worker_ = std::thread([this]() { Run(); });
        tracker_->SetDirtyListener([this](PlayerId const& player) { Schedule(player); });
    }

    Reconciler::~Reconciler()
    {
        // returns only once no listener call into this object is running
        tracker_->SetDirtyListener({});
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stop_ = true;
            if (!jobs_.empty())
            {
                std::print(stderr, "[Reconciler] stopping with {} unsaved player record(s)\n", jobs_.size());
            }
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    auto Reconciler::Schedule(PlayerId const& player) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) return;
            if (!queued_.insert(player).second)
            {
                if (in_flight_ == player) rescheduled_ = true;
                return;
            }
            jobs_.push_back(Job{.player = player, .attempts = 0, .not_before = Clock::now()});
            ++generation_;
        }
        std::print(stderr, "[Reconciler] pity save pending for '{}'\n", player);
        cv_.notify_all();
    }

    auto Reconciler::Pending() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return jobs_.size() + (in_flight_.has_value() ? 1u : 0u);
    }

    auto Reconciler::WaitIdle(std::chrono::milliseconds const timeout) -> bool
    {
        std::unique_lock<std::mutex> lock(mtx_);
        return idle_cv_.wait_for(lock, timeout, [this]() { return jobs_.empty() && !in_flight_.has_value(); });
    }

    auto Reconciler::Run() -> void
    {
        std::unique_lock<std::mutex> lock(mtx_);
        while (true)
        {
            cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
            if (stop_) break;

            auto const next = std::ranges::min_element(jobs_, {}, &Job::not_before);
            if (next->not_before > Clock::now())
            {
                Clock::time_point const wake = next->not_before;
                std::uint64_t const seen = generation_;
                cv_.wait_until(lock, wake, [this, seen]() { return stop_ || generation_ != seen; });
                continue;
            }

            Job job = std::move(*next);
            jobs_.erase(next);
            in_flight_ = job.player;
            rescheduled_ = false;
            lock.unlock();

            auto const flushed = tracker_->Flush(job.player, Clock::now() + settings_.save_timeout);

            lock.lock();
            in_flight_.reset();
            ++job.attempts;

            if (flushed.has_value() || job.attempts >= settings_.max_attempts)
            {
                if (flushed.has_value())
                {
                    ++recovered_;
                    std::print("[Reconciler] pity state for '{}' saved after {} attempt(s)\n",
                               job.player, job.attempts);
                }
                else
                {
                    ++exhausted_;
                    std::print(stderr, "[Reconciler] giving up on '{}' after {} attempt(s): {} ({})\n",
                               job.player, job.attempts, flushed.error().message,
                               to_string(flushed.error().kind));
                }

                if (rescheduled_)
                {
                    // a newer save failed while this one ran; it gets its own attempts
                    jobs_.push_back(Job{.player = std::move(job.player), .attempts = 0, .not_before = Clock::now()});
                }
                else
                {
                    queued_.erase(job.player);
                }
            }
            else
            {
                job.not_before = Clock::now() + settings_.backoff * job.attempts;
                jobs_.push_back(std::move(job));
            }

            rescheduled_ = false;
            if (jobs_.empty()) idle_cv_.notify_all();
        }
    }
}
