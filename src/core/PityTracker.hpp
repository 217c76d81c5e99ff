//
// PityTracker.hpp
//

#ifndef CARDROLL_PITYTRACKER_HPP
#define CARDROLL_PITYTRACKER_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "PackType.hpp"
#include "PityStore.hpp"
#include "Types.hpp"

namespace cardroll::core::debug { struct Inspector; }

namespace cardroll::core
{
    // Per-player pity cache over a PityStore. Each player has its own exclusive
    // section; players never wait on each other. A player's record is loaded on
    // first access and cached for the life of the process.
    class PityTracker
    {
        struct Entry;

    public:
        // Called with the player id whenever a save fails and the cached record
        // is left ahead of the store.
        using DirtyListener = std::function<void(PlayerId const&)>;

        // Exclusive hold on one player's pity record. Everything done through a
        // lease is invisible to other requests for the same player until the
        // lease is released.
        class Lease
        {
        public:
            Lease(Lease&&) noexcept = default;
            auto operator=(Lease&&) noexcept -> Lease& = default;
            Lease(Lease const&) = delete;
            auto operator=(Lease const&) -> Lease& = delete;

            [[nodiscard]]
            auto Player() const noexcept -> PlayerId const& { return player_; }

            // State for the pack, reconciled with the pack's current threshold.
            [[nodiscard]]
            auto StateFor(PackType const& pack) const -> PityState;

            // True when the next slot must be upgraded: counter >= threshold - 1.
            [[nodiscard]]
            auto ShouldForce(PackType const& pack) const -> bool;

            // Reset on a qualifying result, otherwise increment. Returns the new state.
            auto RecordResult(PackType const& pack, Rarity achieved) -> PityState;

            [[nodiscard]]
            auto Sequence() const -> std::uint64_t;
            auto AdvanceSequence() -> void;

            [[nodiscard]]
            auto Record() const -> PlayerPityRecord const&;

            // Undo everything recorded since the last Checkpoint().
            auto Checkpoint() -> void;
            auto Rollback() -> void;

            // Saves the record if it changed. On failure the record stays cached
            // and dirty and the tracker's DirtyListener is notified.
            auto Commit(Deadline deadline) -> std::expected<void, StoreFailure>;

        private:
            friend class PityTracker;
            Lease(PityTracker& owner, PlayerId player, std::shared_ptr<Entry> entry,
                  std::unique_lock<std::timed_mutex> lock);

            PityTracker* owner_;
            PlayerId player_;
            std::shared_ptr<Entry> entry_;
            std::unique_lock<std::timed_mutex> lock_;
            PlayerPityRecord saved_record_{};
            bool saved_dirty_{false};
        };

        explicit PityTracker(std::shared_ptr<PityStore> store, std::size_t shard_count = 64);

        // Blocks until any running notification has returned, so an owner can
        // clear its listener in its destructor. Listeners must not call back
        // into SetDirtyListener.
        auto SetDirtyListener(DirtyListener listener) -> void;

        // Blocks until the player's section is free (or the deadline passes) and
        // loads the record on first use. Throws TransientError on a busy timeout
        // or a failed load.
        [[nodiscard]]
        auto Acquire(PlayerId const& player, Deadline deadline) -> Lease;

        [[nodiscard]]
        auto ShouldForce(PlayerId const& player, PackType const& pack, Deadline deadline) -> bool;

        // Records and saves in one exclusive section.
        auto RecordResult(PlayerId const& player, PackType const& pack, Rarity achieved, Deadline deadline)
            -> PityState;

        [[nodiscard]]
        auto Snapshot(PlayerId const& player, Deadline deadline) -> PlayerPityRecord;

        // Re-saves a record left dirty by a failed save. No-op when clean.
        auto Flush(PlayerId const& player, Deadline deadline) -> std::expected<void, StoreFailure>;

        friend struct debug::Inspector;

    private:
        struct Entry
        {
            std::timed_mutex mtx;
            bool loaded{false};
            bool dirty{false};
            PlayerPityRecord record;
        };

        struct Shard
        {
            std::mutex mtx;
            std::unordered_map<PlayerId, std::shared_ptr<Entry>> entries;
        };

        auto EntryFor(PlayerId const& player) -> std::shared_ptr<Entry>;
        auto NotifyDirty(PlayerId const& player) -> void;

        std::shared_ptr<PityStore> store_;
        std::vector<std::unique_ptr<Shard>> shards_;

        std::mutex listener_mtx_;
        DirtyListener listener_;
    };
}

#endif //CARDROLL_PITYTRACKER_HPP
