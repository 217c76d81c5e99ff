//
// PityTracker.cpp
//
#include "PityTracker.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

#include "Exception.hpp"

namespace cardroll::core
{
    PityTracker::Lease::Lease(PityTracker& owner, PlayerId player, std::shared_ptr<Entry> entry,
                              std::unique_lock<std::timed_mutex> lock) :
        owner_(&owner),
        player_(std::move(player)),
        entry_(std::move(entry)),
        lock_(std::move(lock))
    {
    }

    auto PityTracker::Lease::StateFor(PackType const& pack) const -> PityState
    {
        PityState s{.counter = 0, .threshold = pack.pity_threshold, .total_rolls = 0};
        auto const it = entry_->record.packs.find(pack.name);
        if (it != entry_->record.packs.end())
        {
            s.counter = it->second.counter;
            s.total_rolls = it->second.total_rolls;
        }
        // a stored threshold from an older configuration gives way to the current one
        s.counter = std::min(s.counter, s.threshold);
        return s;
    }

    auto PityTracker::Lease::ShouldForce(PackType const& pack) const -> bool
    {
        PityState const s = StateFor(pack);
        return s.counter + 1 >= s.threshold;
    }

    auto PityTracker::Lease::RecordResult(PackType const& pack, Rarity const achieved) -> PityState
    {
        CRL_ASSERT(lock_.owns_lock(), "RecordResult on a released lease");

        PityState s = StateFor(pack);
        s.counter = pack.Qualifies(achieved) ? 0u : std::min(s.counter + 1, s.threshold);
        ++s.total_rolls;

        entry_->record.packs.insert_or_assign(pack.name, s);
        entry_->dirty = true;
        return s;
    }

    auto PityTracker::Lease::Sequence() const -> std::uint64_t
    {
        return entry_->record.roll_sequence;
    }

    auto PityTracker::Lease::AdvanceSequence() -> void
    {
        ++entry_->record.roll_sequence;
        entry_->dirty = true;
    }

    auto PityTracker::Lease::Record() const -> PlayerPityRecord const&
    {
        return entry_->record;
    }

    auto PityTracker::Lease::Checkpoint() -> void
    {
        saved_record_ = entry_->record;
        saved_dirty_ = entry_->dirty;
    }

    auto PityTracker::Lease::Rollback() -> void
    {
        entry_->record = saved_record_;
        entry_->dirty = saved_dirty_;
    }

    auto PityTracker::Lease::Commit(Deadline const deadline) -> std::expected<void, StoreFailure>
    {
        CRL_ASSERT(lock_.owns_lock(), "Commit on a released lease");
        if (!entry_->dirty) return {};

        auto saved = owner_->store_->Save(player_, entry_->record, deadline);
        if (!saved.has_value())
        {
            owner_->NotifyDirty(player_);
            return saved;
        }
        entry_->dirty = false;
        return {};
    }

    PityTracker::PityTracker(std::shared_ptr<PityStore> store, std::size_t const shard_count) :
        store_(std::move(store))
    {
        CRL_ASSERT(store_ != nullptr, "PityTracker requires a store");
        std::size_t const n = std::max<std::size_t>(shard_count, 1);
        shards_.reserve(n);
        for (std::size_t i{}; i < n; ++i)
        {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    auto PityTracker::SetDirtyListener(DirtyListener listener) -> void
    {
        std::lock_guard<std::mutex> lock(listener_mtx_);
        listener_ = std::move(listener);
    }

    auto PityTracker::NotifyDirty(PlayerId const& player) -> void
    {
        // held across the call so SetDirtyListener() cannot return while a
        // notification into the previous listener is still running
        std::lock_guard<std::mutex> lock(listener_mtx_);
        if (listener_) listener_(player);
    }

    auto PityTracker::EntryFor(PlayerId const& player) -> std::shared_ptr<Entry>
    {
        Shard& shard = *shards_[std::hash<PlayerId>{}(player) % shards_.size()];
        std::lock_guard<std::mutex> lock(shard.mtx);
        std::shared_ptr<Entry>& slot = shard.entries[player];
        if (!slot) slot = std::make_shared<Entry>();
        return slot;
    }

    auto PityTracker::Acquire(PlayerId const& player, Deadline const deadline) -> Lease
    {
        std::shared_ptr<Entry> entry = EntryFor(player);

        std::unique_lock<std::timed_mutex> lock(entry->mtx, std::defer_lock);
        if (!lock.try_lock_until(deadline))
            CRL_THROW(error::Code::Transient,
                      std::format("Timed out waiting for the pity state of player '{}'", player));

        if (!entry->loaded)
        {
            auto loaded = store_->Load(player, deadline);
            if (!loaded.has_value())
                CRL_THROW(error::Code::Transient,
                          std::format("Loading pity state for '{}' failed ({}): {}", player,
                                      to_string(loaded.error().kind), loaded.error().message));
            entry->record = std::move(*loaded);
            entry->loaded = true;
        }

        return Lease(*this, player, std::move(entry), std::move(lock));
    }

    auto PityTracker::ShouldForce(PlayerId const& player, PackType const& pack, Deadline const deadline) -> bool
    {
        Lease const lease = Acquire(player, deadline);
        return lease.ShouldForce(pack);
    }

    auto PityTracker::RecordResult(PlayerId const& player, PackType const& pack, Rarity const achieved,
                                   Deadline const deadline) -> PityState
    {
        Lease lease = Acquire(player, deadline);
        PityState const s = lease.RecordResult(pack, achieved);
        if (auto const saved = lease.Commit(deadline); !saved.has_value())
        {
            std::print(stderr, "[PityTracker] save for '{}' failed ({}): {}\n", player,
                       to_string(saved.error().kind), saved.error().message);
        }
        return s;
    }

    auto PityTracker::Snapshot(PlayerId const& player, Deadline const deadline) -> PlayerPityRecord
    {
        Lease const lease = Acquire(player, deadline);
        return lease.Record();
    }

    auto PityTracker::Flush(PlayerId const& player, Deadline const deadline) -> std::expected<void, StoreFailure>
    {
        std::shared_ptr<Entry> entry = EntryFor(player);
        std::unique_lock<std::timed_mutex> lock(entry->mtx, std::defer_lock);
        if (!lock.try_lock_until(deadline))
            return std::unexpected(StoreFailure{StoreFailureKind::Timeout, "player section busy"});

        if (!entry->loaded || !entry->dirty) return {};

        auto saved = store_->Save(player, entry->record, deadline);
        if (saved.has_value()) entry->dirty = false;
        return saved;
    }
}
