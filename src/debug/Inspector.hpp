//
// Inspector.hpp
//

#ifndef CARDROLL_INSPECTOR_HPP
#define CARDROLL_INSPECTOR_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/CardCatalog.hpp"
#include "core/PityTracker.hpp"
#include "core/Types.hpp"

namespace cardroll::core::debug
{
    struct Inspector
    {
        struct PlayerView
        {
            PlayerId player;
            bool loaded{};
            bool dirty{};
            PlayerPityRecord record;
        };

        struct TrackerView
        {
            std::size_t shard_count{};
            std::vector<PlayerView> players; // sorted by player id
        };

        struct PackView
        {
            PackType const* pack{};
            RarityDistribution const* distribution{};
            PerRarity<std::size_t> pool_sizes{};
        };

        struct CatalogView
        {
            std::size_t cards{};
            PerRarity<std::size_t> by_rarity{};
            std::vector<PackView> packs;
        };

        // Takes every player's section in turn; do not call while holding a lease.
        static inline auto Gather(PityTracker& t) -> TrackerView
        {
            TrackerView ret{};
            ret.shard_count = t.shards_.size();

            for (auto const& shard : t.shards_)
            {
                std::vector<std::pair<PlayerId, std::shared_ptr<PityTracker::Entry>>> entries;
                {
                    std::lock_guard<std::mutex> lock(shard->mtx);
                    entries.assign(shard->entries.begin(), shard->entries.end());
                }
                for (auto const& [player, entry] : entries)
                {
                    std::lock_guard<std::timed_mutex> lock(entry->mtx);
                    ret.players.push_back(PlayerView{
                        .player = player,
                        .loaded = entry->loaded,
                        .dirty = entry->dirty,
                        .record = entry->record
                    });
                }
            }

            std::ranges::sort(ret.players, {}, &PlayerView::player);
            return ret;
        }

        static inline auto Gather(CardCatalog const& c) -> CatalogView
        {
            CatalogView ret{};
            ret.cards = c.cards_.size();
            for (Rarity const r : AllRarities)
            {
                ret.by_rarity[Index(r)] = c.by_rarity_[Index(r)].size();
            }

            for (auto const& [name, entry] : c.packs_)
            {
                PackView v{.pack = &entry.pack, .distribution = &entry.distribution};
                for (Rarity const r : AllRarities)
                {
                    v.pool_sizes[Index(r)] = entry.pools[Index(r)].size();
                }
                ret.packs.push_back(v);
            }
            return ret;
        }
    };
}

#endif //CARDROLL_INSPECTOR_HPP
