//
// Invariants.hpp
//

#ifndef CARDROLL_INVARIANTS_HPP
#define CARDROLL_INVARIANTS_HPP

#include <format>
#include <optional>
#include <string>

#include "core/CardCatalog.hpp"
#include "core/PityTracker.hpp"
#include "Inspector.hpp"

namespace cardroll::core::debug
{
    // Second layer of checks over catalog and tracker state, for tests and soak
    // runs. Returns the first broken invariant, or nullopt.
    inline auto CheckInvariants(CardCatalog const& c) -> std::optional<std::string>
    {
#if CRL_ENABLE_TEST_HOOKS == false
        (void)c;
        return std::nullopt;
#else
        Inspector::CatalogView const v = Inspector::Gather(c);

        for (Inspector::PackView const& p : v.packs)
        {
            // 1) every tier the sampler can return has cards behind it
            for (Rarity const r : AllRarities)
            {
                if (p.distribution->Reachable(r) && p.pool_sizes[Index(r)] == 0)
                    return std::format("pack '{}' can roll {} but its pool is empty", p.pack->name, ToString(r));
            }

            // 2) a forced slot always has a card to land on
            if (p.pool_sizes[Index(p.pack->qualifying_rarity)] == 0)
                return std::format("pack '{}' has no {} cards to force", p.pack->name,
                                   ToString(p.pack->qualifying_rarity));

            if (p.pack->pity_threshold == 0 || p.pack->max_batch == 0)
                return std::format("pack '{}' has a zero threshold or batch size", p.pack->name);
        }
        return std::nullopt;
#endif
    }

    inline auto CheckInvariants(PityTracker& t, CardCatalog const& c) -> std::optional<std::string>
    {
#if CRL_ENABLE_TEST_HOOKS == false
        (void)t;
        (void)c;
        return std::nullopt;
#else
        Inspector::TrackerView const v = Inspector::Gather(t);

        for (Inspector::PlayerView const& p : v.players)
        {
            if (!p.loaded && !p.record.packs.empty())
                return std::format("player '{}' has state that was never loaded", p.player);

            for (auto const& [name, s] : p.record.packs)
            {
                // 3) counter stays in [0, threshold]
                if (s.counter > s.threshold)
                    return std::format("player '{}' pack '{}': counter {} above threshold {}", p.player, name,
                                       s.counter, s.threshold);

                // 4) the counter only counts slots that were actually rolled
                if (s.counter > s.total_rolls)
                    return std::format("player '{}' pack '{}': counter {} above total rolls {}", p.player, name,
                                       s.counter, s.total_rolls);

                // 5) the guarantee fires before the counter can reach the threshold
                if (PackType const* pack = c.FindPack(name); pack && s.counter >= pack->pity_threshold)
                    return std::format("player '{}' pack '{}': counter {} reached threshold {} without a forced slot",
                                       p.player, name, s.counter, pack->pity_threshold);
            }

            // 6) a slot was recorded for every committed request
            std::uint64_t total{};
            for (auto const& [name, s] : p.record.packs) total += s.total_rolls;
            if (total < p.record.roll_sequence)
                return std::format("player '{}': {} requests but only {} slots", p.player,
                                   p.record.roll_sequence, total);
        }
        return std::nullopt;
#endif
    }
}

#endif //CARDROLL_INVARIANTS_HPP
