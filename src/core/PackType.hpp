//
// PackType.hpp
//

#ifndef CARDROLL_PACKTYPE_HPP
#define CARDROLL_PACKTYPE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "Types.hpp"

namespace cardroll::core
{
    // Which catalog cards a pack may hand out. Empty lists do not restrict.
    struct PoolFilter
    {
        std::vector<CardType> types;
        std::vector<std::string> tags; // card needs at least one of these

        [[nodiscard]]
        auto Admits(Card const& c) const -> bool;
    };

    struct PackType
    {
        std::string name;
        std::uint32_t max_batch{1};
        PerRarity<double> weights{};
        PoolFilter pool{};
        Rarity qualifying_rarity{Rarity::Epic};
        std::uint32_t pity_threshold{1};
        double bonus_multiplier{1.0}; // scales the value of everything rolled from the pack

        [[nodiscard]]
        auto Qualifies(Rarity r) const noexcept -> bool { return r >= qualifying_rarity; }
    };
}

#endif //CARDROLL_PACKTYPE_HPP
