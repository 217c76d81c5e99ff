//
// RarityDistribution.hpp
//

#ifndef CARDROLL_RARITYDISTRIBUTION_HPP
#define CARDROLL_RARITYDISTRIBUTION_HPP

#include "PackType.hpp"
#include "Random.hpp"
#include "Types.hpp"

namespace cardroll::core
{
    // Weighted rarity selection by cumulative-weight inversion. The table is
    // validated once on construction; Sample() only consumes the random source.
    class RarityDistribution
    {
    public:
        // Throws ConfigurationError when a weight is negative or not finite, or
        // when the weights do not sum to 1 within constants::WeightTolerance.
        explicit RarityDistribution(PerRarity<double> const& weights);
        explicit RarityDistribution(PackType const& pack);

        [[nodiscard]]
        auto Sample(RandomSource& rng) const -> Rarity;

        [[nodiscard]]
        auto Weight(Rarity r) const noexcept -> double { return weights_[Index(r)]; }

        [[nodiscard]]
        auto Reachable(Rarity r) const noexcept -> bool { return weights_[Index(r)] > 0.0; }

    private:
        PerRarity<double> weights_{};
        PerRarity<double> cumulative_{};
        Rarity top_{Rarity::Common}; // highest tier with non-zero weight
    };
}

#endif //CARDROLL_RARITYDISTRIBUTION_HPP
