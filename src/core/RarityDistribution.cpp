//
// RarityDistribution.cpp
//
#include "RarityDistribution.hpp"

#include <cmath>
#include <format>

#include "Exception.hpp"

namespace cardroll::core
{
    RarityDistribution::RarityDistribution(PerRarity<double> const& weights) :
        weights_(weights)
    {
        double sum = 0.0;
        for (Rarity const r : AllRarities)
        {
            double const w = weights_[Index(r)];
            if (!std::isfinite(w) || w < 0.0)
                CRL_THROW(error::Code::Configuration,
                          std::format("Weight for {} must be a non-negative number, got {}", ToString(r), w));
            sum += w;
            cumulative_[Index(r)] = sum;
            if (w > 0.0) top_ = r;
        }

        if (std::fabs(sum - 1.0) > constants::WeightTolerance)
            CRL_THROW(error::Code::Configuration,
                      std::format("Rarity weights sum to {}, expected 1", sum));
    }

    RarityDistribution::RarityDistribution(PackType const& pack) :
        RarityDistribution(pack.weights)
    {
    }

    auto RarityDistribution::Sample(RandomSource& rng) const -> Rarity
    {
        double const u = rng.NextUnit();
        for (Rarity const r : AllRarities)
        {
            // zero-weight tiers share the previous cumulative value and never win
            if (weights_[Index(r)] > 0.0 && u < cumulative_[Index(r)]) return r;
        }
        // u landed in the rounding gap above the final cumulative weight
        return top_;
    }
}
