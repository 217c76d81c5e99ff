//
// Random.cpp
//
#include "Random.hpp"

#include "Exception.hpp"
#include "Util.hpp"

namespace cardroll::core
{
    SeededRandomSource::SeededRandomSource(std::uint64_t const seed) :
        rng_(seed)
    {
    }

    auto SeededRandomSource::NextUnit() -> double
    {
        // top 53 bits -> exactly representable doubles in [0,1)
        return static_cast<double>(rng_() >> 11) * 0x1.0p-53;
    }

    auto SeededRandomSource::NextIndex(std::size_t const bound) -> std::size_t
    {
        CRL_ASSERT(bound > 0, "NextIndex called with an empty range");
        return std::uniform_int_distribution<std::size_t>{0, bound - 1}(rng_);
    }

    static constexpr auto SplitMix(std::uint64_t x) noexcept -> std::uint64_t
    {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

    auto MixSeed(std::uint64_t const seed, PlayerId const& player, std::uint64_t const sequence) noexcept
        -> std::uint64_t
    {
        return SplitMix(SplitMix(seed ^ util::Fnv1a(player)) ^ sequence);
    }

    auto MakeSeededFactory(std::uint64_t const seed) -> RandomSourceFactory
    {
        return [seed](PlayerId const& player, std::uint64_t const sequence) -> std::unique_ptr<RandomSource>
        {
            return std::make_unique<SeededRandomSource>(MixSeed(seed, player, sequence));
        };
    }
}
