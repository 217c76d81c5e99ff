//
// Random.hpp
//

#ifndef CARDROLL_RANDOM_HPP
#define CARDROLL_RANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>

#include "Types.hpp"

namespace cardroll::core
{
    // Source of randomness handed to the samplers. Never shared between threads.
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        // Uniform in [0, 1).
        virtual auto NextUnit() -> double = 0;

        // Uniform in [0, bound). bound must be > 0.
        virtual auto NextIndex(std::size_t bound) -> std::size_t = 0;
    };

    class SeededRandomSource final : public RandomSource
    {
    public:
        explicit SeededRandomSource(std::uint64_t seed);

        auto NextUnit() -> double override;
        auto NextIndex(std::size_t bound) -> std::size_t override;

    private:
        std::mt19937_64 rng_;
    };

    // Produces the source for one roll request: (player, request sequence number).
    using RandomSourceFactory =
        std::function<std::unique_ptr<RandomSource>(PlayerId const&, std::uint64_t sequence)>;

    // Stable 64-bit mix of the engine seed, player id and sequence number.
    auto MixSeed(std::uint64_t seed, PlayerId const& player, std::uint64_t sequence) noexcept -> std::uint64_t;

    auto MakeSeededFactory(std::uint64_t seed) -> RandomSourceFactory;
}

#endif //CARDROLL_RANDOM_HPP
