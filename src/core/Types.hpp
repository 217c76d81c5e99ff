//
// Types.hpp
//

#ifndef CARDROLL_TYPES_HPP
#define CARDROLL_TYPES_HPP

#define CRL_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cardroll::core::constants
{
    inline constexpr std::size_t RarityCount = 7;
    inline constexpr std::size_t DefaultMaxDeckSize = 30;
    inline constexpr std::size_t DefaultMinDeckSize = 1;
    inline constexpr double WeightTolerance = 1e-6;
    inline constexpr std::size_t MaxPlayerIdLength = 256;
}

namespace cardroll::core
{
    // Ordered: comparisons between tiers are meaningful.
    enum class Rarity : std::uint8_t
    {
        Common = 0,
        Uncommon,
        Rare,
        Epic,
        Legendary,
        Mythic,
        Cosmic
    };

    enum class CardType : std::uint8_t
    {
        Creature = 0,
        Spell,
        Artifact
    };

    inline constexpr std::array<Rarity, constants::RarityCount> AllRarities{
        Rarity::Common, Rarity::Uncommon, Rarity::Rare, Rarity::Epic,
        Rarity::Legendary, Rarity::Mythic, Rarity::Cosmic
    };

    struct Card
    {
        std::string id;
        std::string name;
        Rarity rarity{Rarity::Common};
        CardType type{CardType::Creature};
        std::uint32_t cost{};
        std::int32_t attack{};
        std::int32_t defense{};
        std::int32_t health{};
        std::vector<std::string> effects;
        std::vector<std::string> tags; // sorted, unique
        std::string emoji;
        std::string flavor;

        [[nodiscard]]
        auto HasTag(std::string_view tag) const -> bool;
    };

    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;

    using PlayerId = std::string;
    using Clock = std::chrono::steady_clock;
    using Deadline = Clock::time_point;

    // Rarity tables are indexed common..cosmic.
    template <typename T>
    using PerRarity = std::array<T, constants::RarityCount>;

    inline constexpr auto Index(Rarity r) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(r);
    }

    auto ToString(Rarity r) noexcept -> std::string_view;
    auto ToString(CardType t) noexcept -> std::string_view;
    auto ParseRarity(std::string_view s) -> std::optional<Rarity>;
    auto ParseCardType(std::string_view s) -> std::optional<CardType>;

    // Worth of a single card of the tier, used for roll summaries.
    auto RarityValue(Rarity r) noexcept -> std::uint32_t;
}

#endif //CARDROLL_TYPES_HPP
