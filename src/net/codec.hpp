//
// codec.hpp
//

#ifndef CARDROLL_CODEC_HPP
#define CARDROLL_CODEC_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/CardCatalog.hpp"
#include "core/DeckValidator.hpp"
#include "core/Exception.hpp"
#include "core/PityStore.hpp"
#include "core/RollEngine.hpp"

namespace cardroll::core::net
{
    // Body could not be read as the expected request shape.
    struct ParseError
    {
        std::string message;
    };

    struct RollRequest
    {
        std::string pack_type{"basic"};
        std::int64_t count{1};
    };

    // Exactly one of the two is set.
    struct DeckRequest
    {
        std::optional<std::vector<std::string>> cards;
        std::optional<std::string> deck_id;
    };

    // GET /cards filters and paging.
    struct CardListRequest
    {
        CardQuery query;
        std::uint32_t page{1};
        std::uint32_t limit{20};
    };

    inline constexpr std::uint32_t MaxPageSize = 100;

    using QueryParams = std::map<std::string, std::string, std::less<>>;

    // --- Inbound decode ---

    // "%xx" escapes and '+' decoded; a malformed escape is a ParseError.
    auto PercentDecode(std::string_view s) -> std::expected<std::string, ParseError>;

    // "a=1&b=two"; later duplicates win.
    auto ParseQuery(std::string_view query) -> std::expected<QueryParams, ParseError>;

    // rarity, type, search, tags (comma separated), page (>= 1), limit (1..100).
    auto DecodeCardListRequest(QueryParams const& params) -> std::expected<CardListRequest, ParseError>;

    // Optional positive integer parameter capped at max; fallback when absent.
    auto DecodeLimit(QueryParams const& params, std::uint32_t fallback, std::uint32_t max)
        -> std::expected<std::uint32_t, ParseError>;

    // Missing fields take the defaults above; range checks are left to the engine.
    auto DecodeRollRequest(std::string_view body) -> std::expected<RollRequest, ParseError>;

    auto DecodeDeckRequest(std::string_view body) -> std::expected<DeckRequest, ParseError>;

    // --- Outbound builders ---

    auto BuildCard(Card const& c) -> nlohmann::json;

    // Paged listing with total, totalPages, hasNext and hasPrev.
    auto BuildCardPage(std::vector<CCardSP> const& matches, std::uint32_t page, std::uint32_t limit)
        -> nlohmann::json;

    auto BuildCardList(std::vector<CCardSP> const& cards) -> nlohmann::json;

    // total, byRarity, byType
    auto BuildCardStats(CardCatalog const& catalog) -> nlohmann::json;

    auto BuildTags(std::vector<TagCount> const& tags) -> nlohmann::json;

    auto BuildRollResponse(RollResult const& r) -> nlohmann::json;

    auto BuildDeckResponse(error::ValidateResult const& v, DeckStats const& stats) -> nlohmann::json;

    auto BuildError(std::string_view kind, std::string_view message) -> nlohmann::json;

    // Per pack: current counter, threshold, fill percentage, lifetime slots.
    auto BuildPityInfo(PlayerPityRecord const& record, CardCatalog const& catalog) -> nlohmann::json;

    auto BuildPacks(CardCatalog const& catalog) -> nlohmann::json;

    [[nodiscard]]
    auto PersistenceName(PersistenceStatus s) noexcept -> std::string_view;
}

#endif //CARDROLL_CODEC_HPP
