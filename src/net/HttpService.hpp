//
// HttpService.hpp
//

#ifndef CARDROLL_HTTPSERVICE_HPP
#define CARDROLL_HTTPSERVICE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/DeckValidator.hpp"
#include "core/RollEngine.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"

namespace cardroll::core::net
{
    // Transport-neutral request: the server fills it from a websocketpp
    // connection, tests build it directly.
    struct HttpRequest
    {
        std::string method;
        std::string path;
        std::string query;              // after '?', still percent-encoded
        std::optional<PlayerId> player; // X-Player-Id, set by the gateway
        std::string body;
    };

    struct HttpResponse
    {
        int status{200};
        std::string body;
    };

    inline constexpr std::string_view PlayerHeader = "X-Player-Id";

    // Routes requests to the engine and maps the error taxonomy onto status
    // codes. Also keeps each player's collection (fed by rolls) and active deck,
    // which the deck endpoints validate against. Safe to call from many threads.
    class HttpService
    {
    public:
        HttpService(std::shared_ptr<RollEngine> engine,
                    DeckRules rules,
                    std::chrono::milliseconds request_timeout,
                    std::shared_ptr<debug::AuditLogger> audit = nullptr);

        auto Handle(HttpRequest const& req) -> HttpResponse;

        [[nodiscard]]
        auto Collection(PlayerId const& player) const -> OwnedCollection;

        [[nodiscard]]
        auto ActiveDeck(PlayerId const& player) const -> std::optional<Deck>;

        // Adds cards outside of a roll (tests, admin grants).
        auto Grant(PlayerId const& player, std::string const& card_id, std::uint32_t copies) -> void;

    private:
        enum class Route
        {
            Roll,
            Pity,
            Packs,
            CardList,
            CardStats,
            CardTags,
            CardSearch,
            CardById,
            ValidateDeck,
            ActiveDeck
        };

        struct PlayerData
        {
            OwnedCollection owned;
            std::optional<Deck> active;
        };

        auto Roll(PlayerId const& player, std::string_view body) -> HttpResponse;
        auto ValidateDeck(PlayerId const& player, std::string_view body, bool activate) -> HttpResponse;
        auto PityInfo(PlayerId const& player) -> HttpResponse;
        auto Packs() const -> HttpResponse;
        auto CatalogRoute(Route route, std::string_view path, std::string_view query) const -> HttpResponse;

        auto AddToCollection(PlayerId const& player, RollResult const& r) -> void;

        std::shared_ptr<RollEngine> engine_;
        DeckRules rules_;
        std::chrono::milliseconds timeout_;
        std::shared_ptr<debug::AuditLogger> audit_;

        mutable std::mutex players_mtx_;
        std::unordered_map<PlayerId, PlayerData> players_;
    };
}

#endif //CARDROLL_HTTPSERVICE_HPP
