//
// HttpService.cpp
//
#include "HttpService.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "core/Exception.hpp"

namespace cardroll::core::net
{
    namespace
    {
        auto Json(int const status, nlohmann::json const& body) -> HttpResponse
        {
            return HttpResponse{.status = status, .body = body.dump()};
        }

        auto Error(int const status, std::string_view const kind, std::string_view const message) -> HttpResponse
        {
            return Json(status, BuildError(kind, message));
        }
    }

    HttpService::HttpService(std::shared_ptr<RollEngine> engine,
                             DeckRules rules,
                             std::chrono::milliseconds const request_timeout,
                             std::shared_ptr<debug::AuditLogger> audit) :
        engine_(std::move(engine)),
        rules_(std::move(rules)),
        timeout_(request_timeout),
        audit_(std::move(audit))
    {
        CRL_ASSERT(engine_ != nullptr, "HttpService requires an engine");
        // rejects bad deck rules at startup rather than on the first deck request
        DeckValidator const check{engine_->Catalog(), rules_};
        (void)check;
    }

    namespace
    {
        constexpr std::string_view CardsPrefix = "/cards/";
    }

    auto HttpService::Handle(HttpRequest const& req) -> HttpResponse
    {
        std::optional<Route> route;
        if (req.path == "/cards/roll") route = Route::Roll;
        else if (req.path == "/cards/pity") route = Route::Pity;
        else if (req.path == "/cards/packs") route = Route::Packs;
        else if (req.path == "/cards") route = Route::CardList;
        else if (req.path == "/cards/stats") route = Route::CardStats;
        else if (req.path == "/cards/tags") route = Route::CardTags;
        else if (req.path == "/cards/search") route = Route::CardSearch;
        else if (req.path == "/decks/validate") route = Route::ValidateDeck;
        else if (req.path == "/decks/active") route = Route::ActiveDeck;
        // only GET reads a card, other methods on /cards/{x} have no route
        else if (req.method == "GET" && req.path.starts_with(CardsPrefix) && req.path.size() > CardsPrefix.size()
                 && req.path.find('/', CardsPrefix.size()) == std::string::npos)
            route = Route::CardById;

        if (!route.has_value())
            return Error(404, "NotFound", std::format("no route for {} {}", req.method, req.path));

        bool const wants_post = *route == Route::Roll || *route == Route::ValidateDeck || *route == Route::ActiveDeck;
        if (req.method != (wants_post ? "POST" : "GET"))
            return Error(405, "MethodNotAllowed", std::format("{} does not accept {}", req.path, req.method));

        if (*route == Route::Packs) return Packs();
        if (*route != Route::Pity && !wants_post)
        {
            try
            {
                return CatalogRoute(*route, req.path, req.query);
            }
            catch (error::ValidationError const& e)
            {
                return Error(400, "ValidationError", e.what());
            }
        }

        if (!req.player.has_value() || req.player->empty())
            return Error(401, "Unauthorized", std::format("missing {} header", PlayerHeader));
        if (req.player->size() > constants::MaxPlayerIdLength)
            return Error(400, "ValidationError",
                         std::format("{} is longer than {} bytes", PlayerHeader, constants::MaxPlayerIdLength));
        PlayerId const& player = *req.player;

        try
        {
            switch (*route)
            {
            case Route::Roll: return Roll(player, req.body);
            case Route::Pity: return PityInfo(player);
            case Route::ActiveDeck: return ValidateDeck(player, req.body, true);
            default: return ValidateDeck(player, req.body, false);
            }
        }
        catch (error::ValidationError const& e)
        {
            if (audit_) audit_->rejected(player, "ValidationError", e.what());
            return Error(400, "ValidationError", e.what());
        }
        catch (error::TransientError const& e)
        {
            std::print(stderr, "[HttpService] transient failure for '{}': {}\n", player, e.what());
            if (audit_) audit_->rejected(player, "TransientError", e.what());
            return Error(503, "TransientError", "temporarily unavailable, retry later");
        }
        catch (error::ConfigurationError const& e)
        {
            std::print(stderr, "[HttpService] configuration error: {}\n",
                       static_cast<OmegaException<error::Code> const&>(e));
            if (audit_) audit_->rejected(player, "ConfigurationError", e.what());
            return Error(500, "ConfigurationError", "service unavailable");
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print(stderr, "[HttpService] internal error: {}\n", e);
            return Error(500, error::to_string(e.data()), "internal error");
        }
    }

    auto HttpService::CatalogRoute(Route const route, std::string_view const path, std::string_view const query) const
        -> HttpResponse
    {
        CardCatalog const& catalog = *engine_->Catalog();

        auto params = ParseQuery(query);
        if (!params.has_value()) return Error(400, "ParseError", params.error().message);

        switch (route)
        {
        case Route::CardList:
        {
            auto req = DecodeCardListRequest(*params);
            if (!req.has_value()) return Error(400, "ParseError", req.error().message);
            return Json(200, BuildCardPage(catalog.Find(req->query), req->page, req->limit));
        }
        case Route::CardStats:
            return Json(200, BuildCardStats(catalog));
        case Route::CardTags:
        {
            auto limit = DecodeLimit(*params, 20, MaxPageSize);
            if (!limit.has_value()) return Error(400, "ParseError", limit.error().message);
            return Json(200, BuildTags(catalog.PopularTags(*limit)));
        }
        case Route::CardSearch:
        {
            auto const q = params->find("q");
            if (q == params->end()) return Error(400, "ParseError", "'q' is required");
            auto limit = DecodeLimit(*params, 10, MaxPageSize);
            if (!limit.has_value()) return Error(400, "ParseError", limit.error().message);
            std::vector<CCardSP> const found = catalog.Search(q->second, *limit);
            return Json(200, nlohmann::json{
                {"cards", BuildCardList(found)}, {"count", found.size()}, {"query", q->second}});
        }
        default:
        {
            auto id = PercentDecode(path.substr(CardsPrefix.size()));
            if (!id.has_value()) return Error(400, "ParseError", id.error().message);
            CCardSP const card = catalog.GetById(*id);
            if (!card) return Error(404, "NotFound", std::format("no card with id '{}'", *id));
            return Json(200, BuildCard(*card));
        }
        }
    }

    auto HttpService::Roll(PlayerId const& player, std::string_view const body) -> HttpResponse
    {
        auto req = DecodeRollRequest(body);
        if (!req.has_value()) return Error(400, "ParseError", req.error().message);

        Deadline const deadline = Clock::now() + timeout_;
        RollResult const result = engine_->Roll(player, req->pack_type, req->count, deadline);

        // the cards are the player's even when the pity save is still pending
        AddToCollection(player, result);
        if (audit_) audit_->roll(player, result);

        int const status = result.persistence == PersistenceStatus::Committed ? 200 : 503;
        return Json(status, BuildRollResponse(result));
    }

    auto HttpService::ValidateDeck(PlayerId const& player, std::string_view const body, bool const activate)
        -> HttpResponse
    {
        auto req = DecodeDeckRequest(body);
        if (!req.has_value()) return Error(400, "ParseError", req.error().message);
        if (activate && !req->cards.has_value())
            return Error(400, "ParseError", "'cards' is required to set the active deck");

        Deck deck{};
        OwnedCollection owned;
        {
            std::lock_guard<std::mutex> lock(players_mtx_);
            auto const it = players_.find(player);
            if (it != players_.end()) owned = it->second.owned;

            if (req->deck_id.has_value())
            {
                if (*req->deck_id != "active")
                    CRL_THROW(error::Code::Validation, std::format("Unknown deck '{}'", *req->deck_id));
                if (it == players_.end() || !it->second.active.has_value())
                    CRL_THROW(error::Code::Validation, "No active deck set");
                deck = *it->second.active;
            }
            else
            {
                deck.card_ids = std::move(*req->cards);
            }
        }

        DeckValidator const validator{engine_->Catalog(), rules_};
        error::ValidateResult const v = validator.Validate(deck, owned);
        if (audit_) audit_->deck(player, deck, v);

        DeckStats const stats = v.has_value() ? validator.Stats(deck) : DeckStats{};
        if (activate)
        {
            if (!v.has_value()) return Json(400, BuildDeckResponse(v, stats));

            std::lock_guard<std::mutex> lock(players_mtx_);
            players_[player].active = deck;
        }
        return Json(200, BuildDeckResponse(v, stats));
    }

    auto HttpService::PityInfo(PlayerId const& player) -> HttpResponse
    {
        Deadline const deadline = Clock::now() + timeout_;
        PlayerPityRecord const record = engine_->Tracker()->Snapshot(player, deadline);
        return Json(200, BuildPityInfo(record, *engine_->Catalog()));
    }

    auto HttpService::Packs() const -> HttpResponse
    {
        return Json(200, BuildPacks(*engine_->Catalog()));
    }

    auto HttpService::AddToCollection(PlayerId const& player, RollResult const& r) -> void
    {
        std::lock_guard<std::mutex> lock(players_mtx_);
        OwnedCollection& owned = players_[player].owned;
        for (RolledCard const& rc : r.cards)
        {
            ++owned[rc.card->id];
        }
    }

    auto HttpService::Grant(PlayerId const& player, std::string const& card_id, std::uint32_t const copies) -> void
    {
        std::lock_guard<std::mutex> lock(players_mtx_);
        players_[player].owned[card_id] += copies;
    }

    auto HttpService::Collection(PlayerId const& player) const -> OwnedCollection
    {
        std::lock_guard<std::mutex> lock(players_mtx_);
        auto const it = players_.find(player);
        return it != players_.end() ? it->second.owned : OwnedCollection{};
    }

    auto HttpService::ActiveDeck(PlayerId const& player) const -> std::optional<Deck>
    {
        std::lock_guard<std::mutex> lock(players_mtx_);
        auto const it = players_.find(player);
        if (it == players_.end()) return std::nullopt;
        return it->second.active;
    }
}
