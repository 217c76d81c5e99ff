//
// AuditLogger.hpp
//

#ifndef CARDROLL_AUDITLOGGER_HPP
#define CARDROLL_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "core/DeckValidator.hpp"
#include "core/Exception.hpp"
#include "core/RollEngine.hpp"
#include "core/Types.hpp"

namespace cardroll::core::debug
{
    // Append-only transcript of rolls and deck checks. Safe to share between
    // request threads; each call writes whole lines.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed, catalog size, pack names)
        auto start(std::uint64_t seed, CardCatalog const& catalog) -> void;

        // One line per roll: sequence, pack, cards with forced marks, final counter, persistence
        auto roll(PlayerId const& player, RollResult const& r) -> void;

        // Roll requests that were refused (error kind and message)
        auto rejected(PlayerId const& player, std::string_view what, std::string_view message) -> void;

        // One line per deck validation
        auto deck(PlayerId const& player, Deck const& d, error::ValidateResult const& v) -> void;

        // Manual flush
        auto flush() -> void;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

    private:
        std::mutex mtx_;
        std::ofstream out_;
    };
}

#endif //CARDROLL_AUDITLOGGER_HPP
