//
// Exception.hpp
//

#ifndef CARDROLL_EXCEPTION_HPP
#define CARDROLL_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "Types.hpp"

namespace cardroll::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Validation, // caller input violates a documented constraint
        Configuration, // catalog or pack data is inconsistent
        Transient, // persistence unavailable or deadline exceeded
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ValidationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TransientError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Validation: throw ValidationError(std::move(msg), c, loc);
        case Code::Configuration: throw ConfigurationError(std::move(msg), c, loc);
        case Code::Transient: throw TransientError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "UnknownError";
        case Code::Validation: return "ValidationError";
        case Code::Configuration: return "ConfigurationError";
        case Code::Transient: return "TransientError";
        case Code::Assertion: return "AssertionError";
        }
        return "UnknownError";
    }

#define CRL_THROW(code_enum, msg) ::cardroll::core::error::fail((code_enum), (msg))
#define CRL_ASSERT(cond, msg) do { if(!(cond)) ::cardroll::core::error::fail(::cardroll::core::error::Code::Assertion, (msg)); } while(0)

    // Deck rejections are ordinary outcomes, returned rather than thrown.
    enum class DeckViolationCode : std::uint8_t
    {
        DeckSizeError,
        UnownedCardError,
        DuplicateLimitError
    };

    struct DeckViolation
    {
        DeckViolationCode code{};
        std::optional<std::size_t> deck_size{};
        std::optional<std::size_t> min_size{};
        std::optional<std::size_t> max_size{};
        std::optional<std::string> card_id{};
        std::optional<std::uint32_t> copies{};
        std::optional<std::uint32_t> owned{};
        std::optional<std::uint32_t> limit{};
        std::optional<Rarity> rarity{};

        auto with_size(std::size_t n, std::size_t lo, std::size_t hi) -> DeckViolation&
        {
            deck_size = n;
            min_size = lo;
            max_size = hi;
            return *this;
        }

        auto with_card(std::string id) -> DeckViolation&
        {
            card_id = std::move(id);
            return *this;
        }

        auto with_copies(std::uint32_t v) -> DeckViolation&
        {
            copies = v;
            return *this;
        }

        auto with_owned(std::uint32_t v) -> DeckViolation&
        {
            owned = v;
            return *this;
        }

        auto with_limit(std::uint32_t v) -> DeckViolation&
        {
            limit = v;
            return *this;
        }

        auto with_rarity(Rarity r) -> DeckViolation&
        {
            rarity = r;
            return *this;
        }
    };

    inline auto to_string(DeckViolationCode c) -> std::string_view
    {
        switch (c)
        {
        case DeckViolationCode::DeckSizeError: return "DeckSizeError";
        case DeckViolationCode::UnownedCardError: return "UnownedCardError";
        case DeckViolationCode::DuplicateLimitError: return "DuplicateLimitError";
        }
        return "Unknown";
    }

    inline auto describe(DeckViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.deck_size) s += std::format(" | size={}", *v.deck_size);
        if (v.min_size && v.max_size) s += std::format(" | allowed=[{},{}]", *v.min_size, *v.max_size);
        if (v.card_id) s += std::format(" | card={}", *v.card_id);
        if (v.copies) s += std::format(" | copies={}", *v.copies);
        if (v.owned) s += std::format(" | owned={}", *v.owned);
        if (v.limit) s += std::format(" | limit={}", *v.limit);
        if (v.rarity) s += std::format(" | rarity={}", ToString(*v.rarity));
        return s;
    }

    using ValidateResult = std::expected<void, DeckViolation>;
}

#endif //CARDROLL_EXCEPTION_HPP
