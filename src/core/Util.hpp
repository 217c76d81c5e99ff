//
// Util.hpp
//

#ifndef CARDROLL_UTIL_HPP
#define CARDROLL_UTIL_HPP

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cardroll::core::util
{
    // FNV-1a, 64 bit. Stable across platforms, unlike std::hash.
    inline constexpr auto Fnv1a(std::string_view const s) noexcept -> std::uint64_t
    {
        std::uint64_t h = 0xCBF29CE484222325ULL;
        for (char const c : s)
        {
            h ^= static_cast<unsigned char>(c);
            h *= 0x100000001B3ULL;
        }
        return h;
    }

    // Copies per card id, remembering the order ids were first seen so
    // diagnostics point at the earliest offending card.
    class CardCopyCounter
    {
    public:
        explicit CardCopyCounter(std::span<std::string const> ids)
        {
            for (std::string const& id : ids) Add(id);
        }

        auto Add(std::string const& id) -> void
        {
            auto const [it, inserted] = counts_.try_emplace(id, 0u);
            if (inserted) order_.push_back(id);
            ++it->second;
        }

        // (id, copies) in first-seen order
        [[nodiscard]]
        auto Entries() const -> std::vector<std::pair<std::string, std::uint32_t>>
        {
            std::vector<std::pair<std::string, std::uint32_t>> out;
            out.reserve(order_.size());
            for (std::string const& id : order_) out.emplace_back(id, counts_.at(id));
            return out;
        }

    private:
        std::map<std::string, std::uint32_t, std::less<>> counts_;
        std::vector<std::string> order_;
    };
}

#endif //CARDROLL_UTIL_HPP
