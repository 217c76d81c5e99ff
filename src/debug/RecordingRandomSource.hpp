//
// RecordingRandomSource.hpp
//

#ifndef CARDROLL_RECORDINGRANDOMSOURCE_HPP
#define CARDROLL_RECORDINGRANDOMSOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>
#include <vector>

#include "core/Random.hpp"

namespace cardroll::core::debug
{
    // One draw: a unit value or an index together with its bound.
    struct UnitDraw
    {
        double value{};
        auto operator==(UnitDraw const&) const -> bool = default;
    };

    struct IndexDraw
    {
        std::size_t bound{};
        std::size_t value{};
        auto operator==(IndexDraw const&) const -> bool = default;
    };

    using Draw = std::variant<UnitDraw, IndexDraw>;

    class RecordingRandomSource final : public RandomSource
    {
    public:
        explicit RecordingRandomSource(std::unique_ptr<RandomSource> inner)
            : inner_{std::move(inner)}
        {
        }

        auto NextUnit() -> double override
        {
            double const v = inner_->NextUnit();
            draws_.emplace_back(UnitDraw{v});
            return v;
        }

        auto NextIndex(std::size_t const bound) -> std::size_t override
        {
            std::size_t const v = inner_->NextIndex(bound);
            draws_.emplace_back(IndexDraw{bound, v});
            return v;
        }

        auto Draws() const -> std::vector<Draw> const&
        {
            return draws_;
        }

    private:
        std::unique_ptr<RandomSource> inner_;
        std::vector<Draw> draws_;
    };

    // Wraps a factory so every source it hands out appends its draws to `out`
    // when the engine releases it, one entry per request.
    inline auto WrapRecording(RandomSourceFactory inner, std::shared_ptr<std::vector<std::vector<Draw>>> out,
                              std::shared_ptr<std::mutex> mtx) -> RandomSourceFactory
    {
        return [inner = std::move(inner), out = std::move(out), mtx = std::move(mtx)](
            PlayerId const& player, std::uint64_t const sequence) -> std::unique_ptr<RandomSource>
        {
            class Tap final : public RandomSource
            {
            public:
                Tap(std::unique_ptr<RandomSource> src, std::shared_ptr<std::vector<std::vector<Draw>>> sink,
                    std::shared_ptr<std::mutex> m)
                    : rec_{std::move(src)}, sink_{std::move(sink)}, m_{std::move(m)}
                {
                }

                ~Tap() override
                {
                    std::lock_guard<std::mutex> lock(*m_);
                    sink_->push_back(rec_.Draws());
                }

                auto NextUnit() -> double override { return rec_.NextUnit(); }
                auto NextIndex(std::size_t const bound) -> std::size_t override { return rec_.NextIndex(bound); }

            private:
                RecordingRandomSource rec_;
                std::shared_ptr<std::vector<std::vector<Draw>>> sink_;
                std::shared_ptr<std::mutex> m_;
            };

            return std::make_unique<Tap>(inner(player, sequence), out, mtx);
        };
    }
}

#endif //CARDROLL_RECORDINGRANDOMSOURCE_HPP
