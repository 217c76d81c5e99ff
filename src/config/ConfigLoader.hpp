//
// ConfigLoader.hpp
//

#ifndef CARDROLL_CONFIGLOADER_HPP
#define CARDROLL_CONFIGLOADER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/CardCatalog.hpp"
#include "core/DeckValidator.hpp"
#include "core/Reconciler.hpp"

namespace cardroll::core::config
{
    struct PersistenceSettings
    {
        // Empty directory keeps pity state in memory only.
        std::filesystem::path directory{"pity_data"};
        std::chrono::milliseconds timeout{2000};
        ReconcilerSettings reconciler{};
    };

    struct ServerSettings
    {
        std::uint16_t port{8080};
        std::uint32_t threads{4};
        std::chrono::milliseconds request_timeout{2000};
        std::string audit_path; // empty: no audit transcript
    };

    struct EngineConfig
    {
        CatalogSP catalog;
        DeckRules deck{};
        PersistenceSettings persistence{};
        ServerSettings server{};
        std::optional<std::uint64_t> seed; // random_device when absent
    };

    // All three throw ConfigurationError naming the offending key.
    auto ParseConfig(nlohmann::json const& root) -> EngineConfig;
    auto ParseConfigText(std::string_view text) -> EngineConfig;
    auto LoadConfigFile(std::filesystem::path const& path) -> EngineConfig;

    auto ParseCard(nlohmann::json const& j) -> Card;
    auto ParsePack(nlohmann::json const& j) -> PackType;
}

#endif //CARDROLL_CONFIGLOADER_HPP
