// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "config/Settings.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "Errors.hpp"

namespace rigtime
{
    PlayerSettings load_player_settings(const nlohmann::json& j)
    {
        PlayerSettings settings;
        if (!j.is_object())
            throw FormatError("Player settings: expected an object");

        try
        {
            if (j.contains("update_threshold_ms"))
                settings.update_threshold = std::chrono::round<Duration>(
                    std::chrono::duration<double, std::milli>(j.at("update_threshold_ms").get<double>()));
            settings.loop = j.value("loop", settings.loop);
        }
        catch (const nlohmann::json::exception& e)
        {
            throw FormatError(std::string("Player settings: ") + e.what());
        }

        if (settings.update_threshold < Duration{ 0 })
            throw InvalidArgumentError("Player settings: negative update threshold");
        return settings;
    }

    DeformerSettings load_deformer_settings(const nlohmann::json& j)
    {
        DeformerSettings settings;
        if (!j.is_object())
            throw FormatError("Deformer settings: expected an object");

        if (j.contains("player"))
            settings.player = load_player_settings(j.at("player"));

        try
        {
            settings.overlay_influence = std::clamp(j.value("overlay_influence", 0.0f), 0.0f, 1.0f);
        }
        catch (const nlohmann::json::exception& e)
        {
            throw FormatError(std::string("Deformer settings: ") + e.what());
        }
        return settings;
    }

    nlohmann::json to_json(const PlayerSettings& settings)
    {
        return nlohmann::json{
            { "update_threshold_ms", std::chrono::duration<double, std::milli>(settings.update_threshold).count() },
            { "loop", settings.loop }
        };
    }

    nlohmann::json to_json(const DeformerSettings& settings)
    {
        return nlohmann::json{
            { "player", to_json(settings.player) },
            { "overlay_influence", settings.overlay_influence }
        };
    }
}
