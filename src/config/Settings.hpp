// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>

#include "Time.hpp"

namespace rigtime
{
    struct PlayerSettings
    {
        /// Player layers resample only once the position has moved further than this
        Duration update_threshold = std::chrono::milliseconds(10);
        bool loop = false;
    };

    struct DeformerSettings
    {
        PlayerSettings player;
        float overlay_influence = 0.0f;
    };

    /// @brief Read settings, keeping defaults for absent keys
    /// @throws InvalidArgumentError Negative threshold
    /// @throws FormatError Value of the wrong JSON type
    PlayerSettings load_player_settings(const nlohmann::json& j);
    DeformerSettings load_deformer_settings(const nlohmann::json& j);

    nlohmann::json to_json(const PlayerSettings& settings);
    nlohmann::json to_json(const DeformerSettings& settings);
}
