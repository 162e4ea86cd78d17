// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <nlohmann/json_fwd.hpp>

namespace rigtime
{
    class Timeline;
}

namespace rigtime::serializers
{
    nlohmann::json serialize_timeline(const Timeline& timeline);

    /// @throws FormatError Malformed document
    /// @throws DuplicateKeyError Document repeats a layer, channel, marker or keyframe position
    std::shared_ptr<const Timeline> deserialize_timeline(const nlohmann::json& j);
}
