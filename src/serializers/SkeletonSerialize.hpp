// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>

namespace rigtime
{
    class Skeleton;
}

namespace rigtime::serializers
{
    /// @brief Bones in depth-first order, each with the array index of its parent (-1 for the root)
    nlohmann::json serialize_skeleton(const Skeleton& skeleton);

    /// @brief Rebuild a writable skeleton. Node indices are reassigned in document order.
    /// @throws FormatError
    Skeleton deserialize_skeleton(const nlohmann::json& j);
}
