// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>
#include "Time.hpp"

namespace rigtime
{
    /// @brief Named point in time, used to define playback ranges
    struct Marker
    {
        std::string name;
        Duration position{ 0 };
    };
}
