// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <chrono>

namespace rigtime
{
    /// Timeline positions and playback deltas. Integer microseconds keep cursor math exact.
    using Duration = std::chrono::microseconds;

    inline float to_seconds(Duration d)
    {
        return std::chrono::duration<float>(d).count();
    }
}
