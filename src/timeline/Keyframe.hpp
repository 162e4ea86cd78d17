// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "Time.hpp"
#include "math/Interpolation.hpp"

namespace rigtime
{
    /// @brief A timestamped value of one animated parameter
    template<Animatable T>
    class Keyframe
    {
        Duration m_position{ 0 };
        T m_value;

    public:
        Keyframe(Duration position, const T& value)
            : m_position(position), m_value(value)
        {
        }

        Duration position() const { return m_position; }
        const T& value() const { return m_value; }
    };
}
