// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "skeleton/Bone.hpp"

namespace rigtime
{
    std::string Bone::to_string() const
    {
        std::string str = m_identifier ? "Bone \"" + *m_identifier + "\"" : std::string("Unnamed bone");
        if (m_index)
            str += " (#" + std::to_string(static_cast<unsigned>(*m_index)) + ")";
        return str;
    }
}
