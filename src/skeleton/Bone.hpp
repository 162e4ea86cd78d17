// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <glm/glm.hpp>

namespace rigtime
{
    /// @brief Node value of a skeleton
    /// The identifier ties a bone to animation layers and the index selects its deformer slot.
    /// A bone with neither is a static pivot.
    class Bone
    {
        std::optional<std::string> m_identifier;
        std::optional<uint8_t> m_index;
        glm::mat4 m_offset{ 1.0f };

    public:
        Bone() = default;

        Bone(
            std::optional<std::string> identifier,
            std::optional<uint8_t> index,
            const glm::mat4& offset = glm::mat4{ 1.0f })
            : m_identifier(std::move(identifier)), m_index(index), m_offset(offset)
        {
        }

        const std::optional<std::string>& identifier() const { return m_identifier; }
        std::optional<uint8_t> index() const { return m_index; }
        const glm::mat4& offset() const { return m_offset; }

        bool operator==(const Bone& other) const
        {
            return m_identifier == other.m_identifier
                && m_index == other.m_index
                && m_offset == other.m_offset;
        }

        std::string to_string() const;
    };
}
