// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace rigtime::serializers
{
    nlohmann::json serialize_vec2(const glm::vec2& v);
    nlohmann::json serialize_vec3(const glm::vec3& v);
    /// Stored as [x, y, z, w]
    nlohmann::json serialize_quat(const glm::quat& q);
    /// Stored column-major, 16 numbers
    nlohmann::json serialize_mat4(const glm::mat4& m);

    /// Deserializers expect arrays of exactly the serialized length
    /// @throws FormatError
    glm::vec2 deserialize_vec2(const nlohmann::json& j);
    glm::vec3 deserialize_vec3(const nlohmann::json& j);
    glm::quat deserialize_quat(const nlohmann::json& j);
    glm::mat4 deserialize_mat4(const nlohmann::json& j);
}
