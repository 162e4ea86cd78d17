// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "math/Interpolation.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace rigtime
{
    namespace
    {
        glm::quat same_hemisphere(const glm::quat& q, const glm::quat& reference)
        {
            return glm::dot(q, reference) < 0.0f ? -q : q;
        }

        glm::vec4 to_vec4(const glm::quat& q)
        {
            return glm::vec4(q.x, q.y, q.z, q.w);
        }
    }

    const char* to_string(ValueKind kind)
    {
        switch (kind)
        {
        case ValueKind::Float: return "float";
        case ValueKind::Vec2: return "vec2";
        case ValueKind::Vec3: return "vec3";
        case ValueKind::Quat: return "quat";
        case ValueKind::Mat4: return "mat4";
        }
        return "unknown";
    }

    std::optional<ValueKind> value_kind_from_string(std::string_view name)
    {
        if (name == "float") return ValueKind::Float;
        if (name == "vec2") return ValueKind::Vec2;
        if (name == "vec3") return ValueKind::Vec3;
        if (name == "quat") return ValueKind::Quat;
        if (name == "mat4") return ValueKind::Mat4;
        return std::nullopt;
    }

    const char* to_string(InterpolationMethod method)
    {
        switch (method)
        {
        case InterpolationMethod::None: return "none";
        case InterpolationMethod::Linear: return "linear";
        case InterpolationMethod::Cubic: return "cubic";
        }
        return "unknown";
    }

    std::optional<InterpolationMethod> interpolation_method_from_string(std::string_view name)
    {
        if (name == "none") return InterpolationMethod::None;
        if (name == "linear") return InterpolationMethod::Linear;
        if (name == "cubic") return InterpolationMethod::Cubic;
        return std::nullopt;
    }

    bool is_valid(InterpolationMethod method)
    {
        switch (method)
        {
        case InterpolationMethod::None:
        case InterpolationMethod::Linear:
        case InterpolationMethod::Cubic:
            return true;
        }
        return false;
    }

    glm::mat4 create_transformation(const glm::vec3& position, const glm::vec3& scale, const glm::quat& rotation)
    {
        const glm::mat4 translation_matrix = glm::translate(glm::mat4(1.0f), position);
        const glm::mat4 rotation_matrix = glm::mat4_cast(rotation);
        const glm::mat4 scale_matrix = glm::scale(glm::mat4(1.0f), scale);
        return translation_matrix * rotation_matrix * scale_matrix;
    }

    glm::quat Interpolator<glm::quat>::linear(const glm::quat& x, const glm::quat& y, float ratio)
    {
        return glm::normalize(glm::slerp(x, same_hemisphere(y, x), ratio));
    }

    glm::quat Interpolator<glm::quat>::cubic(
        const glm::quat& bx,
        const glm::quat& x,
        const glm::quat& y,
        const glm::quat& ay,
        float ratio)
    {
        // Align all control points with x so the blend does not take the long way round
        const glm::quat y_aligned = same_hemisphere(y, x);
        const glm::quat bx_aligned = same_hemisphere(bx, x);
        const glm::quat ay_aligned = same_hemisphere(ay, y_aligned);

        const glm::vec4 v = detail::cubic(
            to_vec4(bx_aligned), to_vec4(x), to_vec4(y_aligned), to_vec4(ay_aligned), ratio);

        const float len = glm::length(v);
        if (len <= 1e-6f)
            return linear(x, y_aligned, ratio);
        return glm::quat(v.w / len, v.x / len, v.y / len, v.z / len);
    }
}
