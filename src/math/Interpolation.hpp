// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <concepts>
#include <optional>
#include <string_view>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace rigtime
{
    /// @brief Value types a keyframe may carry
    template<class T>
    concept Animatable =
        std::same_as<T, float> ||
        std::same_as<T, glm::vec2> ||
        std::same_as<T, glm::vec3> ||
        std::same_as<T, glm::quat> ||
        std::same_as<T, glm::mat4>;

    enum class ValueKind
    {
        Float,
        Vec2,
        Vec3,
        Quat,
        Mat4
    };

    enum class InterpolationMethod
    {
        None,
        Linear,
        Cubic
    };

    const char* to_string(ValueKind kind);
    std::optional<ValueKind> value_kind_from_string(std::string_view name);

    const char* to_string(InterpolationMethod method);
    std::optional<InterpolationMethod> interpolation_method_from_string(std::string_view name);

    /// @brief True for the declared enumerators only
    bool is_valid(InterpolationMethod method);

    /// @brief Local transform from components, translation applied last (T * R * S)
    glm::mat4 create_transformation(const glm::vec3& position, const glm::vec3& scale, const glm::quat& rotation);

    namespace detail
    {
        /// Blend written so that ratio 0 and 1 reproduce the endpoints
        template<class T>
        T blend(const T& x, const T& y, float ratio)
        {
            return x * (1.0f - ratio) + y * ratio;
        }

        /// 4-point cubic through x (ratio 0) and y (ratio 1), shaped by the outer points
        template<class T>
        T cubic(const T& before_x, const T& x, const T& y, const T& after_y, float ratio)
        {
            const float r2 = ratio * ratio;
            const float r3 = r2 * ratio;
            const T interim = after_y - y - before_x + x;
            return interim * r3 + (before_x - x - interim) * r2 + (y - before_x) * ratio + x;
        }
    }

    /// @brief Per-type interpolation capability
    template<Animatable T>
    struct Interpolator;

    template<>
    struct Interpolator<float>
    {
        static constexpr ValueKind kind = ValueKind::Float;
        static float default_value() { return 0.0f; }
        static float linear(float x, float y, float ratio) { return detail::blend(x, y, ratio); }
        static float cubic(float bx, float x, float y, float ay, float ratio) { return detail::cubic(bx, x, y, ay, ratio); }
    };

    template<>
    struct Interpolator<glm::vec2>
    {
        static constexpr ValueKind kind = ValueKind::Vec2;
        static glm::vec2 default_value() { return glm::vec2{ 0.0f }; }
        static glm::vec2 linear(const glm::vec2& x, const glm::vec2& y, float ratio) { return detail::blend(x, y, ratio); }
        static glm::vec2 cubic(const glm::vec2& bx, const glm::vec2& x, const glm::vec2& y, const glm::vec2& ay, float ratio)
        {
            return detail::cubic(bx, x, y, ay, ratio);
        }
    };

    template<>
    struct Interpolator<glm::vec3>
    {
        static constexpr ValueKind kind = ValueKind::Vec3;
        static glm::vec3 default_value() { return glm::vec3{ 0.0f }; }
        static glm::vec3 linear(const glm::vec3& x, const glm::vec3& y, float ratio) { return detail::blend(x, y, ratio); }
        static glm::vec3 cubic(const glm::vec3& bx, const glm::vec3& x, const glm::vec3& y, const glm::vec3& ay, float ratio)
        {
            return detail::cubic(bx, x, y, ay, ratio);
        }
    };

    /// Rotations are blended along the shorter arc and renormalized
    template<>
    struct Interpolator<glm::quat>
    {
        static constexpr ValueKind kind = ValueKind::Quat;
        static glm::quat default_value() { return glm::quat{ 1.0f, 0.0f, 0.0f, 0.0f }; }
        static glm::quat linear(const glm::quat& x, const glm::quat& y, float ratio);
        static glm::quat cubic(const glm::quat& bx, const glm::quat& x, const glm::quat& y, const glm::quat& ay, float ratio);
    };

    template<>
    struct Interpolator<glm::mat4>
    {
        static constexpr ValueKind kind = ValueKind::Mat4;
        static glm::mat4 default_value() { return glm::mat4{ 1.0f }; }
        static glm::mat4 linear(const glm::mat4& x, const glm::mat4& y, float ratio) { return detail::blend(x, y, ratio); }
        static glm::mat4 cubic(const glm::mat4& bx, const glm::mat4& x, const glm::mat4& y, const glm::mat4& ay, float ratio)
        {
            return detail::cubic(bx, x, y, ay, ratio);
        }
    };
}
