// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <entt/core/type_info.hpp>

#include "Errors.hpp"
#include "Time.hpp"
#include "timeline/Keyframe.hpp"

namespace rigtime
{
    /// @brief Type-erased view of a channel
    class ITimelineChannel
    {
    public:
        virtual ~ITimelineChannel() = default;

        const std::string& name() const { return m_name; }
        InterpolationMethod interpolation() const { return m_interpolation; }

        virtual ValueKind value_kind() const = 0;
        virtual entt::id_type value_type_id() const = 0;
        virtual std::string_view value_type_name() const = 0;

        virtual size_t count() const = 0;
        virtual Duration start() const = 0;
        virtual Duration end() const = 0;

        bool has_keyframes() const { return count() > 0; }
        Duration length() const { return end() - start(); }

        template<Animatable T>
        bool holds() const
        {
            return value_type_id() == entt::type_hash<T>::value();
        }

    protected:
        ITimelineChannel(std::string name, InterpolationMethod interpolation)
            : m_name(std::move(name)), m_interpolation(interpolation)
        {
            if (!is_valid(m_interpolation))
                throw InvalidArgumentError("Channel '" + m_name + "': undefined interpolation method");
        }

    private:
        std::string m_name;
        InterpolationMethod m_interpolation;
    };

    /// @brief Time-sorted keyframes of one animated parameter
    /// Keyframe positions are unique and strictly increasing.
    template<Animatable T>
    class TimelineChannel final : public ITimelineChannel
    {
        std::vector<Keyframe<T>> m_keyframes;

    public:
        using value_type = T;

        /// @throws DuplicateKeyframeError Two keyframes share a position
        /// @throws InvalidArgumentError Undefined interpolation method
        TimelineChannel(
            std::string name,
            std::vector<Keyframe<T>> keyframes,
            InterpolationMethod interpolation = InterpolationMethod::Linear)
            : ITimelineChannel(std::move(name), interpolation)
            , m_keyframes(std::move(keyframes))
        {
            std::stable_sort(m_keyframes.begin(), m_keyframes.end(),
                [](const Keyframe<T>& a, const Keyframe<T>& b)
                {
                    return a.position() < b.position();
                });

            auto dup = std::adjacent_find(m_keyframes.begin(), m_keyframes.end(),
                [](const Keyframe<T>& a, const Keyframe<T>& b)
                {
                    return a.position() == b.position();
                });
            if (dup != m_keyframes.end())
                throw DuplicateKeyframeError("Channel '" + this->name() + "': two keyframes at "
                    + std::to_string(dup->position().count()) + "us");
        }

        ValueKind value_kind() const override { return Interpolator<T>::kind; }
        entt::id_type value_type_id() const override { return entt::type_hash<T>::value(); }
        std::string_view value_type_name() const override { return entt::type_name<T>::value(); }

        size_t count() const override { return m_keyframes.size(); }

        Duration start() const override
        {
            return m_keyframes.empty() ? Duration{ 0 } : m_keyframes.front().position();
        }

        Duration end() const override
        {
            return m_keyframes.empty() ? Duration{ 0 } : m_keyframes.back().position();
        }

        /// @brief Keyframes in ascending position order
        const std::vector<Keyframe<T>>& keyframes() const { return m_keyframes; }

        const Keyframe<T>& keyframe(size_t index) const
        {
            if (index >= m_keyframes.size())
                throw InvalidArgumentError("Channel '" + name() + "': keyframe index "
                    + std::to_string(index) + " out of range");
            return m_keyframes[index];
        }

        /// @brief Index of the keyframe at position, else of the closest one before it,
        ///        else 0 when position precedes all keyframes. Empty for an empty channel.
        std::optional<size_t> nearest_keyframe_index(Duration position) const
        {
            if (m_keyframes.empty())
                return std::nullopt;

            auto it = std::upper_bound(m_keyframes.begin(), m_keyframes.end(), position,
                [](Duration p, const Keyframe<T>& k)
                {
                    return p < k.position();
                });
            if (it == m_keyframes.begin())
                return 0;
            return static_cast<size_t>(std::distance(m_keyframes.begin(), it) - 1);
        }

        /// @brief Keyframe at or before position.
        /// @param offset Number of additional keyframes to step back
        std::optional<Keyframe<T>> try_find_keyframe_before(Duration position, int offset = 0) const
        {
            auto nearest = nearest_keyframe_index(position);
            if (!nearest || m_keyframes[*nearest].position() > position)
                return std::nullopt;
            return at_signed(static_cast<std::ptrdiff_t>(*nearest) - offset);
        }

        /// @brief First keyframe strictly after position.
        /// @param offset Number of additional keyframes to step forward
        std::optional<Keyframe<T>> try_find_keyframe_after(Duration position, int offset = 0) const
        {
            auto nearest = nearest_keyframe_index(position);
            if (!nearest)
                return std::nullopt;
            std::ptrdiff_t index = static_cast<std::ptrdiff_t>(*nearest) + offset;
            if (m_keyframes[*nearest].position() <= position)
                index += 1;
            return at_signed(index);
        }

        /// @brief Keyframe closest to position, ties resolved towards the earlier one.
        /// @param offset Signed step from the closest keyframe, positive is later
        std::optional<Keyframe<T>> try_find_keyframe(Duration position, int offset = 0) const
        {
            auto nearest = nearest_keyframe_index(position);
            if (!nearest)
                return std::nullopt;

            size_t index = *nearest;
            if (m_keyframes[index].position() <= position && index + 1 < m_keyframes.size())
            {
                const Duration to_floor = position - m_keyframes[index].position();
                const Duration to_next = m_keyframes[index + 1].position() - position;
                if (to_next < to_floor)
                    index += 1;
            }
            return at_signed(static_cast<std::ptrdiff_t>(index) + offset);
        }

        /// @brief Interpolated value at position. Holds the boundary values outside the keyframe range.
        T sample(Duration position) const
        {
            using I = Interpolator<T>;
            if (m_keyframes.empty())
                return I::default_value();

            auto x = try_find_keyframe_before(position);
            auto y = try_find_keyframe_after(position);
            if (!x) x = y;
            if (!y) y = x;

            if (interpolation() == InterpolationMethod::None)
                return x->value();

            float ratio = 0.0f;
            const Duration span = y->position() - x->position();
            if (span > Duration{ 0 })
            {
                ratio = static_cast<float>(
                    static_cast<double>((position - x->position()).count()) / static_cast<double>(span.count()));
                ratio = std::clamp(ratio, 0.0f, 1.0f);
            }

            if (ratio <= 0.0f) return x->value();
            if (ratio >= 1.0f) return y->value();

            if (interpolation() == InterpolationMethod::Linear)
                return I::linear(x->value(), y->value(), ratio);

            auto before_x = try_find_keyframe_before(position, 1);
            auto after_y = try_find_keyframe_after(position, 1);
            return I::cubic(
                before_x ? before_x->value() : x->value(),
                x->value(),
                y->value(),
                after_y ? after_y->value() : y->value(),
                ratio);
        }

    private:
        std::optional<Keyframe<T>> at_signed(std::ptrdiff_t index) const
        {
            if (index < 0 || index >= static_cast<std::ptrdiff_t>(m_keyframes.size()))
                return std::nullopt;
            return m_keyframes[static_cast<size_t>(index)];
        }
    };
}
