// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <entt/core/type_info.hpp>

#include "timeline/TimelineChannel.hpp"

namespace rigtime
{
    /// @brief Type-erased player layer
    class IAnimationPlayerLayer
    {
    public:
        virtual ~IAnimationPlayerLayer() = default;

        /// @brief Layer path, see make_layer_path()
        const std::string& path() const { return m_path; }

        virtual entt::id_type value_type_id() const = 0;
        virtual std::string_view value_type_name() const = 0;

        template<Animatable T>
        bool holds() const
        {
            return value_type_id() == entt::type_hash<T>::value();
        }

    protected:
        explicit IAnimationPlayerLayer(std::string path)
            : m_path(std::move(path))
        {
        }

    private:
        std::string m_path;
    };

    /// @brief Current value of one timeline channel at the position of a player
    ///
    /// The value is resampled lazily on read, and only when the position has moved by more than
    /// the threshold since the last sample. Movement is measured as an absolute difference so
    /// that loop wraps and backward jumps count.
    template<Animatable T>
    class AnimationPlayerLayer final : public IAnimationPlayerLayer
    {
        std::shared_ptr<const TimelineChannel<T>> m_channel;
        const Duration& m_position;
        Duration m_threshold;

        mutable T m_last_value = Interpolator<T>::default_value();
        mutable std::optional<Duration> m_last_sample_time;

    public:
        /// @param position Cursor of the owning player, must outlive the layer
        AnimationPlayerLayer(
            std::string path,
            std::shared_ptr<const TimelineChannel<T>> channel,
            const Duration& position,
            Duration threshold)
            : IAnimationPlayerLayer(std::move(path))
            , m_channel(std::move(channel))
            , m_position(position)
            , m_threshold(threshold)
        {
        }

        AnimationPlayerLayer(const AnimationPlayerLayer&) = delete;
        AnimationPlayerLayer& operator=(const AnimationPlayerLayer&) = delete;

        entt::id_type value_type_id() const override { return entt::type_hash<T>::value(); }
        std::string_view value_type_name() const override { return entt::type_name<T>::value(); }

        const TimelineChannel<T>& channel() const { return *m_channel; }

        const T& current_value() const
        {
            const Duration position = m_position;
            if (!m_last_sample_time || std::chrono::abs(position - *m_last_sample_time) > m_threshold)
            {
                m_last_value = m_channel->sample(position);
                m_last_sample_time = position;
            }
            return m_last_value;
        }

        /// @brief Position of the cached sample, empty before the first read
        std::optional<Duration> last_sample_time() const { return m_last_sample_time; }
    };
}
