// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "animation/AnimationPlayer.hpp"

#include "log/LogMacros.h"

namespace rigtime
{
    namespace
    {
        template<Animatable T>
        std::unique_ptr<IAnimationPlayerLayer> make_player_layer(
            std::string path,
            const ChannelPtr& channel,
            const Duration& position,
            Duration threshold)
        {
            return std::make_unique<AnimationPlayerLayer<T>>(
                std::move(path),
                std::static_pointer_cast<const TimelineChannel<T>>(channel),
                position,
                threshold);
        }

        std::unique_ptr<IAnimationPlayerLayer> make_player_layer(
            std::string path,
            const ChannelPtr& channel,
            const Duration& position,
            Duration threshold)
        {
            switch (channel->value_kind())
            {
            case ValueKind::Float: return make_player_layer<float>(std::move(path), channel, position, threshold);
            case ValueKind::Vec2: return make_player_layer<glm::vec2>(std::move(path), channel, position, threshold);
            case ValueKind::Vec3: return make_player_layer<glm::vec3>(std::move(path), channel, position, threshold);
            case ValueKind::Quat: return make_player_layer<glm::quat>(std::move(path), channel, position, threshold);
            case ValueKind::Mat4: return make_player_layer<glm::mat4>(std::move(path), channel, position, threshold);
            }
            throw InvalidArgumentError("AnimationPlayer: channel '" + channel->name() + "' has an unknown value kind");
        }
    }

    AnimationPlayer::AnimationPlayer(std::shared_ptr<const Timeline> timeline, const PlayerSettings& settings)
        : m_timeline(std::move(timeline))
    {
        if (!m_timeline)
            throw InvalidArgumentError("AnimationPlayer: null timeline");
        if (settings.update_threshold < Duration{ 0 })
            throw InvalidArgumentError("AnimationPlayer: negative update threshold");

        m_update_threshold = settings.update_threshold;
        m_loop = settings.loop;
        m_position = m_playback_start = m_timeline->start();
        m_playback_end = m_timeline->end();

        for (const auto& layer : m_timeline->layers())
        {
            for (const auto& channel : layer.channels())
            {
                auto path = make_layer_path(layer.identifier(), channel->name());
                m_layer_lookup.emplace(path, m_layers.size());
                m_layers.push_back(make_player_layer(std::move(path), channel, m_position, m_update_threshold));
            }
        }
    }

    void AnimationPlayer::set_position(Duration position)
    {
        m_position = position;
        m_rewind_pending = false;
    }

    void AnimationPlayer::set_playback_start(Duration start)
    {
        m_playback_start = start;
        m_playback_start_marker.reset();
    }

    void AnimationPlayer::set_playback_end(Duration end)
    {
        m_playback_end = end;
        m_playback_end_marker.reset();
    }

    bool AnimationPlayer::set_playback_start_marker(const std::string& name)
    {
        const Marker* marker = m_timeline->try_get_marker(name);
        if (!marker)
        {
            RIGTIME_LOG_WARN("Playback start marker '%s' not found, start kept", name.c_str());
            return false;
        }
        m_playback_start = marker->position;
        m_playback_start_marker = name;
        return true;
    }

    bool AnimationPlayer::set_playback_end_marker(const std::string& name)
    {
        const Marker* marker = m_timeline->try_get_marker(name);
        if (!marker)
        {
            RIGTIME_LOG_WARN("Playback end marker '%s' not found, end kept", name.c_str());
            return false;
        }
        m_playback_end = marker->position;
        m_playback_end_marker = name;
        return true;
    }

    void AnimationPlayer::play()
    {
        if (m_rewind_pending)
            set_position(m_playback_start);
        m_playing = true;
    }

    void AnimationPlayer::play(bool rewind)
    {
        if (rewind)
            m_rewind_pending = true;
        play();
    }

    void AnimationPlayer::pause()
    {
        m_playing = false;
    }

    void AnimationPlayer::stop()
    {
        set_position(m_timeline->start());
        m_playing = false;
    }

    void AnimationPlayer::update(Duration delta)
    {
        if (delta < Duration{ 0 })
            throw InvalidArgumentError("AnimationPlayer: negative time delta");

        if (m_playback_end < m_playback_start)
            m_playing = false;
        if (!m_playing)
            return;

        const Duration new_position = m_position + delta;
        if (new_position <= m_playback_end)
        {
            set_position(new_position);
            return;
        }

        if (m_loop)
        {
            const Duration range = m_playback_end - m_playback_start;
            const Duration overshoot = new_position - m_playback_end;
            set_position(range > Duration{ 0 } ? m_playback_start + overshoot % range : m_playback_start);
        }
        else
        {
            set_position(m_playback_end);
            m_playing = false;
        }
    }

    std::vector<std::string> AnimationPlayer::layer_paths() const
    {
        std::vector<std::string> paths;
        paths.reserve(m_layers.size());
        for (const auto& layer : m_layers)
            paths.push_back(layer->path());
        return paths;
    }

    bool AnimationPlayer::has_layer(const std::string& path) const
    {
        return m_layer_lookup.contains(path);
    }

    const IAnimationPlayerLayer& AnimationPlayer::get_layer(const std::string& path) const
    {
        auto it = m_layer_lookup.find(path);
        if (it == m_layer_lookup.end())
            throw NotFoundError("AnimationPlayer: no layer '" + path + "'");
        return *m_layers[it->second];
    }
}
