// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "animation/AnimationPlayerLayer.hpp"
#include "config/Settings.hpp"
#include "timeline/Timeline.hpp"

namespace rigtime
{
    /// @brief Playback cursor over a timeline
    ///
    /// Creates one player layer per timeline channel, addressed by make_layer_path().
    /// A freshly created player has a pending rewind, so the first play() starts from the playback start.
    /// Any explicit position change cancels a pending rewind.
    ///
    /// Layers refer back into the player, which is therefore neither copyable nor movable.
    class AnimationPlayer
    {
    public:
        /// @throws InvalidArgumentError Null timeline or negative update threshold
        explicit AnimationPlayer(std::shared_ptr<const Timeline> timeline, const PlayerSettings& settings = {});

        AnimationPlayer(const AnimationPlayer&) = delete;
        AnimationPlayer& operator=(const AnimationPlayer&) = delete;
        AnimationPlayer(AnimationPlayer&&) = delete;
        AnimationPlayer& operator=(AnimationPlayer&&) = delete;

        const Timeline& timeline() const { return *m_timeline; }

        Duration position() const { return m_position; }
        void set_position(Duration position);

        bool is_playing() const { return m_playing; }
        bool is_rewind_pending() const { return m_rewind_pending; }

        bool loop() const { return m_loop; }
        void set_loop(bool loop) { m_loop = loop; }

        Duration update_threshold() const { return m_update_threshold; }

        Duration playback_start() const { return m_playback_start; }
        Duration playback_end() const { return m_playback_end; }
        void set_playback_start(Duration start);
        void set_playback_end(Duration end);

        /// @brief Set the playback start from a marker position. Unknown markers are ignored.
        /// @return True if the marker exists
        bool set_playback_start_marker(const std::string& name);
        bool set_playback_end_marker(const std::string& name);
        const std::optional<std::string>& playback_start_marker() const { return m_playback_start_marker; }
        const std::optional<std::string>& playback_end_marker() const { return m_playback_end_marker; }

        /// @brief Start playback, from the playback start if a rewind is pending
        void play();
        void play(bool rewind);
        void pause();

        /// @brief Stop playback and return to the timeline start
        void stop();

        /// @brief Advance a playing cursor
        /// @throws InvalidArgumentError Negative delta
        void update(Duration delta);

        size_t layer_count() const { return m_layers.size(); }
        std::vector<std::string> layer_paths() const;
        bool has_layer(const std::string& path) const;

        /// @throws NotFoundError
        const IAnimationPlayerLayer& get_layer(const std::string& path) const;

        /// @throws NotFoundError Unknown path
        /// @throws TypeMismatchError Layer holds another value type
        template<Animatable T>
        const AnimationPlayerLayer<T>& get_layer(const std::string& path) const
        {
            const auto& layer = get_layer(path);
            if (!layer.holds<T>())
                throw TypeMismatchError("AnimationPlayer: layer '" + path + "' holds "
                    + std::string(layer.value_type_name()) + ", requested "
                    + std::string(entt::type_name<T>::value()));
            return static_cast<const AnimationPlayerLayer<T>&>(layer);
        }

        /// @brief Layer of the given path and type, or nullptr
        template<Animatable T>
        const AnimationPlayerLayer<T>* try_get_layer(const std::string& path) const
        {
            auto it = m_layer_lookup.find(path);
            if (it == m_layer_lookup.end() || !m_layers[it->second]->holds<T>())
                return nullptr;
            return static_cast<const AnimationPlayerLayer<T>*>(m_layers[it->second].get());
        }

    private:
        std::shared_ptr<const Timeline> m_timeline;

        Duration m_position{ 0 };
        Duration m_playback_start{ 0 };
        Duration m_playback_end{ 0 };
        Duration m_update_threshold{ 0 };
        bool m_playing = false;
        bool m_loop = false;
        bool m_rewind_pending = true;
        std::optional<std::string> m_playback_start_marker;
        std::optional<std::string> m_playback_end_marker;

        std::vector<std::unique_ptr<IAnimationPlayerLayer>> m_layers;
        std::unordered_map<std::string, size_t> m_layer_lookup;
    };
}
