// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "timeline/TimelineChannel.hpp"

namespace rigtime
{
    using ChannelPtr = std::shared_ptr<const ITimelineChannel>;

    /// @brief Address of a channel among the layers of a player:
    ///        the layer identifier, or "<layer>_<channel>" for a named channel
    std::string make_layer_path(const std::string& layer_identifier, const std::string& channel_name);

    /// @brief Named group of channels, e.g. all channels driving one bone
    class TimelineLayer
    {
    public:
        /// @throws DuplicateKeyError Two channels share a name
        /// @throws InvalidArgumentError A channel is null
        TimelineLayer(std::string identifier, std::vector<ChannelPtr> channels);

        const std::string& identifier() const { return m_identifier; }

        size_t channel_count() const { return m_channels.size(); }
        bool has_channels() const { return !m_channels.empty(); }
        bool has_keyframes() const { return m_has_keyframes; }

        Duration start() const { return m_start; }
        Duration end() const { return m_end; }
        Duration length() const { return m_end - m_start; }

        /// @brief Channels in construction order
        const std::vector<ChannelPtr>& channels() const { return m_channels; }

        bool has_channel(const std::string& name) const;

        /// @throws NotFoundError
        const ChannelPtr& get_channel(const std::string& name) const;
        const ITimelineChannel* try_get_channel(const std::string& name) const;

        /// @throws NotFoundError Unknown channel
        /// @throws TypeMismatchError Channel holds another value type
        template<Animatable T>
        const TimelineChannel<T>& get_channel(const std::string& name) const
        {
            const auto& channel = get_channel(name);
            if (!channel->holds<T>())
                throw TypeMismatchError("Layer '" + m_identifier + "': channel '" + name + "' holds "
                    + std::string(channel->value_type_name()) + ", requested "
                    + std::string(entt::type_name<T>::value()));
            return static_cast<const TimelineChannel<T>&>(*channel);
        }

        std::string to_string() const;

    private:
        std::string m_identifier;
        std::vector<ChannelPtr> m_channels;
        std::unordered_map<std::string, size_t> m_channel_lookup;
        Duration m_start{ 0 };
        Duration m_end{ 0 };
        bool m_has_keyframes = false;
    };
}
