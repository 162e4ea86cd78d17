// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "timeline/TimelineLayer.hpp"

#include <algorithm>
#include <sstream>

namespace rigtime
{
    std::string make_layer_path(const std::string& layer_identifier, const std::string& channel_name)
    {
        if (channel_name.empty())
            return layer_identifier;
        return layer_identifier + "_" + channel_name;
    }

    TimelineLayer::TimelineLayer(std::string identifier, std::vector<ChannelPtr> channels)
        : m_identifier(std::move(identifier))
    {
        std::unordered_map<std::string, size_t> lookup;
        for (size_t i = 0; i < channels.size(); ++i)
        {
            if (!channels[i])
                throw InvalidArgumentError("Layer '" + m_identifier + "': null channel");
            if (!lookup.emplace(channels[i]->name(), i).second)
                throw DuplicateKeyError("Layer '" + m_identifier + "': duplicate channel '" + channels[i]->name() + "'");
        }

        // Bounds cover keyframe-carrying channels; empty channels report zero bounds and are skipped
        bool first = true;
        for (const auto& channel : channels)
        {
            if (!channel->has_keyframes())
                continue;
            m_has_keyframes = true;
            m_start = first ? channel->start() : std::min(m_start, channel->start());
            m_end = first ? channel->end() : std::max(m_end, channel->end());
            first = false;
        }

        m_channels = std::move(channels);
        m_channel_lookup = std::move(lookup);
    }

    bool TimelineLayer::has_channel(const std::string& name) const
    {
        return m_channel_lookup.contains(name);
    }

    const ChannelPtr& TimelineLayer::get_channel(const std::string& name) const
    {
        auto it = m_channel_lookup.find(name);
        if (it == m_channel_lookup.end())
            throw NotFoundError("Layer '" + m_identifier + "': no channel '" + name + "'");
        return m_channels[it->second];
    }

    const ITimelineChannel* TimelineLayer::try_get_channel(const std::string& name) const
    {
        auto it = m_channel_lookup.find(name);
        return it == m_channel_lookup.end() ? nullptr : m_channels[it->second].get();
    }

    std::string TimelineLayer::to_string() const
    {
        std::ostringstream oss;
        oss << '"' << m_identifier << "\" (Channels: " << m_channels.size()
            << ", Length: " << to_seconds(length()) << "s)";
        return oss.str();
    }
}
