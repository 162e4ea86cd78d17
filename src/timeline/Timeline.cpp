// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "timeline/Timeline.hpp"

#include <algorithm>
#include <unordered_set>

namespace rigtime
{
    Timeline::Timeline(std::vector<TimelineLayer> layers, std::vector<Marker> markers)
    {
        std::unordered_map<std::string, size_t> layer_lookup;
        std::unordered_set<std::string> layer_paths;
        for (size_t i = 0; i < layers.size(); ++i)
        {
            const auto& layer = layers[i];
            if (!layer_lookup.emplace(layer.identifier(), i).second)
                throw DuplicateKeyError("Timeline: duplicate layer '" + layer.identifier() + "'");

            for (const auto& channel : layer.channels())
            {
                auto path = make_layer_path(layer.identifier(), channel->name());
                if (!layer_paths.insert(path).second)
                    throw DuplicateKeyError("Timeline: layer path '" + path + "' is ambiguous");
            }
        }

        std::stable_sort(markers.begin(), markers.end(),
            [](const Marker& a, const Marker& b)
            {
                return a.position < b.position;
            });

        std::unordered_map<std::string, size_t> marker_lookup;
        for (size_t i = 0; i < markers.size(); ++i)
        {
            if (!marker_lookup.emplace(markers[i].name, i).second)
                throw DuplicateKeyError("Timeline: duplicate marker '" + markers[i].name + "'");
        }

        bool first = true;
        auto extend = [&](Duration start, Duration end)
            {
                m_start = first ? start : std::min(m_start, start);
                m_end = first ? end : std::max(m_end, end);
                first = false;
            };
        for (const auto& layer : layers)
            if (layer.has_keyframes()) extend(layer.start(), layer.end());
        for (const auto& marker : markers)
            extend(marker.position, marker.position);

        m_layers = std::move(layers);
        m_markers = std::move(markers);
        m_layer_lookup = std::move(layer_lookup);
        m_marker_lookup = std::move(marker_lookup);
    }

    bool Timeline::has_layer(const std::string& identifier) const
    {
        return m_layer_lookup.contains(identifier);
    }

    const TimelineLayer& Timeline::get_layer(const std::string& identifier) const
    {
        auto layer = try_get_layer(identifier);
        if (!layer)
            throw NotFoundError("Timeline: no layer '" + identifier + "'");
        return *layer;
    }

    const TimelineLayer* Timeline::try_get_layer(const std::string& identifier) const
    {
        auto it = m_layer_lookup.find(identifier);
        return it == m_layer_lookup.end() ? nullptr : &m_layers[it->second];
    }

    bool Timeline::has_marker(const std::string& name) const
    {
        return m_marker_lookup.contains(name);
    }

    const Marker& Timeline::get_marker(const std::string& name) const
    {
        return m_markers[marker_index(name)];
    }

    const Marker* Timeline::try_get_marker(const std::string& name) const
    {
        auto it = m_marker_lookup.find(name);
        return it == m_marker_lookup.end() ? nullptr : &m_markers[it->second];
    }

    size_t Timeline::marker_index(const std::string& name) const
    {
        auto it = m_marker_lookup.find(name);
        if (it == m_marker_lookup.end())
            throw NotFoundError("Timeline: no marker '" + name + "'");
        return it->second;
    }
}
