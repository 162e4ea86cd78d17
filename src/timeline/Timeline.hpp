// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "timeline/Marker.hpp"
#include "timeline/TimelineLayer.hpp"

namespace rigtime
{
    /// @brief Immutable set of layers and markers
    /// Layer identifiers, marker names and the layer paths of all channels are unique.
    /// Start and end span every keyframe-carrying layer and every marker.
    class Timeline
    {
    public:
        /// @throws DuplicateKeyError Duplicate layer identifier, marker name or channel layer path
        Timeline(std::vector<TimelineLayer> layers, std::vector<Marker> markers = {});

        Duration start() const { return m_start; }
        Duration end() const { return m_end; }
        Duration length() const { return m_end - m_start; }

        const std::vector<TimelineLayer>& layers() const { return m_layers; }
        size_t layer_count() const { return m_layers.size(); }
        bool has_layer(const std::string& identifier) const;

        /// @throws NotFoundError
        const TimelineLayer& get_layer(const std::string& identifier) const;
        const TimelineLayer* try_get_layer(const std::string& identifier) const;

        /// @brief Markers ordered by position, ties in construction order
        const std::vector<Marker>& markers() const { return m_markers; }
        size_t marker_count() const { return m_markers.size(); }
        bool has_marker(const std::string& name) const;

        /// @throws NotFoundError
        const Marker& get_marker(const std::string& name) const;
        const Marker* try_get_marker(const std::string& name) const;

        /// @brief Rank of a marker in position order
        /// @throws NotFoundError
        size_t marker_index(const std::string& name) const;

    private:
        std::vector<TimelineLayer> m_layers;
        std::vector<Marker> m_markers;
        std::unordered_map<std::string, size_t> m_layer_lookup;
        std::unordered_map<std::string, size_t> m_marker_lookup;
        Duration m_start{ 0 };
        Duration m_end{ 0 };
    };
}
