// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/TimelineSerialize.hpp"

#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>

#include "serializers/GLMSerialize.hpp"
#include "timeline/Timeline.hpp"
#include "log/LogMacros.h"

namespace rigtime::serializers
{
    namespace
    {
        nlohmann::json serialize_value(float v) { return v; }
        nlohmann::json serialize_value(const glm::vec2& v) { return serialize_vec2(v); }
        nlohmann::json serialize_value(const glm::vec3& v) { return serialize_vec3(v); }
        nlohmann::json serialize_value(const glm::quat& q) { return serialize_quat(q); }
        nlohmann::json serialize_value(const glm::mat4& m) { return serialize_mat4(m); }

        template<Animatable T>
        T deserialize_value(const nlohmann::json& j)
        {
            if constexpr (std::is_same_v<T, float>)
            {
                if (!j.is_number())
                    throw FormatError("Keyframe value: expected a number");
                return j.get<float>();
            }
            else if constexpr (std::is_same_v<T, glm::vec2>) return deserialize_vec2(j);
            else if constexpr (std::is_same_v<T, glm::vec3>) return deserialize_vec3(j);
            else if constexpr (std::is_same_v<T, glm::quat>) return deserialize_quat(j);
            else return deserialize_mat4(j);
        }

        template<Animatable T>
        nlohmann::json serialize_keyframes(const ITimelineChannel& channel)
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& keyframe : static_cast<const TimelineChannel<T>&>(channel).keyframes())
            {
                j.push_back({
                    { "position_us", keyframe.position().count() },
                    { "value", serialize_value(keyframe.value()) } });
            }
            return j;
        }

        nlohmann::json serialize_keyframes(const ITimelineChannel& channel)
        {
            switch (channel.value_kind())
            {
            case ValueKind::Float: return serialize_keyframes<float>(channel);
            case ValueKind::Vec2: return serialize_keyframes<glm::vec2>(channel);
            case ValueKind::Vec3: return serialize_keyframes<glm::vec3>(channel);
            case ValueKind::Quat: return serialize_keyframes<glm::quat>(channel);
            case ValueKind::Mat4: return serialize_keyframes<glm::mat4>(channel);
            }
            throw FormatError("Channel '" + channel.name() + "': unknown value kind");
        }

        Duration deserialize_position(const nlohmann::json& j)
        {
            const auto& position = j.at("position_us");
            if (!position.is_number_integer())
                throw FormatError("Expected an integer 'position_us'");
            return Duration{ position.get<Duration::rep>() };
        }

        template<Animatable T>
        ChannelPtr deserialize_channel(
            std::string name,
            InterpolationMethod interpolation,
            const nlohmann::json& keyframes_json)
        {
            std::vector<Keyframe<T>> keyframes;
            keyframes.reserve(keyframes_json.size());
            for (const auto& elem : keyframes_json)
                keyframes.emplace_back(deserialize_position(elem), deserialize_value<T>(elem.at("value")));
            return std::make_shared<const TimelineChannel<T>>(std::move(name), std::move(keyframes), interpolation);
        }

        ChannelPtr deserialize_channel(const nlohmann::json& j)
        {
            std::string name = j.value("name", "");
            const std::string type = j.at("type").get<std::string>();
            const std::string method = j.value("interpolation", "linear");

            auto kind = value_kind_from_string(type);
            if (!kind)
                throw FormatError("Channel '" + name + "': unknown value type '" + type + "'");
            auto interpolation = interpolation_method_from_string(method);
            if (!interpolation)
                throw FormatError("Channel '" + name + "': unknown interpolation '" + method + "'");

            const auto& keyframes = j.at("keyframes");
            if (!keyframes.is_array())
                throw FormatError("Channel '" + name + "': 'keyframes' is not an array");

            switch (*kind)
            {
            case ValueKind::Float: return deserialize_channel<float>(std::move(name), *interpolation, keyframes);
            case ValueKind::Vec2: return deserialize_channel<glm::vec2>(std::move(name), *interpolation, keyframes);
            case ValueKind::Vec3: return deserialize_channel<glm::vec3>(std::move(name), *interpolation, keyframes);
            case ValueKind::Quat: return deserialize_channel<glm::quat>(std::move(name), *interpolation, keyframes);
            case ValueKind::Mat4: return deserialize_channel<glm::mat4>(std::move(name), *interpolation, keyframes);
            }
            throw FormatError("Channel '" + name + "': unknown value type");
        }

        const nlohmann::json& array_or_empty(const nlohmann::json& j, const char* key)
        {
            static const nlohmann::json empty = nlohmann::json::array();
            if (!j.contains(key))
                return empty;
            const auto& value = j.at(key);
            if (!value.is_array())
                throw FormatError(std::string("Timeline: '") + key + "' is not an array");
            return value;
        }
    }

    nlohmann::json serialize_timeline(const Timeline& timeline)
    {
        nlohmann::json j;

        nlohmann::json markers = nlohmann::json::array();
        for (const auto& marker : timeline.markers())
            markers.push_back({ { "name", marker.name }, { "position_us", marker.position.count() } });
        j["markers"] = std::move(markers);

        nlohmann::json layers = nlohmann::json::array();
        for (const auto& layer : timeline.layers())
        {
            nlohmann::json channels = nlohmann::json::array();
            for (const auto& channel : layer.channels())
            {
                channels.push_back({
                    { "name", channel->name() },
                    { "type", to_string(channel->value_kind()) },
                    { "interpolation", to_string(channel->interpolation()) },
                    { "keyframes", serialize_keyframes(*channel) } });
            }
            layers.push_back({ { "identifier", layer.identifier() }, { "channels", std::move(channels) } });
        }
        j["layers"] = std::move(layers);

        return j;
    }

    std::shared_ptr<const Timeline> deserialize_timeline(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw FormatError("Timeline: expected an object");

        try
        {
            std::vector<Marker> markers;
            for (const auto& elem : array_or_empty(j, "markers"))
                markers.push_back(Marker{ elem.at("name").get<std::string>(), deserialize_position(elem) });

            std::vector<TimelineLayer> layers;
            for (const auto& elem : array_or_empty(j, "layers"))
            {
                std::vector<ChannelPtr> channels;
                for (const auto& channel : array_or_empty(elem, "channels"))
                    channels.push_back(deserialize_channel(channel));
                layers.emplace_back(elem.at("identifier").get<std::string>(), std::move(channels));
            }

            return std::make_shared<const Timeline>(std::move(layers), std::move(markers));
        }
        catch (const nlohmann::json::exception& e)
        {
            RIGTIME_LOG_ERROR("Timeline document rejected: %s", e.what());
            throw FormatError(std::string("Timeline: ") + e.what());
        }
    }
}
