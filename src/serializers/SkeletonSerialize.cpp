// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/SkeletonSerialize.hpp"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "Errors.hpp"
#include "serializers/GLMSerialize.hpp"
#include "skeleton/Skeleton.hpp"
#include "log/LogMacros.h"

namespace rigtime::serializers
{
    namespace
    {
        nlohmann::json serialize_bone(const Bone& bone)
        {
            nlohmann::json elem;
            elem["identifier"] = bone.identifier() ? nlohmann::json(*bone.identifier()) : nlohmann::json(nullptr);
            elem["index"] = bone.index() ? nlohmann::json(*bone.index()) : nlohmann::json(nullptr);
            elem["offset"] = serialize_mat4(bone.offset());
            return elem;
        }

        Bone deserialize_bone(const nlohmann::json& elem)
        {
            std::optional<std::string> identifier;
            if (elem.contains("identifier") && !elem["identifier"].is_null())
                identifier = elem["identifier"].get<std::string>();

            std::optional<uint8_t> index;
            if (elem.contains("index") && !elem["index"].is_null())
            {
                const auto value = elem["index"].get<int>();
                if (value < 0 || value > 255)
                    throw FormatError("Skeleton: bone index " + std::to_string(value) + " out of range");
                index = static_cast<uint8_t>(value);
            }

            glm::mat4 offset{ 1.0f };
            if (elem.contains("offset"))
                offset = deserialize_mat4(elem["offset"]);

            return Bone{ std::move(identifier), index, offset };
        }
    }

    nlohmann::json serialize_skeleton(const Skeleton& skeleton)
    {
        nlohmann::json j = nlohmann::json::array();
        auto& arr = j.get_ref<nlohmann::json::array_t&>();
        arr.resize(skeleton.size());
        skeleton.tree().traverse_depthfirst([&](const Bone* bone,
            const Bone*,
            size_t position,
            size_t parent_position)
            {
                nlohmann::json elem = serialize_bone(*bone);
                elem["parent_index"] = parent_position == NodeTree_NullIndex
                    ? -1
                    : static_cast<int>(parent_position);
                arr[position] = std::move(elem);
            });
        return j;
    }

    Skeleton deserialize_skeleton(const nlohmann::json& j)
    {
        if (!j.is_array() || j.empty())
            throw FormatError("Skeleton: expected a non-empty array of bones");

        try
        {
            if (j[0].value("parent_index", -1) != -1)
                throw FormatError("Skeleton: first bone must be the root");

            const Bone root = deserialize_bone(j[0]);
            Skeleton skeleton(root.offset());

            // Parents precede children in the document
            std::vector<size_t> nodes(j.size());
            nodes[0] = skeleton.root();
            for (size_t i = 1; i < j.size(); ++i)
            {
                const int parent_index = j[i].value("parent_index", -1);
                if (parent_index < 0 || static_cast<size_t>(parent_index) >= i)
                    throw FormatError("Skeleton: bone " + std::to_string(i)
                        + " has invalid parent_index " + std::to_string(parent_index));
                nodes[i] = skeleton.add_bone(deserialize_bone(j[i]), nodes[static_cast<size_t>(parent_index)]);
            }
            return skeleton;
        }
        catch (const nlohmann::json::exception& e)
        {
            RIGTIME_LOG_ERROR("Skeleton document rejected: %s", e.what());
            throw FormatError(std::string("Skeleton: ") + e.what());
        }
    }
}
