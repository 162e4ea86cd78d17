// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "animation/DeformerAnimationPlayer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "log/LogMacros.h"

namespace rigtime
{
    namespace
    {
        template<Animatable T>
        const AnimationPlayerLayer<T>* resolve_layer(const AnimationPlayer& player, const std::string& path, bool report)
        {
            if (!player.has_layer(path))
                return nullptr;

            auto layer = player.try_get_layer<T>(path);
            if (!layer && report)
            {
                const auto& found = player.get_layer(path);
                RIGTIME_LOG_WARN("Layer '%s' holds %.*s where %.*s was expected, ignored",
                    path.c_str(),
                    static_cast<int>(found.value_type_name().size()), found.value_type_name().data(),
                    static_cast<int>(entt::type_name<T>::value().size()), entt::type_name<T>::value().data());
            }
            return layer;
        }
    }

    glm::mat4 DeformerAnimationPlayer::LayerSet::relative_transform() const
    {
        if (transformation)
            return transformation->current_value();
        if (empty())
            return glm::mat4{ 1.0f };

        return create_transformation(
            position ? position->current_value() : glm::vec3{ 0.0f },
            scale ? scale->current_value() : glm::vec3{ 1.0f },
            rotation ? rotation->current_value() : glm::quat{ 1.0f, 0.0f, 0.0f, 0.0f });
    }

    DeformerAnimationPlayer::DeformerAnimationPlayer(
        std::shared_ptr<const Timeline> timeline,
        const Skeleton& skeleton,
        const DeformerSettings& settings)
        : m_primary(timeline, settings.player)
        , m_overlay(timeline, settings.player)
    {
        set_overlay_influence(settings.overlay_influence);

        m_highest_bone_index = skeleton.highest_bone_index();
        if (m_highest_bone_index && static_cast<size_t>(*m_highest_bone_index) + 1 > Deformer::maximum_size)
            throw CapacityExceededError("DeformerAnimationPlayer: bone index "
                + std::to_string(static_cast<unsigned>(*m_highest_bone_index))
                + " does not fit a deformer of at most " + std::to_string(Deformer::maximum_size) + " matrices");

        m_attachments = skeleton.tree().convert<BoneAttachment>([this](const Bone& bone)
            {
                return BoneAttachment{
                    .bone = bone,
                    .primary = resolve_layers(m_primary, bone, true),
                    .overlay = resolve_layers(m_overlay, bone, false) };
            });

        RIGTIME_LOG_INFO("Deformer player: %zu of %zu bones attached",
            attached_bone_count(), m_attachments.size());
    }

    DeformerAnimationPlayer::LayerSet DeformerAnimationPlayer::resolve_layers(
        const AnimationPlayer& player,
        const Bone& bone,
        bool report)
    {
        LayerSet layers;
        if (!bone.identifier())
            return layers;

        const std::string& id = *bone.identifier();
        layers.transformation = resolve_layer<glm::mat4>(player, id, report);
        if (layers.transformation)
            return layers;

        layers.position = resolve_layer<glm::vec3>(player, id + position_layer_suffix, report);
        layers.scale = resolve_layer<glm::vec3>(player, id + scale_layer_suffix, report);
        layers.rotation = resolve_layer<glm::quat>(player, id + rotation_layer_suffix, report);
        return layers;
    }

    void DeformerAnimationPlayer::set_overlay_influence(float influence)
    {
        m_overlay_influence = std::isnan(influence) ? 0.0f : std::clamp(influence, 0.0f, 1.0f);
    }

    void DeformerAnimationPlayer::update(Duration delta)
    {
        if (delta < Duration{ 0 })
            throw InvalidArgumentError("DeformerAnimationPlayer: negative time delta");
        m_primary.update(delta);
        m_overlay.update(delta);
    }

    bool DeformerAnimationPlayer::is_bone_attached(const std::string& identifier) const
    {
        const size_t node = m_attachments.find_node_index_if([&identifier](const BoneAttachment& attachment)
            {
                return attachment.attached()
                    && attachment.bone.identifier()
                    && *attachment.bone.identifier() == identifier;
            });
        return node != NodeTree_NullIndex;
    }

    size_t DeformerAnimationPlayer::attached_bone_count() const
    {
        size_t count = 0;
        m_attachments.traverse_depthfirst([&count](const BoneAttachment* attachment, const BoneAttachment*, size_t, size_t)
            {
                if (attachment->attached()) count++;
            });
        return count;
    }

    glm::mat4 DeformerAnimationPlayer::animated_transform(const BoneAttachment& attachment) const
    {
        if (!attachment.attached())
            return glm::mat4{ 1.0f };
        return Interpolator<glm::mat4>::linear(
            attachment.primary.relative_transform(),
            attachment.overlay.relative_transform(),
            m_overlay_influence);
    }

    Deformer DeformerAnimationPlayer::current_deformer() const
    {
        const size_t size = m_highest_bone_index ? static_cast<size_t>(*m_highest_bone_index) + 1 : 0;
        std::vector<glm::mat4> matrices(size, glm::mat4{ 1.0f });

        // Absolute transforms by tree position; parents precede their descendants
        std::vector<glm::mat4> absolute(m_attachments.size(), glm::mat4{ 1.0f });
        m_attachments.traverse_depthfirst(
            [&](const BoneAttachment* attachment, const BoneAttachment*, size_t pos, size_t parent_pos)
            {
                const glm::mat4& parent_absolute =
                    parent_pos != NodeTree_NullIndex ? absolute[parent_pos] : glm::mat4{ 1.0f };
                absolute[pos] = parent_absolute * animated_transform(*attachment);

                if (auto index = attachment->bone.index())
                    matrices[*index] = absolute[pos] * attachment->bone.offset();
            });

        return Deformer::create(std::move(matrices));
    }
}
