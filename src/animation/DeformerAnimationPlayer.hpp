// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "NodeTree.h"
#include "animation/AnimationPlayer.hpp"
#include "config/Settings.hpp"
#include "skeleton/Deformer.hpp"
#include "skeleton/Skeleton.hpp"

namespace rigtime
{
    /// @brief Animates a skeleton with a primary and an overlay player and produces deformers
    ///
    /// A bone with identifier "arm" is driven by a mat4 layer "arm" if there is one, else by any of
    /// the vec3 layer "arm_position", the vec3 layer "arm_scale" and the quat layer "arm_rotation".
    /// Bones without matching layers are unattached and contribute identity.
    ///
    /// Bone-to-layer attachments are resolved once, at construction. Timelines are immutable,
    /// so there is no refresh.
    class DeformerAnimationPlayer
    {
    public:
        static constexpr const char* position_layer_suffix = "_position";
        static constexpr const char* scale_layer_suffix = "_scale";
        static constexpr const char* rotation_layer_suffix = "_rotation";

        /// @throws InvalidArgumentError Null timeline
        /// @throws CapacityExceededError Bone indices that do not fit a deformer
        DeformerAnimationPlayer(
            std::shared_ptr<const Timeline> timeline,
            const Skeleton& skeleton,
            const DeformerSettings& settings = {});

        DeformerAnimationPlayer(const DeformerAnimationPlayer&) = delete;
        DeformerAnimationPlayer& operator=(const DeformerAnimationPlayer&) = delete;

        AnimationPlayer& primary() { return m_primary; }
        const AnimationPlayer& primary() const { return m_primary; }
        AnimationPlayer& overlay() { return m_overlay; }
        const AnimationPlayer& overlay() const { return m_overlay; }

        float overlay_influence() const { return m_overlay_influence; }

        /// @brief Blend weight of the overlay player, clamped to [0, 1]
        void set_overlay_influence(float influence);

        bool is_playing() const { return m_primary.is_playing() || m_overlay.is_playing(); }

        /// @brief Advance both players
        /// @throws InvalidArgumentError Negative delta
        void update(Duration delta);

        /// @brief True if some bone with the identifier is driven by a layer
        bool is_bone_attached(const std::string& identifier) const;
        size_t attached_bone_count() const;

        /// @brief Deformer sized to the highest bone index + 1 for the current player positions.
        ///        Slots of bones that are missing hold identity. If two bones share an index, the
        ///        one visited last in depth-first order wins.
        Deformer current_deformer() const;

    private:
        /// Layers driving one bone in one player
        struct LayerSet
        {
            const AnimationPlayerLayer<glm::mat4>* transformation = nullptr;
            const AnimationPlayerLayer<glm::vec3>* position = nullptr;
            const AnimationPlayerLayer<glm::vec3>* scale = nullptr;
            const AnimationPlayerLayer<glm::quat>* rotation = nullptr;

            bool empty() const { return !transformation && !position && !scale && !rotation; }
            glm::mat4 relative_transform() const;
        };

        struct BoneAttachment
        {
            Bone bone;
            LayerSet primary;
            LayerSet overlay;

            bool attached() const { return !primary.empty(); }
        };

        /// Both players share the timeline, so type mismatches are reported for one of them only
        static LayerSet resolve_layers(const AnimationPlayer& player, const Bone& bone, bool report);
        glm::mat4 animated_transform(const BoneAttachment& attachment) const;

        AnimationPlayer m_primary;
        AnimationPlayer m_overlay;
        float m_overlay_influence = 0.0f;
        NodeTree<BoneAttachment> m_attachments;
        std::optional<uint8_t> m_highest_bone_index;
    };
}
