// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "NodeTree.h"
#include "skeleton/Bone.hpp"

namespace rigtime
{
    using BoneTree = NodeTree<Bone>;

    /// @brief Rooted hierarchy of bones
    ///
    /// The tree always starts with a synthetic root bone named "_root" that carries no deformer index
    /// and whose offset is the root transformation. Bones are addressed by the node index handed out
    /// by add_bone(), which is unrelated to Bone::index().
    ///
    /// A read-only skeleton rejects every mutation with ReadOnlyError. It is either a view sharing the
    /// source tree (later edits of the source show through) or a detached deep copy.
    ///
    /// Copies are deep and keep the read-only flag; only to_read_only(false) shares a tree.
    /// A moved-from skeleton may only be assigned to or destroyed.
    class Skeleton
    {
    public:
        static constexpr const char* root_bone_name = "_root";

        explicit Skeleton(const glm::mat4& root_transformation = glm::mat4{ 1.0f });

        Skeleton(const Skeleton& other);
        Skeleton& operator=(const Skeleton& other);
        Skeleton(Skeleton&&) noexcept = default;
        Skeleton& operator=(Skeleton&&) noexcept = default;

        bool is_read_only() const { return m_read_only; }

        /// @brief Node index of the root bone
        size_t root() const;
        const Bone& root_bone() const;

        /// @brief Attach a bone as the last child of parent_node
        /// @return Node index of the new bone
        /// @throws ReadOnlyError, NotFoundError
        size_t add_bone(const Bone& bone, size_t parent_node);

        /// @brief Attach a bone directly below the root
        size_t add_bone(const Bone& bone);

        /// @brief Remove a bone together with its descendants
        /// @throws ReadOnlyError, NotFoundError, InvalidArgumentError for the root
        void remove_bone(size_t node);

        /// @brief Replace the value of a bone, keeping its place in the hierarchy
        /// @throws ReadOnlyError, NotFoundError
        void set_bone(size_t node, const Bone& bone);

        /// @throws NotFoundError
        const Bone& get_bone(size_t node) const;
        bool contains(size_t node) const;

        /// @brief Node index of the parent, empty for the root
        /// @throws NotFoundError
        std::optional<size_t> parent_of(size_t node) const;
        std::vector<size_t> children_of(size_t node) const;

        /// @brief First bone with the identifier in depth-first order
        std::optional<size_t> find_bone(const std::string& identifier) const;

        /// @brief Number of bones including the root
        size_t size() const { return m_tree->size(); }

        std::optional<uint8_t> highest_bone_index() const;

        /// @brief Read-only counterpart, sharing this tree or a deep copy of it
        Skeleton to_read_only(bool clone) const;

        const BoneTree& tree() const { return *m_tree; }

    private:
        Skeleton(std::shared_ptr<BoneTree> tree, bool read_only);

        void ensure_writable(const char* operation) const;
        void ensure_exists(size_t node) const;

        std::shared_ptr<BoneTree> m_tree;
        bool m_read_only = false;
    };
}
