// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "skeleton/Skeleton.hpp"

#include <algorithm>

#include "Errors.hpp"

namespace rigtime
{
    Skeleton::Skeleton(const glm::mat4& root_transformation)
        : m_tree(std::make_shared<BoneTree>())
    {
        m_tree->insert_as_root(Bone{ root_bone_name, std::nullopt, root_transformation });
    }

    Skeleton::Skeleton(std::shared_ptr<BoneTree> tree, bool read_only)
        : m_tree(std::move(tree)), m_read_only(read_only)
    {
    }

    Skeleton::Skeleton(const Skeleton& other)
        : m_tree(std::make_shared<BoneTree>(*other.m_tree)), m_read_only(other.m_read_only)
    {
    }

    Skeleton& Skeleton::operator=(const Skeleton& other)
    {
        if (this != &other)
        {
            m_tree = std::make_shared<BoneTree>(*other.m_tree);
            m_read_only = other.m_read_only;
        }
        return *this;
    }

    size_t Skeleton::root() const
    {
        return m_tree->node_index_at(0);
    }

    const Bone& Skeleton::root_bone() const
    {
        return m_tree->get_payload_at(0);
    }

    size_t Skeleton::add_bone(const Bone& bone, size_t parent_node)
    {
        ensure_writable("add_bone");
        ensure_exists(parent_node);
        return m_tree->insert(bone, parent_node);
    }

    size_t Skeleton::add_bone(const Bone& bone)
    {
        return add_bone(bone, root());
    }

    void Skeleton::remove_bone(size_t node)
    {
        ensure_writable("remove_bone");
        ensure_exists(node);
        if (node == root())
            throw InvalidArgumentError("Skeleton: the root bone cannot be removed");
        m_tree->erase_branch(node);
    }

    void Skeleton::set_bone(size_t node, const Bone& bone)
    {
        ensure_writable("set_bone");
        ensure_exists(node);
        m_tree->get_payload(node) = bone;
    }

    const Bone& Skeleton::get_bone(size_t node) const
    {
        ensure_exists(node);
        return m_tree->get_payload(node);
    }

    bool Skeleton::contains(size_t node) const
    {
        return m_tree->contains(node);
    }

    std::optional<size_t> Skeleton::parent_of(size_t node) const
    {
        ensure_exists(node);
        const size_t parent = m_tree->get_parent(node);
        if (parent == NodeTree_NullIndex)
            return std::nullopt;
        return parent;
    }

    std::vector<size_t> Skeleton::children_of(size_t node) const
    {
        ensure_exists(node);
        return m_tree->get_children(node);
    }

    std::optional<size_t> Skeleton::find_bone(const std::string& identifier) const
    {
        const size_t node = m_tree->find_node_index_if([&identifier](const Bone& bone)
            {
                return bone.identifier() && *bone.identifier() == identifier;
            });
        if (node == NodeTree_NullIndex)
            return std::nullopt;
        return node;
    }

    std::optional<uint8_t> Skeleton::highest_bone_index() const
    {
        std::optional<uint8_t> highest;
        m_tree->traverse_depthfirst([&highest](const Bone* bone, const Bone*, size_t, size_t)
            {
                if (bone->index() && (!highest || *bone->index() > *highest))
                    highest = bone->index();
            });
        return highest;
    }

    Skeleton Skeleton::to_read_only(bool clone) const
    {
        if (clone)
            return Skeleton(std::make_shared<BoneTree>(*m_tree), true);
        return Skeleton(m_tree, true);
    }

    void Skeleton::ensure_writable(const char* operation) const
    {
        if (m_read_only)
            throw ReadOnlyError(std::string("Skeleton::") + operation + ": skeleton is read-only");
    }

    void Skeleton::ensure_exists(size_t node) const
    {
        if (!m_tree->contains(node))
            throw NotFoundError("Skeleton: no bone with node index " + std::to_string(node));
    }
}
