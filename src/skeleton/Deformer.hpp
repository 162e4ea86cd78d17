// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include <vector>

#include <glm/glm.hpp>

namespace rigtime
{
    /// @brief Immutable flat array of bone transformations, indexed by Bone::index(), used for skinning
    class Deformer
    {
    public:
        static constexpr size_t maximum_size = 128;

        using const_iterator = std::vector<glm::mat4>::const_iterator;

        /// @brief Empty deformer
        Deformer();

        /// @param matrices Source buffer
        /// @param clone Copy the buffer if true, otherwise share it with the caller
        /// @throws InvalidArgumentError Null buffer
        /// @throws CapacityExceededError More than maximum_size matrices
        static Deformer create(std::shared_ptr<const std::vector<glm::mat4>> matrices, bool clone);

        /// @brief Take ownership of a buffer
        static Deformer create(std::vector<glm::mat4> matrices);

        size_t size() const { return m_matrices->size(); }
        bool empty() const { return m_matrices->empty(); }

        const glm::mat4& operator[](size_t index) const { return (*m_matrices)[index]; }

        /// @throws InvalidArgumentError
        const glm::mat4& at(size_t index) const;

        const_iterator begin() const { return m_matrices->begin(); }
        const_iterator end() const { return m_matrices->end(); }
        const glm::mat4* data() const { return m_matrices->data(); }

    private:
        explicit Deformer(std::shared_ptr<const std::vector<glm::mat4>> matrices);

        std::shared_ptr<const std::vector<glm::mat4>> m_matrices;
    };
}
