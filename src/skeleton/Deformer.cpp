// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "skeleton/Deformer.hpp"

#include <string>

#include "Errors.hpp"

namespace rigtime
{
    namespace
    {
        void check_capacity(size_t size)
        {
            if (size > Deformer::maximum_size)
                throw CapacityExceededError("Deformer: " + std::to_string(size)
                    + " matrices exceed the maximum of " + std::to_string(Deformer::maximum_size));
        }
    }

    Deformer::Deformer()
        : m_matrices(std::make_shared<const std::vector<glm::mat4>>())
    {
    }

    Deformer::Deformer(std::shared_ptr<const std::vector<glm::mat4>> matrices)
        : m_matrices(std::move(matrices))
    {
    }

    Deformer Deformer::create(std::shared_ptr<const std::vector<glm::mat4>> matrices, bool clone)
    {
        if (!matrices)
            throw InvalidArgumentError("Deformer: null matrix buffer");
        check_capacity(matrices->size());

        if (clone)
            return Deformer(std::make_shared<const std::vector<glm::mat4>>(*matrices));
        return Deformer(std::move(matrices));
    }

    Deformer Deformer::create(std::vector<glm::mat4> matrices)
    {
        check_capacity(matrices.size());
        return Deformer(std::make_shared<const std::vector<glm::mat4>>(std::move(matrices)));
    }

    const glm::mat4& Deformer::at(size_t index) const
    {
        if (index >= m_matrices->size())
            throw InvalidArgumentError("Deformer: index " + std::to_string(index)
                + " out of range for size " + std::to_string(m_matrices->size()));
        return (*m_matrices)[index];
    }
}
