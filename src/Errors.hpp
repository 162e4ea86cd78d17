// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <stdexcept>

namespace rigtime
{
    /// @brief Null, negative or otherwise out-of-range input.
    struct InvalidArgumentError : std::invalid_argument { using std::invalid_argument::invalid_argument; };

    /// @brief Unknown channel, layer, marker or node identifier.
    struct NotFoundError : std::out_of_range { using std::out_of_range::out_of_range; };

    /// @brief Requested value type does not match the stored type.
    struct TypeMismatchError : std::runtime_error { using std::runtime_error::runtime_error; };

    /// @brief Two channels, layers or markers share an identifier.
    struct DuplicateKeyError : std::invalid_argument { using std::invalid_argument::invalid_argument; };

    /// @brief Two keyframes of one channel share a position.
    struct DuplicateKeyframeError : DuplicateKeyError { using DuplicateKeyError::DuplicateKeyError; };

    struct CapacityExceededError : std::length_error { using std::length_error::length_error; };

    /// @brief Structural mutation of a read-only object.
    struct ReadOnlyError : std::logic_error { using std::logic_error::logic_error; };

    /// @brief Malformed serialized document.
    struct FormatError : std::runtime_error { using std::runtime_error::runtime_error; };
}
