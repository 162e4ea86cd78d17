// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace rigtime
{
    /// @brief Buffers formatted log lines and echoes them to a stream sink.
    class LogManager : public ILogManager
    {
    public:
        /// @param sink Stream each line is echoed to, or nullptr to only buffer.
        explicit LogManager(std::ostream* sink);
        LogManager();
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        const std::vector<std::string>& lines() const { return m_lines; }

        /// @brief Number of buffered lines containing text.
        size_t count_containing(const std::string& text) const;

    private:
        std::ostream* m_sink = nullptr;
        std::vector<std::string> m_lines;
    };
}
