// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
    std::string format_string(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int length = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (length <= 0)
            return {};

        std::string buffer(static_cast<size_t>(length), '\0');
        vsnprintf(buffer.data(), static_cast<size_t>(length) + 1, fmt, args);
        return buffer;
    }

    std::string relative_time_string()
    {
        using namespace std::chrono;
        static auto start = steady_clock::now();
        auto now = steady_clock::now();
        auto elapsed = duration_cast<milliseconds>(now - start);

        int seconds = static_cast<int>(elapsed.count() / 1000);
        int millis = static_cast<int>(elapsed.count() % 1000);

        std::ostringstream oss;
        oss << "[+" << seconds << '.' << std::setw(3) << std::setfill('0') << millis << ']';
        return oss.str();
    }
}

namespace rigtime
{
    LogManager::LogManager(std::ostream* sink)
        : m_sink(sink)
    {
    }

    LogManager::LogManager()
        : LogManager(&std::clog)
    {
    }

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string message = format_string(fmt, args);
        va_end(args);

        std::string line = relative_time_string() + " " + message;
        if (m_sink)
            *m_sink << line << '\n';
        m_lines.push_back(std::move(line));
    }

    void LogManager::clear()
    {
        m_lines.clear();
    }

    size_t LogManager::count_containing(const std::string& text) const
    {
        return static_cast<size_t>(std::count_if(m_lines.begin(), m_lines.end(),
            [&text](const std::string& line)
            {
                return line.find(text) != std::string::npos;
            }));
    }
}
