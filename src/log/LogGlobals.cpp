// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogGlobals.hpp"
#include <cstdarg>
#include <string>
#include <cstdio>

namespace
{
    std::weak_ptr<rigtime::ILogManager> g_logger;

    std::string vformat(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (len <= 0)
            return {};

        std::string result(static_cast<size_t>(len) + 1, '\0');
        vsnprintf(&result[0], static_cast<size_t>(len) + 1, fmt, args);
        result.resize(static_cast<size_t>(len));
        return result;
    }
}

namespace rigtime::LogGlobals
{
    void set_logger(std::weak_ptr<ILogManager> logger)
    {
        g_logger = std::move(logger);
    }

    void log(const char* fmt, ...)
    {
        if (auto logger = g_logger.lock())
        {
            va_list args;
            va_start(args, fmt);
            std::string msg = vformat(fmt, args);
            va_end(args);
            logger->log("%s", msg.c_str());
        }
    }

    void clear()
    {
        if (auto logger = g_logger.lock())
        {
            logger->clear();
        }
    }

    std::shared_ptr<ILogManager> try_get()
    {
        return g_logger.lock();
    }
}
