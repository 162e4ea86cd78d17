// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include "ILogManager.hpp"

namespace rigtime::LogGlobals
{
    /// Sets the global logger (typically once, by the host application)
    void set_logger(std::weak_ptr<ILogManager> logger);

    /// Logs a formatted message using the global logger, if available
    void log(const char* fmt, ...);

    /// Clears the log if logger is available
    void clear();

    /// Active logger, kept alive by the returned pointer (empty if not available)
    std::shared_ptr<ILogManager> try_get();
}
