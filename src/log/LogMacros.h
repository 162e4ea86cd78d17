// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "LogGlobals.hpp"

#define RIGTIME_LOG(...)        ::rigtime::LogGlobals::log(__VA_ARGS__)
#define RIGTIME_LOG_INFO(...)   ::rigtime::LogGlobals::log("[INFO] " __VA_ARGS__)
#define RIGTIME_LOG_WARN(...)   ::rigtime::LogGlobals::log("[WARN] " __VA_ARGS__)
#define RIGTIME_LOG_ERROR(...)  ::rigtime::LogGlobals::log("[ERROR] " __VA_ARGS__)
