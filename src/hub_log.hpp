/*
 * File: src/hub_log.hpp
 * Project: Home Hub
 * Purpose: spdlog setup
 * Last updated: 2026-10-18
 */

#pragma once
#include <string>
#include <spdlog/spdlog.h>

inline void init_logging(const std::string &level)
{
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off")
    {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("unknown log level '{}', using info", level);
        return;
    }
    spdlog::set_level(lvl);
}
