#pragma once

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace layerkit {

    // Library-wide logger named "layerkit". Levels follow SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=layerkit=debug).
    // A host that registered its own "layerkit" logger before first use keeps it.
    inline std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get("layerkit")) {
                return existing;
            }
            spdlog::cfg::load_env_levels();
            return spdlog::stdout_color_mt("layerkit");
        }();
        return instance;
    }

} // namespace layerkit
