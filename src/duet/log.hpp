#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <utility>

namespace duet::log {

    // Process-wide threshold in front of echo. The terminal view switches it to Off while the
    // screen is in raw mode.
    enum class Level : dp::u8 { Trace, Debug, Info, Warn, Error, Off };

    void set_level(Level level);
    Level level();

    inline bool enabled(Level l) { return l >= level() && level() != Level::Off; }

    template <typename... Args> void trace(Args &&...args) {
        if (enabled(Level::Trace))
            echo::trace(std::forward<Args>(args)...);
    }

    template <typename... Args> void debug(Args &&...args) {
        if (enabled(Level::Debug))
            echo::debug(std::forward<Args>(args)...);
    }

    template <typename... Args> void info(Args &&...args) {
        if (enabled(Level::Info))
            echo::info(std::forward<Args>(args)...);
    }

    template <typename... Args> void warn(Args &&...args) {
        if (enabled(Level::Warn))
            echo::warn(std::forward<Args>(args)...);
    }

    template <typename... Args> void error(Args &&...args) {
        if (enabled(Level::Error))
            echo::error(std::forward<Args>(args)...);
    }

} // namespace duet::log
