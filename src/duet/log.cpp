#include "duet/log.hpp"

#include <atomic>

namespace duet::log {

    namespace {
        std::atomic<Level> g_level{Level::Warn};
    }

    void set_level(Level level) { g_level.store(level); }

    Level level() { return g_level.load(); }

} // namespace duet::log
