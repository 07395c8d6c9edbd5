#pragma once

#include <datapod/datapod.hpp>

namespace duet {

    enum class Action : dp::u8 { Move, Copy, Delete };

    inline constexpr dp::usize ACTION_COUNT = 3;

    inline const char *action_name(Action a) {
        switch (a) {
        case Action::Move:
            return "move";
        case Action::Copy:
            return "copy";
        case Action::Delete:
            return "delete";
        default:
            return "?";
        }
    }

} // namespace duet
