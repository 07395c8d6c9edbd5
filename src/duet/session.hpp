#pragma once

#include "duet/config.hpp"
#include "duet/pane.hpp"

#include <memory>

namespace duet {

    // The two panes of one run, each bound to a ready-to-use provider
    struct Session {
        std::unique_ptr<Pane> left;
        std::unique_ptr<Pane> right;
    };

    // Builds providers and panes from the command line. Both local panes share one LocalProvider.
    Result<Session> open_session(const Config &config);

} // namespace duet
