#pragma once

#include "duet/batch.hpp"
#include "duet/config.hpp"
#include "duet/session.hpp"

#include <datapod/datapod.hpp>

namespace duet {

    // Renders the BatchResult of one commit as status text: a summary line followed by one line
    // per failed task
    dp::Vector<dp::String> summarize(const BatchResult &result);

    // Interactive two-pane loop on the terminal. Returns once the user quits.
    dp::Result<bool, dp::String> run_view(Session &session, const Config &config);

} // namespace duet
