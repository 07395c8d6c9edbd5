#pragma once

#include "duet/log.hpp"
#include "duet/transfer.hpp"

#include <datapod/datapod.hpp>

#include <string>

namespace duet {

    // =============================================================================================
    // Config - everything the command line can set
    // =============================================================================================

    struct Config {
        // Panes
        std::string left_path;  // empty = current directory
        std::string right_path; // empty = current directory
        std::string bucket_dir;  // non-empty: right pane is a bucket backed by this directory
        std::string bucket_name; // without bucket_dir: an S3 bucket
        std::string bucket_prefix;
        std::string s3_region;
        std::string s3_endpoint;

        // Display
        bool show_hidden = false;
        bool alt_screen = false;
        bool show_size = false;
        bool use_ansi = true;

        // Transfers
        int buffer_kib = 64;
        bool no_clobber = false;

        // Logging
        bool verbose = false;
        bool quiet = false;

        TransferOptions transfer_options() const;
        log::Level log_level() const;

        // Rejects contradictory or out-of-range values
        Status validate() const;
    };

} // namespace duet
