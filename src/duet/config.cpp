#include "duet/config.hpp"

namespace duet {

    TransferOptions Config::transfer_options() const {
        TransferOptions o;
        o.buffer_size = static_cast<dp::usize>(buffer_kib) * 1024;
        o.overwrite = !no_clobber;
        return o;
    }

    log::Level Config::log_level() const {
        if (quiet)
            return log::Level::Error;
        if (verbose)
            return log::Level::Debug;
        return log::Level::Warn;
    }

    Status Config::validate() const {
        if (buffer_kib < 1 || buffer_kib > 64 * 1024)
            return fail(ErrorKind::Unsupported, "--buffer-kib must be between 1 and 65536");
        if (verbose && quiet)
            return fail(ErrorKind::Unsupported, "--verbose and --quiet are mutually exclusive");
        bool s3 = bucket_dir.empty() && !bucket_name.empty();
        if (!bucket_prefix.empty() && bucket_dir.empty() && bucket_name.empty())
            return fail(ErrorKind::Unsupported, "--prefix needs --bucket or --bucket-dir");
        if (!s3 && (!s3_region.empty() || !s3_endpoint.empty()))
            return fail(ErrorKind::Unsupported, "--region and --endpoint need --bucket without --bucket-dir");
        return ok();
    }

} // namespace duet
